#ifndef SMARTPARK_LOGGING_H
#define SMARTPARK_LOGGING_H

#include <string>

namespace smartpark {

// Installs the "smartpark" logger on stderr as spdlog's default logger.
// level is one of trace, debug, info, warn, error, critical, off;
// anything else falls back to info.
void initLogging(const std::string& level);

} // namespace smartpark

#endif // SMARTPARK_LOGGING_H
