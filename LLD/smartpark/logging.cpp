#include "smartpark/logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace std;

namespace smartpark {

void initLogging(const string& level) {
  auto logger = spdlog::get("smartpark");
  if (!logger) logger = spdlog::stderr_color_mt("smartpark");
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") {
    lvl = spdlog::level::info;
    logger->warn("unknown log level '{}', using info", level);
  }
  logger->set_level(lvl);
  spdlog::set_default_logger(logger);
}

} // namespace smartpark
