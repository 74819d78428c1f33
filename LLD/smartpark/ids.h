#ifndef SMARTPARK_IDS_H
#define SMARTPARK_IDS_H

#include <string>

namespace smartpark {

// Random (v4) UUID in canonical text form, used for occupants,
// transactions and slots added after provisioning.
std::string newUUID();

} // namespace smartpark

#endif // SMARTPARK_IDS_H
