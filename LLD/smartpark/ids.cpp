#include "smartpark/ids.h"

#include <uuid/uuid.h>

using namespace std;

namespace smartpark {

string newUUID() {
  uuid_t u; uuid_generate(u);
  char buf[37]; uuid_unparse_lower(u, buf);
  return string{buf};
}

} // namespace smartpark
