#include "parking/uuid.h"

#include <uuid/uuid.h>

using namespace std;

namespace parking {

string newUUID() {
  uuid_t u;
  uuid_generate(u);
  char buf[37];
  uuid_unparse(u, buf);
  return string{buf};
}

} // namespace parking
