#pragma once

#include <string>

namespace parking {

// random (version 4) UUID in its 36-char textual form
std::string newUUID();

} // namespace parking
