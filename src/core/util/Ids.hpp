#pragma once
#include <string>

namespace skya {

// Random RFC 4122 version 4 id, lowercase hex with dashes.
std::string uuid4();

} // namespace skya
