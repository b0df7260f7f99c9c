#pragma once

#include <string>

namespace framesync::common {

std::string version();

}  // namespace framesync::common
