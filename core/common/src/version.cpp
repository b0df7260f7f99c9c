#include "framesync/common/version.hpp"

namespace framesync::common {

std::string version() {
#ifdef FRAMESYNC_VERSION
  return FRAMESYNC_VERSION;
#else
  return "0.0.0";
#endif
}

}  // namespace framesync::common
