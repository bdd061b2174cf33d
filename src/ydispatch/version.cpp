#include "version.hpp"

#ifndef YDISPATCH_VERSION
#error "YDISPATCH_VERSION must be defined by the build"
#endif

namespace ydispatch {

const std::string& version() {
    static const std::string text = YDISPATCH_VERSION;
    return text;
}

} // namespace ydispatch
