#pragma once

#include <string>

namespace ydispatch {

// Project version configured by the build
const std::string& version();

} // namespace ydispatch
