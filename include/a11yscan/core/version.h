#pragma once

namespace a11yscan::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "1.0";

}  // namespace a11yscan::core
