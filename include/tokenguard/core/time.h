#pragma once

#include <cstdint>

namespace tokenguard::core {

/// @brief Returns the current UTC time as whole seconds since the Unix epoch.
std::int64_t NowEpochSeconds();

}  // namespace tokenguard::core
