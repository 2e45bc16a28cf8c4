#pragma once

#include <string>

namespace tokenguard::core {

/// @brief Random UUID echoed as X-Request-Id and carried in error envelopes and request logs.
std::string GenerateRequestId();

}  // namespace tokenguard::core
