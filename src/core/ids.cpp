#include "tokenguard/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace tokenguard::core {

std::string GenerateRequestId() {
    // Random (version 4) ids: time-based ones would leak the host's MAC address.
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

}  // namespace tokenguard::core
