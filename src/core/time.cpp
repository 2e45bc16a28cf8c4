#include "tokenguard/core/time.h"

#include <Poco/Timestamp.h>

namespace tokenguard::core {

std::int64_t NowEpochSeconds() {
    return static_cast<std::int64_t>(Poco::Timestamp().epochTime());
}

}  // namespace tokenguard::core
