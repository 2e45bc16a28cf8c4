#include "tokenguard/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Exception.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace tokenguard::core {

namespace {
constexpr const char* kLoggerName = "tokenguard";

Poco::Logger& TokenguardLogger() {
    return Poco::Logger::get(kLoggerName);
}

// Poco knows "information" and "warning"; operators often write the short forms.
std::string CanonicalLevel(const std::string& level) {
    if (level == "info") {
        return "information";
    }
    if (level == "warn") {
        return "warning";
    }
    return level;
}
}  // namespace

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ %s [%p] %t"));
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    auto& logger = TokenguardLogger();
    logger.setChannel(channel);
    try {
        logger.setLevel(Poco::Logger::parseLevel(CanonicalLevel(level)));
    } catch (const Poco::InvalidArgumentException&) {
        logger.setLevel(Poco::Message::PRIO_INFORMATION);
        logger.warning("unknown log level \"" + level + "\", using information");
    }
}

void LogInfo(const std::string& message) { TokenguardLogger().information(message); }
void LogWarning(const std::string& message) { TokenguardLogger().warning(message); }
void LogError(const std::string& message) { TokenguardLogger().error(message); }
void LogDebug(const std::string& message) { TokenguardLogger().debug(message); }

void LogRequest(const RequestLogEntry& entry) {
    auto& logger = TokenguardLogger();
    if (!logger.information()) {
        return;
    }
    Poco::JSON::Object line;
    line.set("event", "http_request");
    line.set("request_id", entry.request_id);
    line.set("method", entry.method);
    line.set("target", entry.target);
    line.set("remote", entry.remote);
    line.set("tls", entry.tls);
    line.set("status", entry.status);
    line.set("latency_ms", static_cast<Poco::Int64>(entry.latency_ms));
    if (!entry.reason.empty()) {
        line.set("reason", entry.reason);
    }
    std::ostringstream out;
    line.stringify(out);
    logger.information(out.str());
}

}  // namespace tokenguard::core
