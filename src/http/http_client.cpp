#include "tokenguard/http/http_client.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <utility>

#include <Poco/Exception.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Net/RejectCertificateHandler.h>
#include <Poco/Net/SSLManager.h>
#include <Poco/StreamCopier.h>
#include <Poco/Timespan.h>
#include <Poco/URI.h>

#include "tokenguard/core/logger.h"

namespace tokenguard::http {

namespace {

std::string JoinUrl(const std::string& base, const std::string& path) {
    if (path.empty()) {
        return base;
    }
    if (!base.empty() && base.back() == '/' && path.front() == '/') {
        return base + path.substr(1);
    }
    if (!base.empty() && base.back() != '/' && path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}

void InitializeSslOnce() {
    static std::once_flag ssl_once;
    std::call_once(ssl_once, []() {
        Poco::Net::initializeSSL();
        Poco::Net::Context::Ptr context =
            new Poco::Net::Context(Poco::Net::Context::CLIENT_USE, "", "", "",
                                   Poco::Net::Context::VERIFY_STRICT);
        Poco::SharedPtr<Poco::Net::InvalidCertificateHandler> handler(
            new Poco::Net::RejectCertificateHandler(false));
        Poco::Net::SSLManager::instance().initializeClient(nullptr, handler, context);
    });
}

}  // namespace

PocoHttpClient::PocoHttpClient(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

core::Result<FetchResponse> PocoHttpClient::Get(const core::Context& ctx,
                                                const std::string& path) {
    auto live = ctx.Check();
    if (!live.ok()) {
        return live.error();
    }
    if (base_url_.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "base url missing"};
    }

    const auto url = JoinUrl(base_url_, path);

    // Parse file URLs manually first to avoid platform-specific URI parser edge cases.
    if (url.rfind("file://", 0) == 0) {
        return ReadFile(url.substr(7));
    }
    if (url.front() == '/') {
        return ReadFile(url);
    }

    try {
        Poco::URI uri(url);
        const auto scheme = uri.getScheme();
        if (scheme != "http" && scheme != "https") {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "unsupported url scheme: " + scheme};
        }
        const bool is_https = scheme == "https";
        const std::string host = uri.getHost();
        const std::string target = uri.getPathEtc().empty() ? "/" : uri.getPathEtc();
        const auto port = uri.getPort() > 0 ? uri.getPort() : (is_https ? 443 : 80);

        std::unique_ptr<Poco::Net::HTTPClientSession> session;
        if (is_https) {
            InitializeSslOnce();
            session = std::make_unique<Poco::Net::HTTPSClientSession>(host, port);
        } else {
            session = std::make_unique<Poco::Net::HTTPClientSession>(host, port);
        }

        // The effective timeout is the tighter of the client's and the context's.
        auto timeout = timeout_;
        if (auto remaining = ctx.Remaining()) {
            if (remaining->count() <= 0) {
                return core::Error{core::ErrorCode::kCancelled, "context deadline exceeded"};
            }
            timeout = std::min(timeout, *remaining);
        }
        session->setTimeout(Poco::Timespan(static_cast<Poco::Timespan::TimeDiff>(timeout.count()) *
                                           Poco::Timespan::MILLISECONDS));

        // Declared after the session so it unregisters before the session goes away.
        auto* raw_session = session.get();
        auto registration = ctx.OnCancel([raw_session]() { raw_session->abort(); });

        Poco::Net::HTTPRequest req(Poco::Net::HTTPRequest::HTTP_GET, target,
                                   Poco::Net::HTTPMessage::HTTP_1_1);
        req.set("Host", host);
        req.set("User-Agent", "tokenguard-jwks-client");
        session->sendRequest(req);

        Poco::Net::HTTPResponse res;
        std::istream& rs = session->receiveResponse(res);
        FetchResponse response;
        response.status = static_cast<int>(res.getStatus());
        Poco::StreamCopier::copyToString(rs, response.body);

        auto after = ctx.Check();
        if (!after.ok()) {
            return after.error();
        }
        return response;
    } catch (const Poco::Exception& ex) {
        auto cancelled = ctx.Check();
        if (!cancelled.ok()) {
            return cancelled.error();
        }
        core::LogDebug("GET " + url + " failed: " + ex.displayText());
        return core::Error{core::ErrorCode::kUnavailable, "GET " + url + ": " + ex.displayText()};
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kUnavailable, "GET " + url + ": " + ex.what()};
    }
}

core::Result<FetchResponse> PocoHttpClient::ReadFile(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return FetchResponse{404, ""};
    }
    FetchResponse response;
    response.status = 200;
    response.body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::Error{core::ErrorCode::kIoError, "failed to read " + path};
    }
    return response;
}

}  // namespace tokenguard::http
