#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "support/jwt_fixtures.h"
#include "tokenguard/auth/jwks_cache.h"
#include "tokenguard/http/http_client.h"

namespace {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using tokenguard::core::Context;
using tokenguard::core::ErrorCode;
namespace fixtures = tokenguard::testing;

using StubRequest = http::request<http::string_body>;
using StubResponse = http::response<http::string_body>;

/// @brief One-connection-at-a-time HTTP server on a loopback port.
class StubServer {
public:
    using Handler = std::function<StubResponse(const StubRequest&)>;

    explicit StubServer(Handler handler)
        : acceptor_(ioc_, {net::ip::make_address("127.0.0.1"), 0}),
          endpoint_(acceptor_.local_endpoint()),
          handler_(std::move(handler)),
          thread_([this]() { Serve(); }) {}

    ~StubServer() {
        stopping_ = true;
        // A throwaway connection unblocks the pending accept().
        net::io_context wake;
        tcp::socket socket(wake);
        beast::error_code ec;
        socket.connect(endpoint_, ec);
        thread_.join();
    }

    StubServer(const StubServer&) = delete;
    StubServer& operator=(const StubServer&) = delete;

    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(endpoint_.port());
    }

    int requests() const { return requests_.load(); }
    std::string last_target() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_target_;
    }

private:
    void Serve() {
        while (!stopping_) {
            tcp::socket socket(ioc_);
            beast::error_code ec;
            acceptor_.accept(socket, ec);
            if (stopping_) {
                return;
            }
            if (ec) {
                continue;
            }

            beast::flat_buffer buffer;
            StubRequest request;
            http::read(socket, buffer, request, ec);
            if (ec) {
                continue;
            }
            ++requests_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_target_ = std::string(request.target());
            }

            auto response = handler_(request);
            response.version(request.version());
            response.keep_alive(false);
            response.prepare_payload();
            // The client may have given up already; write errors are expected then.
            http::write(socket, response, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    tcp::endpoint endpoint_;
    Handler handler_;
    std::atomic<bool> stopping_{false};
    std::atomic<int> requests_{0};
    mutable std::mutex mutex_;
    std::string last_target_;
    std::thread thread_;
};

StubServer::Handler Respond(http::status status, const std::string& body,
                            std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    return [status, body, delay](const StubRequest&) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        StubResponse response{status, 11};
        response.set(http::field::content_type, "application/json");
        response.body() = body;
        return response;
    };
}

unsigned short FindFreePort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, {tcp::v4(), 0});
    return acceptor.local_endpoint().port();
}

std::chrono::milliseconds Since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

TEST(JwksHttp, ClientReturnsStatusAndBody) {
    StubServer server(Respond(http::status::ok, "{\"hello\":1}"));
    tokenguard::http::PocoHttpClient client(server.base_url(), std::chrono::milliseconds(2000));

    auto response = client.Get(Context::Background(), "/.well-known/jwks.json");
    ASSERT_TRUE(response.ok()) << response.error().message;
    EXPECT_EQ(response.value().status, 200);
    EXPECT_EQ(response.value().body, "{\"hello\":1}");
    EXPECT_EQ(server.last_target(), "/.well-known/jwks.json");
}

TEST(JwksHttp, CacheFetchesOverHttp) {
    StubServer server(
        Respond(http::status::ok, fixtures::BuildJwks("http-key", fixtures::PrimaryKey())));
    auto client = std::make_shared<tokenguard::http::PocoHttpClient>(
        server.base_url() + "/", std::chrono::milliseconds(2000));
    tokenguard::auth::JwksCache cache(client);

    auto fetched = cache.Fetch(Context::Background());
    ASSERT_TRUE(fetched.ok()) << fetched.error().message;
    EXPECT_TRUE(cache.Lookup("http-key").has_value());
    EXPECT_EQ(server.last_target(), "/.well-known/jwks.json");
}

TEST(JwksHttp, NotFoundIsFetchFailure) {
    StubServer server(Respond(http::status::not_found, "{}"));
    auto client = std::make_shared<tokenguard::http::PocoHttpClient>(
        server.base_url(), std::chrono::milliseconds(2000));
    tokenguard::auth::JwksCache cache(client);

    auto fetched = cache.Fetch(Context::Background());
    ASSERT_FALSE(fetched.ok());
    EXPECT_EQ(fetched.error().code, ErrorCode::kUnavailable);
    EXPECT_EQ(fetched.error().message, "JWKS fetch: expected 200, got 404");
}

TEST(JwksHttp, ConnectionRefusedIsUnavailable) {
    tokenguard::http::PocoHttpClient client(
        "http://127.0.0.1:" + std::to_string(FindFreePort()), std::chrono::milliseconds(1000));
    auto response = client.Get(Context::Background(), "/.well-known/jwks.json");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.error().code, ErrorCode::kUnavailable);
}

TEST(JwksHttp, CancelledContextSkipsRequest) {
    StubServer server(Respond(http::status::ok, "{}"));
    tokenguard::http::PocoHttpClient client(server.base_url(), std::chrono::milliseconds(2000));
    auto ctx = Context::Background();
    ctx.Cancel();

    auto response = client.Get(ctx, "/.well-known/jwks.json");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.error().code, ErrorCode::kCancelled);
    EXPECT_EQ(server.requests(), 0);
}

TEST(JwksHttp, DeadlineBoundsSlowServer) {
    StubServer server(Respond(http::status::ok, "{}", std::chrono::milliseconds(1500)));
    tokenguard::http::PocoHttpClient client(server.base_url(), std::chrono::milliseconds(5000));

    const auto start = std::chrono::steady_clock::now();
    auto response =
        client.Get(Context::WithTimeout(std::chrono::milliseconds(200)), "/.well-known/jwks.json");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.error().code, ErrorCode::kCancelled);
    EXPECT_LT(Since(start).count(), 1200);
}

TEST(JwksHttp, CancelAbortsInFlightRequest) {
    StubServer server(Respond(http::status::ok, "{}", std::chrono::milliseconds(1500)));
    tokenguard::http::PocoHttpClient client(server.base_url(), std::chrono::milliseconds(5000));
    auto ctx = Context::Background();

    std::thread canceller([ctx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        ctx.Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    auto response = client.Get(ctx, "/.well-known/jwks.json");
    const auto elapsed = Since(start);
    canceller.join();

    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.error().code, ErrorCode::kCancelled);
    EXPECT_LT(elapsed.count(), 1200);
}

TEST(JwksHttp, FailedRefreshKeepsServingOldKeys) {
    std::atomic<bool> healthy{true};
    const auto body = fixtures::BuildJwks("http-key", fixtures::PrimaryKey());
    StubServer server([&healthy, body](const StubRequest&) {
        StubResponse response{healthy ? http::status::ok : http::status::bad_gateway, 11};
        response.body() = healthy ? body : "upstream down";
        return response;
    });
    auto client = std::make_shared<tokenguard::http::PocoHttpClient>(
        server.base_url(), std::chrono::milliseconds(2000));
    tokenguard::auth::JwksCache cache(client);

    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());
    healthy = false;
    EXPECT_FALSE(cache.Fetch(Context::Background()).ok());
    EXPECT_TRUE(cache.Lookup("http-key").has_value());
    EXPECT_EQ(server.requests(), 2);
}
