#include "tokenguard/http/http_server.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "tokenguard/core/error.h"
#include "tokenguard/core/ids.h"
#include "tokenguard/core/logger.h"
#include "tokenguard/http/responses.h"
#include "tokenguard/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr auto kReadTimeout = std::chrono::seconds(30);

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
    static constexpr bool kTls = std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>;

public:
    Session(Stream&& stream, std::shared_ptr<const tokenguard::http::Router> router,
            std::uint64_t max_body_bytes)
        : stream_(std::move(stream)), router_(std::move(router)), max_body_bytes_(max_body_bytes) {}

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (kTls) {
            beast::get_lowest_layer(stream_).expires_after(kReadTimeout);
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoRead();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            tokenguard::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoRead();
    }

    void DoRead() {
        parser_.emplace();
        parser_->body_limit(max_body_bytes_);
        beast::get_lowest_layer(stream_).expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnRead, this->shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                tokenguard::core::LogError("Read request failed: " + ec.message());
            }
            return;
        }

        const auto request = parser_->release();
        ctx_ = tokenguard::http::RequestContext{};
        ctx_.request_id = tokenguard::core::GenerateRequestId();
        ctx_.method = std::string(request.method_string());
        ctx_.target = std::string(request.target());
        ctx_.remote = GetRemoteAddress();
        ctx_.tls = kTls;
        ctx_.received_at = std::chrono::steady_clock::now();

        // Handler errors are mapped to status codes here, in one place.
        tokenguard::core::Result<tokenguard::http::HttpResponse> result =
            tokenguard::core::Error{tokenguard::core::ErrorCode::kInternal, "internal error"};
        try {
            result = router_->Route(ctx_, request);
        } catch (const std::exception& ex) {
            tokenguard::core::LogError("Handler failed: " + std::string(ex.what()));
        }
        if (!result.ok()) {
            const auto& error = result.error();
            const std::string reason = error.detail != tokenguard::core::ErrorDetail::kNone
                                           ? tokenguard::core::ErrorDetailName(error.detail)
                                           : tokenguard::core::ErrorCodeName(error.code);
            return Send(tokenguard::http::ErrorResponse(request.version(), error, ctx_.request_id),
                        request.keep_alive(), reason);
        }
        Send(std::move(result.value()), request.keep_alive(), "");
    }

    void Send(tokenguard::http::HttpResponse&& response, bool keep_alive,
              const std::string& reason) {
        response.set(http::field::server, "tokenguard");
        response.set("X-Request-Id", ctx_.request_id);
        response.keep_alive(keep_alive);

        tokenguard::core::RequestLogEntry entry;
        entry.request_id = ctx_.request_id;
        entry.method = ctx_.method;
        entry.target = ctx_.target;
        entry.remote = ctx_.remote;
        entry.tls = ctx_.tls;
        entry.status = response.result_int();
        entry.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - ctx_.received_at)
                               .count();
        entry.reason = reason;
        tokenguard::core::LogRequest(entry);
        tokenguard::observability::RecordRequest(entry.status, entry.latency_ms);

        auto sp = std::make_shared<tokenguard::http::HttpResponse>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite, this->shared_from_this(),
                                                    sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<tokenguard::http::HttpResponse>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            tokenguard::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoRead();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (kTls) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<const tokenguard::http::Router> router_;
    std::uint64_t max_body_bytes_;

    tokenguard::http::RequestContext ctx_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<const tokenguard::http::Router> router,
             std::uint64_t max_body_bytes, net::ssl::context* ssl_ctx)
        : ioc_(ioc),
          acceptor_(ioc),
          router_(std::move(router)),
          max_body_bytes_(max_body_bytes),
          ssl_ctx_(ssl_ctx) {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            tokenguard::core::LogError("Accept failed: " + ec.message());
        } else if (ssl_ctx_) {
            auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
            std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                std::move(stream), router_, max_body_bytes_)
                ->Start();
        } else {
            auto stream = beast::tcp_stream(std::move(socket));
            std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_,
                                                         max_body_bytes_)
                ->Start();
        }
        DoAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<const tokenguard::http::Router> router_;
    std::uint64_t max_body_bytes_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace tokenguard::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router)
    : ioc_(ioc),
      config_(config),
      router_(std::make_shared<const Router>(std::move(router))) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_.server.limits.max_body_bytes,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
    core::LogInfo("listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port));
}

}  // namespace tokenguard::http
