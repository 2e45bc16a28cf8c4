#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "tokenguard/core/config.h"
#include "tokenguard/http/router.h"

namespace tokenguard::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context).
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router);
    /// @brief Binds and starts accepting; throws boost::system::system_error if binding fails.
    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    std::shared_ptr<const Router> router_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

}  // namespace tokenguard::http
