#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "pathgate/core/config.h"
#include "pathgate/http/router.h"

namespace pathgate::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context).
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router);
    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    std::shared_ptr<const Router> router_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

}  // namespace pathgate::http
