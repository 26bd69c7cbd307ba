#include "pathgate/http/http_server.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "pathgate/core/ids.h"
#include "pathgate/core/logger.h"
#include "pathgate/http/responses.h"
#include "pathgate/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr auto kReadTimeout = std::chrono::seconds(30);

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, std::shared_ptr<const pathgate::http::Router> router,
            std::uint64_t body_limit)
        : stream_(std::move(stream)), router_(std::move(router)), body_limit_(body_limit) {}

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
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
            pathgate::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoRead();
    }

    void DoRead() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        beast::get_lowest_layer(stream_).expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnRead, this->shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        request_id_ = pathgate::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        if (ec == http::error::body_limit) {
            request_method_ = std::string(parser_->get().method_string());
            request_target_ = std::string(parser_->get().target());
            request_remote_ = GetRemoteAddress();
            keep_alive_ = false;
            return Send(pathgate::http::JsonError(parser_->get().version(), "BODY_TOO_LARGE",
                                                  "request body exceeds limit", request_id_,
                                                  http::status::payload_too_large));
        }
        if (ec) {
            pathgate::core::LogError("Read request failed: " + ec.message());
            return;
        }
        HandleRequest(parser_->release());
    }

    void HandleRequest(pathgate::http::HttpRequest request) {
        request_method_ = std::string(request.method_string());
        request_target_ = std::string(request.target());
        request_remote_ = GetRemoteAddress();
        keep_alive_ = request.keep_alive();

        pathgate::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = request_method_;
        ctx.target = request_target_;
        ctx.remote = request_remote_;

        std::optional<pathgate::core::Result<pathgate::http::HttpResponse>> result;
        try {
            result.emplace(router_->Route(ctx, request));
        } catch (const std::exception& ex) {
            pathgate::core::LogError("Handler failed for " + request_target_ + ": " + ex.what());
            return Send(pathgate::http::JsonError(request.version(), "INTERNAL",
                                                  "internal server error", request_id_,
                                                  http::status::internal_server_error));
        }
        if (!result->ok()) {
            return Send(pathgate::http::JsonError(request.version(), "INTERNAL",
                                                  result->error().message, request_id_,
                                                  http::status::internal_server_error));
        }
        Send(std::move(result->value()));
    }

    void Send(pathgate::http::HttpResponse&& response) {
        response.set(http::field::server, "PathGate");
        response.set("X-Request-Id", request_id_);
        response.keep_alive(keep_alive_);
        response.prepare_payload();
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        pathgate::core::LogRequest(request_id_, request_method_, request_target_, request_remote_,
                                   response.result_int(), latency);
        pathgate::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<pathgate::http::HttpResponse>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite, this->shared_from_this(),
                                                    sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<pathgate::http::HttpResponse>, beast::error_code ec,
                 std::size_t) {
        if (ec) {
            pathgate::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoRead();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
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
    std::shared_ptr<const pathgate::http::Router> router_;
    std::uint64_t body_limit_{0};

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    bool keep_alive_{true};
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<const pathgate::http::Router> router, std::uint64_t body_limit,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc), router_(std::move(router)), body_limit_(body_limit), ssl_ctx_(ssl_ctx) {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            pathgate::core::LogError("Accept failed: " + ec.message());
        } else if (ssl_ctx_) {
            auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
            std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(std::move(stream),
                                                                            router_, body_limit_)
                ->Start();
        } else {
            auto stream = beast::tcp_stream(std::move(socket));
            std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, body_limit_)
                ->Start();
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    std::shared_ptr<const pathgate::http::Router> router_;
    std::uint64_t body_limit_{0};
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace pathgate::http {

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
    core::LogInfo("PathGate listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port));
}

}  // namespace pathgate::http
