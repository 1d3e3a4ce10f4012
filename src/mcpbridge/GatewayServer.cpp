//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpbridge/GatewayServer.cpp
// Purpose: HTTP/HTTPS gateway listener using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpbridge/GatewayServer.hpp"
#include "mcpbridge/errors/Errors.h"

#include <openssl/ssl.h>

namespace mcpbridge {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

GatewayRequest toGatewayRequest(const http::request<http::string_body>& req) {
    GatewayRequest g;
    g.verb = std::string(req.method_string());
    g.target = std::string(req.target());
    for (const auto& field : req) {
        g.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    g.body = req.body();
    return g;
}

http::response<http::string_body> toBeastResponse(const GatewayResponse& g, unsigned int version) {
    http::response<http::string_body> res{static_cast<http::status>(g.status), version};
    for (const auto& [name, value] : g.headers) {
        res.set(name, value);
    }
    res.keep_alive(false);
    res.body() = g.body;
    res.prepare_payload();
    return res;
}

} // namespace

class GatewayServer::Impl {
public:
    GatewayServer::Options opts;
    Gateway& gateway;
    ProxyRuntimeState& state;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;
    net::thread_pool workers;

    GatewayServer::PortChangedCallback portChanged;
    GatewayServer::ErrorHandler errorHandler;

    Impl(const GatewayServer::Options& o, Gateway& g, ProxyRuntimeState& s)
        : opts(o), gateway(g), state(s), workers(std::max(1u, o.workerThreads)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("GatewayServer: failed to load certificate/key: {}", e.what());
                throw errors::BridgeError(errors::ErrorKind::Io,
                                          fmt::format("Failed to load TLS certificate/key: {}", e.what()));
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        workers.join();
    }

    void setError(const std::string& msg) {
        LOG_WARN("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void reportSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
            LOG_DEBUG("GatewayServer {} session suppressed during shutdown: {}", kind, e.what());
#endif
            return;
        }
        setError(fmt::format("GatewayServer {} session error: {}", kind, e.what()));
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort = acceptor->local_endpoint().port();
    }

    // Runs the blocking dispatch on the worker pool; the I/O thread only waits on a timer
    net::awaitable<GatewayResponse> dispatch(GatewayRequest req) {
        auto exec = co_await net::this_coro::executor;
        net::steady_timer done(exec, net::steady_timer::time_point::max());
        GatewayResponse out;
        net::post(workers, [this, &req, &out, &done, exec]() {
            try {
                out = gateway.Handle(req);
            } catch (const std::exception& e) {
                LOG_ERROR("GatewayServer: dispatch failed: {}", e.what());
                out = GatewayResponse{};
                out.status = 500;
                out.headers.emplace_back("Content-Type", "text/plain");
                out.body = "Internal Server Error";
            }
            net::post(exec, [&done]() { done.cancel(); });
        });
        boost::system::error_code ec;
        co_await done.async_wait(net::redirect_error(net::use_awaitable, ec));
        co_return out;
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        auto req = parser.release();
        auto response = co_await dispatch(toGatewayRequest(req));
        auto res = toBeastResponse(response, req.version());
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            stream.expires_after(std::chrono::seconds(30));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            if (e.code() != http::error::end_of_stream) {
                reportSessionError("plain", e);
            }
        } catch (const std::exception& e) {
            reportSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const boost::system::system_error& e) {
            if (e.code() != http::error::end_of_stream) {
                reportSessionError("TLS", e);
            }
        } catch (const std::exception& e) {
            reportSessionError("TLS", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (e.g., operation_aborted when acceptor is closed); log at DEBUG only in debug builds
                #ifdef _DEBUG
                LOG_DEBUG("GatewayServer accept suppressed during shutdown: {}", e.what());
                #endif
            } else {
                setError(std::string("GatewayServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

GatewayServer::GatewayServer(const Options& opts, Gateway& gateway, ProxyRuntimeState& state)
    : pImpl(std::make_unique<Impl>(opts, gateway, state)) {}

GatewayServer::~GatewayServer() {
    Stop().get();
}

std::future<void> GatewayServer::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running.load() || pImpl->ioThread.joinable()) {
        ready.set_exception(std::make_exception_ptr(
            errors::BridgeError(errors::ErrorKind::Io, "GatewayServer already started")));
        return fut;
    }
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("GatewayServer: bind {}:{} failed: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::make_exception_ptr(errors::BridgeError(
            errors::ErrorKind::Io,
            fmt::format("Failed to bind {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what()))));
        return fut;
    }

    const uint16_t port = pImpl->boundPort.load();
    pImpl->running.store(true);
    pImpl->state.SetRunning(port);
    LOG_INFO("Gateway listening on {}://{}:{}/mcp/{{backendId}}", pImpl->opts.scheme, pImpl->opts.address, port);
    if (pImpl->portChanged) {
        pImpl->portChanged(port);
    }

    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("GatewayServer I/O loop error: ") + e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> GatewayServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    if (!pImpl->running.exchange(false)) {
        done.set_value();
        return fut;
    }
    net::post(pImpl->ioc, [this]() {
        if (pImpl->acceptor) {
            boost::system::error_code ec;
            pImpl->acceptor->close(ec);
        }
    });
    // In-flight dispatches finish and post their completions while the I/O loop still runs
    pImpl->workers.join();
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    pImpl->state.SetStopped();
    LOG_INFO("Gateway stopped");
    done.set_value();
    return fut;
}

uint16_t GatewayServer::GetPort() const {
    return pImpl->boundPort.load();
}

void GatewayServer::SetPortChangedCallback(PortChangedCallback cb) {
    pImpl->portChanged = std::move(cb);
}

void GatewayServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcpbridge
