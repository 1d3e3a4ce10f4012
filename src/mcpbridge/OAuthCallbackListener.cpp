//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpbridge/OAuthCallbackListener.cpp
// Purpose: One-shot OAuth redirect capture using Boost.Beast
//==========================================================================================================

#include <atomic>
#include <map>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpbridge/OAuthCallbackListener.hpp"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using errors::BridgeError;
using errors::ErrorKind;

namespace {

constexpr const char* kCompletePage =
    "<!DOCTYPE html>\n"
    "<html><head><meta charset=\"utf-8\"><title>Authorization Complete</title></head>\n"
    "<body style=\"font-family: sans-serif; text-align: center; margin-top: 4em;\">\n"
    "<h1>Authorization Complete</h1>\n"
    "<p>You can close this window and return to the application.</p>\n"
    "</body></html>\n";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// application/x-www-form-urlencoded decoding; malformed escapes are kept literally
std::string percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parseQuery(const std::string& query) {
    std::map<std::string, std::string> out;
    std::size_t start = 0;
    while (start <= query.size()) {
        auto amp = query.find('&', start);
        std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = percentDecode(pair.substr(0, eq));
            std::string value = (eq == std::string::npos) ? std::string() : percentDecode(pair.substr(eq + 1));
            out.emplace(std::move(key), std::move(value)); // first occurrence wins
        }
        if (amp == std::string::npos) {
            break;
        }
        start = amp + 1;
    }
    return out;
}

} // namespace

class OAuthCallbackListener::Impl {
public:
    OAuthCallbackListener::Options opts;
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    net::steady_timer timer{ioc};
    std::thread ioThread;
    std::atomic<bool> started{false};
    std::atomic<bool> resolved{false};
    std::promise<OAuthCallbackResult> outcome;
    uint16_t port{0};

    explicit Impl(const OAuthCallbackListener::Options& o) : opts(o) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    // First caller wins; returns whether this call decided the outcome
    bool resolveValue(OAuthCallbackResult r) {
        if (resolved.exchange(true)) {
            return false;
        }
        outcome.set_value(std::move(r));
        return true;
    }

    bool resolveError(const std::string& message) {
        if (resolved.exchange(true)) {
            return false;
        }
        outcome.set_exception(std::make_exception_ptr(BridgeError(ErrorKind::OAuth, message)));
        return true;
    }

    // Must run on the I/O thread
    void finish() {
        timer.cancel();
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
    }

    bool handleCallbackQuery(const std::string& query) {
        auto params = parseQuery(query);
        auto error = params.find("error");
        if (error != params.end()) {
            auto desc = params.find("error_description");
            std::string message = "Authorization denied: " + error->second;
            if (desc != params.end() && !desc->second.empty()) {
                message += " - " + desc->second;
            }
            LOG_WARN("OAuth callback: {}", message);
            return resolveError(message);
        }
        auto code = params.find("code");
        auto state = params.find("state");
        // Present but empty still counts as present
        if (code == params.end() || state == params.end()) {
            LOG_WARN("OAuth callback without code or state");
            return resolveError("Missing code or state in OAuth callback");
        }
        LOG_INFO("OAuth callback received (state length {})", state->second.size());
        return resolveValue(OAuthCallbackResult{code->second, state->second});
    }

    net::awaitable<void> session(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            stream.expires_after(std::chrono::seconds(10));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);

            const std::string target = std::string(req.target());
            const auto q = target.find('?');
            const std::string path = target.substr(0, q);
            const std::string query = (q == std::string::npos) ? std::string() : target.substr(q + 1);

            http::response<http::string_body> res{http::status::ok, req.version()};
            res.keep_alive(false);
            bool decided = false;
            if (req.method() != http::verb::get || path != opts.path) {
                res.result(http::status::not_found);
                res.set(http::field::content_type, "text/plain");
                res.body() = "Not Found";
            } else {
                decided = handleCallbackQuery(query);
                res.set(http::field::content_type, "text/html; charset=utf-8");
                res.body() = kCompletePage;
            }
            res.prepare_payload();
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            if (decided) {
                finish();
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("OAuth callback session ended: {}", e.what());
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (!resolved.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (!resolved.load()) {
                LOG_WARN("OAuth callback accept error: {}", e.what());
                if (resolveError(fmt::format("OAuth callback listener failed: {}", e.what()))) {
                    finish();
                }
            }
        }
        co_return;
    }
};

OAuthCallbackListener::OAuthCallbackListener() : OAuthCallbackListener(Options{}) {}

OAuthCallbackListener::OAuthCallbackListener(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

OAuthCallbackListener::~OAuthCallbackListener() {
    Stop();
}

OAuthCallbackListener::Started OAuthCallbackListener::Start() {
    if (pImpl->started.exchange(true)) {
        throw BridgeError(ErrorKind::Io, "OAuth callback listener already started");
    }
    try {
        tcp::endpoint ep(net::ip::make_address(pImpl->opts.address), 0);
        pImpl->acceptor = std::make_unique<tcp::acceptor>(pImpl->ioc);
        pImpl->acceptor->open(ep.protocol());
        pImpl->acceptor->bind(ep);
        pImpl->acceptor->listen();
        pImpl->port = pImpl->acceptor->local_endpoint().port();
    } catch (const boost::system::system_error& e) {
        throw BridgeError(ErrorKind::Io, fmt::format("Failed to bind OAuth callback listener: {}", e.what()));
    }

    const auto timeoutSecs = static_cast<long long>(pImpl->opts.timeout.count());
    pImpl->timer.expires_after(pImpl->opts.timeout);
    pImpl->timer.async_wait([impl = pImpl.get(), timeoutSecs](const boost::system::error_code& ec) {
        if (ec) {
            return; // cancelled: a callback won the race
        }
        if (impl->resolveError(fmt::format(
                "OAuth callback timed out - no response received within {} seconds", timeoutSecs))) {
            LOG_WARN("OAuth callback timed out after {} s", timeoutSecs);
            impl->finish();
        }
    });
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);

    Started started{pImpl->port, pImpl->outcome.get_future()};
    pImpl->ioThread = std::thread([impl = pImpl.get()]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("OAuth callback I/O loop error: {}", e.what());
            (void)impl->resolveError(fmt::format("OAuth callback listener failed: {}", e.what()));
        }
    });
    LOG_INFO("OAuth callback listener on {}", RedirectUri());
    return started;
}

std::string OAuthCallbackListener::RedirectUri() const {
    return fmt::format("http://{}:{}{}", pImpl->opts.address, pImpl->port, pImpl->opts.path);
}

void OAuthCallbackListener::Stop() {
    if (!pImpl->started.load()) {
        return;
    }
    if (pImpl->resolveError("OAuth callback listener stopped")) {
        LOG_DEBUG("OAuth callback listener stopped before an outcome");
    }
    net::post(pImpl->ioc, [impl = pImpl.get()]() { impl->finish(); });
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
}

} // namespace mcpbridge
