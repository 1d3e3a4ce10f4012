//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_gateway_server.cpp
// Purpose: GoogleTests for the Beast gateway listener over a real loopback socket
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcpbridge/Gateway.h"
#include "mcpbridge/GatewayServer.hpp"
#include "mcpbridge/errors/Errors.h"

using namespace mcpbridge;
using namespace std::chrono_literals;
namespace http = boost::beast::http;

namespace {

class SleepyBackends : public IGatewayBackends {
public:
    std::atomic<int> calls{0};

    bool HasBackend(const std::string& id) const override { return id == "demo"; }
    bool IsConnected(const std::string& id) const override { return id == "demo"; }

    std::vector<Tool> ListTools(const std::string& id) override {
        (void)id;
        Tool t;
        t.name = "nap";
        t.inputSchema = JSONValue{JSONValue::Object{}};
        return {t};
    }

    // Blocks like a slow backend would
    CallToolResult CallTool(const std::string& id, const std::string& name, const JSONValue& arguments,
                            const std::string& client) override {
        (void)id;
        (void)name;
        (void)arguments;
        (void)client;
        calls++;
        std::this_thread::sleep_for(300ms);
        CallToolResult r;
        JSONValue::Object text;
        text["type"] = std::make_shared<JSONValue>("text");
        text["text"] = std::make_shared<JSONValue>("rested");
        r.content.push_back(JSONValue{text});
        return r;
    }
};

//==========================================================================================================
// httpRequest
// Purpose: Send a single HTTP request and capture the response (synchronously).
//==========================================================================================================
static http::response<http::string_body> httpRequest(http::verb verb,
                                                     unsigned short port,
                                                     const std::string& target,
                                                     const std::string& body,
                                                     const std::optional<std::string>& accept = std::nullopt) {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve("127.0.0.1", std::to_string(port));
    tcp::socket socket{ioc};
    boost::asio::connect(socket, r);

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    if (accept.has_value()) {
        req.set(http::field::accept, accept.value());
    }
    req.body() = body;
    req.prepare_payload();

    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

static http::response<http::string_body> httpPost(unsigned short port, const std::string& target,
                                                  const std::string& body,
                                                  const std::optional<std::string>& accept = std::nullopt) {
    return httpRequest(http::verb::post, port, target, body, accept);
}

class GatewayServerTest : public ::testing::Test {
protected:
    SleepyBackends backends;
    Gateway gateway{backends};
    ProxyRuntimeState state;
};

} // namespace

TEST_F(GatewayServerTest, StartReportsEphemeralPortOnce) {
    GatewayServer::Options opts;
    GatewayServer server(opts, gateway, state);
    std::vector<uint16_t> reported;
    server.SetPortChangedCallback([&](uint16_t p) { reported.push_back(p); });
    EXPECT_FALSE(state.IsRunning());

    ASSERT_NO_THROW(server.Start().get());
    const uint16_t port = server.GetPort();
    EXPECT_NE(port, 0);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], port);
    EXPECT_TRUE(state.IsRunning());
    EXPECT_EQ(state.Port(), port);

    server.Stop().get();
    EXPECT_FALSE(state.IsRunning());
    EXPECT_EQ(reported.size(), 1u);
}

TEST_F(GatewayServerTest, ServesJsonAndSse) {
    GatewayServer server(GatewayServer::Options{}, gateway, state);
    server.Start().get();
    const auto port = server.GetPort();

    auto res = httpPost(port, "/mcp/demo", R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_EQ(res.result_int(), 200);
    EXPECT_EQ(std::string(res[http::field::content_type]), "application/json");
    auto doc = ParseJSON(res.body());
    const auto& tools = std::get<JSONValue::Array>(doc.Find("result")->Find("tools")->value);
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0]->FindString("name").value_or(""), "nap");

    auto sse = httpPost(port, "/mcp/demo", R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})",
                        std::string("application/json, text/event-stream"));
    EXPECT_EQ(sse.result_int(), 200);
    EXPECT_EQ(std::string(sse[http::field::content_type]), "text/event-stream");
    EXPECT_EQ(sse.body().rfind("event: message\ndata: ", 0), 0u);

    server.Stop().get();
}

TEST_F(GatewayServerTest, RawStatusesReachTheWire) {
    GatewayServer server(GatewayServer::Options{}, gateway, state);
    server.Start().get();
    const auto port = server.GetPort();

    EXPECT_EQ(httpPost(port, "/mcp/demo", R"({"jsonrpc":"2.0","method":"notifications/initialized"})").result_int(), 202);
    EXPECT_EQ(httpPost(port, "/nowhere", "{}").result_int(), 404);
    EXPECT_EQ(httpPost(port, "/mcp/demo", "{oops").result_int(), 400);
    auto get = httpRequest(http::verb::get, port, "/mcp/demo", "");
    EXPECT_EQ(get.result_int(), 405);
    EXPECT_EQ(std::string(get[http::field::allow]), "POST");

    server.Stop().get();
}

TEST_F(GatewayServerTest, SlowCallsDoNotBlockOtherRequests) {
    GatewayServer::Options opts;
    opts.workerThreads = 2;
    GatewayServer server(opts, gateway, state);
    server.Start().get();
    const auto port = server.GetPort();

    std::thread slow([&]() {
        auto res = httpPost(port, "/mcp/demo",
                            R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"nap"}})");
        EXPECT_EQ(res.result_int(), 200);
    });
    while (backends.calls.load() == 0) {
        std::this_thread::sleep_for(5ms);
    }
    auto start = std::chrono::steady_clock::now();
    auto fast = httpPost(port, "/mcp/demo", R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    EXPECT_EQ(fast.result_int(), 200);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);
    slow.join();

    server.Stop().get();
}

TEST_F(GatewayServerTest, BindConflictIsIoError) {
    GatewayServer first(GatewayServer::Options{}, gateway, state);
    first.Start().get();

    ProxyRuntimeState otherState;
    GatewayServer::Options opts;
    opts.port = first.GetPort();
    GatewayServer second(opts, gateway, otherState);
    try {
        second.Start().get();
        FAIL() << "expected bind failure";
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Io);
    }
    EXPECT_FALSE(otherState.IsRunning());
    first.Stop().get();
}

TEST_F(GatewayServerTest, StopIsIdempotent) {
    GatewayServer server(GatewayServer::Options{}, gateway, state);
    server.Start().get();
    server.Stop().get();
    EXPECT_NO_THROW(server.Stop().get());
}
