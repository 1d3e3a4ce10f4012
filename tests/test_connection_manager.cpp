//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection_manager.cpp
// Purpose: GoogleTests for connect/disconnect flows, tool routing and eviction of exited backends
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/types.h>

#include "FakeClient.h"
#include "mcpbridge/BackendCatalog.h"
#include "mcpbridge/ConnectionManager.h"
#include "mcpbridge/ConnectionRegistry.h"
#include "mcpbridge/errors/Errors.h"

#ifndef STUB_BACKEND_PATH
#error "STUB_BACKEND_PATH must point at the stub_backend executable"
#endif

using namespace mcpbridge;
using namespace std::chrono_literals;
using mcpbridge::testing_support::FakeClient;
using mcpbridge::testing_support::FakeClientFactory;
using mcpbridge::testing_support::makeTool;

namespace {

BackendConfig backend(const std::string& id, const std::string& name, bool enabled = true) {
    BackendConfig b;
    b.id = id;
    b.name = name;
    b.command = "unused";
    b.enabled = enabled;
    return b;
}

template <typename Fn>
errors::ErrorKind kindOf(Fn&& fn) {
    try {
        fn();
    } catch (const errors::BridgeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected BridgeError";
    return errors::ErrorKind::Io;
}

bool waitForStatus(const BackendCatalog& catalog, const std::string& id, BackendStatus status) {
    for (int i = 0; i < 300; ++i) {
        auto s = catalog.Get(id);
        if (s.has_value() && s->status == status) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

// Shares ownership so the fake outlives its removal from the registry
std::shared_ptr<FakeClient> liveClient(const ConnectionRegistry& registry, const std::string& id) {
    auto conn = registry.Get(id);
    if (!conn.has_value()) {
        return nullptr;
    }
    return std::static_pointer_cast<FakeClient>(conn->client);
}

std::string firstText(const CallToolResult& r) {
    if (r.content.empty()) {
        return std::string();
    }
    return r.content.front().FindString("text").value_or("");
}

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory = std::make_shared<FakeClientFactory>();
        factory->configure = [](FakeClient& c) { c.tools = {makeTool("read"), makeTool("write")}; };
        catalog.Add(backend("fs", "Files"));
        catalog.Add(backend("git", "Git", false));
        manager = std::make_unique<ConnectionManager>(catalog, registry, factory);
    }

    void TearDown() override { manager.reset(); }

    BackendCatalog catalog;
    ConnectionRegistry registry;
    std::shared_ptr<FakeClientFactory> factory;
    std::unique_ptr<ConnectionManager> manager;
};

} // namespace

TEST_F(ConnectionManagerTest, ConnectRegistersAfterHandshake) {
    manager->Connect("fs");
    EXPECT_EQ(catalog.Get("fs")->status, BackendStatus::Connected);
    EXPECT_TRUE(catalog.Get("fs")->lastConnected.has_value());
    auto conn = registry.Get("fs");
    ASSERT_TRUE(conn.has_value());
    EXPECT_EQ(conn->processId.value_or(-1), 4242);
    EXPECT_TRUE(manager->IsConnected("fs"));
    EXPECT_FALSE(manager->IsConnected("git"));
}

TEST_F(ConnectionManagerTest, FailedConnectRecordsErrorAndRethrows) {
    factory->configure = [](FakeClient& c) {
        c.onConnect = []() { throw errors::BridgeError(errors::ErrorKind::SpawnFailed, "no such binary"); };
    };
    EXPECT_EQ(kindOf([&]() { manager->Connect("fs"); }), errors::ErrorKind::SpawnFailed);
    auto state = catalog.Get("fs");
    EXPECT_EQ(state->status, BackendStatus::Error);
    EXPECT_EQ(state->lastError.value_or(""), "no such binary");
    EXPECT_FALSE(registry.Contains("fs"));

    // Error is a retryable state
    factory->configure = nullptr;
    EXPECT_NO_THROW(manager->Connect("fs"));
    EXPECT_EQ(catalog.Get("fs")->status, BackendStatus::Connected);
}

TEST_F(ConnectionManagerTest, ConnectRejectsUnknownAndDuplicate) {
    EXPECT_EQ(kindOf([&]() { manager->Connect("nope"); }), errors::ErrorKind::ServerNotFound);
    manager->Connect("fs");
    EXPECT_EQ(kindOf([&]() { manager->Connect("fs"); }), errors::ErrorKind::AlreadyConnected);
    EXPECT_EQ(factory->count(), 1u);
}

TEST_F(ConnectionManagerTest, DisconnectShutsDownAndMarksDisconnected) {
    manager->Connect("fs");
    auto client = liveClient(registry, "fs");
    ASSERT_TRUE(client);
    manager->Disconnect("fs");
    EXPECT_EQ(client->shutdownCalls.load(), 1);
    EXPECT_FALSE(registry.Contains("fs"));
    EXPECT_EQ(catalog.Get("fs")->status, BackendStatus::Disconnected);

    try {
        manager->Disconnect("fs");
        FAIL() << "expected ServerNotFound";
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ServerNotFound);
        EXPECT_EQ(std::string(e.what()), "Server 'fs' is not connected");
    }
}

TEST_F(ConnectionManagerTest, ListToolsStampsBackendAndHandlesStates) {
    EXPECT_EQ(kindOf([&]() { (void)manager->ListTools("nope"); }), errors::ErrorKind::ServerNotFound);
    EXPECT_TRUE(manager->ListTools("fs").empty());

    manager->Connect("fs");
    auto tools = manager->ListTools("fs");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "read");
    EXPECT_EQ(tools[0].backendId, "fs");
    EXPECT_EQ(tools[0].backendName, "Files");
}

TEST_F(ConnectionManagerTest, StaleToolsAreRefreshedOnRead) {
    manager->Connect("fs");
    FakeClient* client = factory->last();
    EXPECT_EQ(client->refreshCalls.load(), 0);

    (void)manager->ListTools("fs");
    EXPECT_EQ(client->refreshCalls.load(), 0);

    client->tools.push_back(makeTool("delete"));
    client->stale = true;
    auto tools = manager->ListTools("fs");
    EXPECT_EQ(client->refreshCalls.load(), 1);
    EXPECT_EQ(tools.size(), 3u);
    EXPECT_FALSE(client->stale.load());
}

TEST_F(ConnectionManagerTest, ListAllToolsNamespacesByBackendName) {
    catalog.Add(backend("db", "Database"));
    manager->Connect("fs");
    manager->Connect("db");
    auto all = manager->ListAllTools();
    std::vector<std::string> names;
    for (const auto& t : all) {
        names.push_back(t.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"Files.read", "Files.write", "Database.read", "Database.write"}));
}

TEST_F(ConnectionManagerTest, CallToolRoutesToBackend) {
    manager->Connect("fs");
    auto r = manager->CallTool("fs", "read", ParseJSON(R"({"path":"/a"})"), "cursor");
    EXPECT_EQ(firstText(r), R"(read:{"path":"/a"})");

    try {
        (void)manager->CallTool("git", "log", JSONValue{JSONValue::Object{}}, "cursor");
        FAIL() << "expected ServerNotFound";
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ServerNotFound);
        EXPECT_EQ(std::string(e.what()), "Server 'git' is not connected");
    }
    try {
        (void)manager->CallTool("nope", "log", JSONValue{JSONValue::Object{}}, "cursor");
        FAIL() << "expected ServerNotFound";
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(std::string(e.what()), "No server found with id 'nope'");
    }
}

TEST_F(ConnectionManagerTest, CallToolRecordsStatistics) {
    manager->Connect("fs");
    (void)manager->CallTool("fs", "read", ParseJSON(R"({"path":"/a"})"), "cursor");
    (void)manager->CallTool("fs", "read", ParseJSON(R"({"path":"/b"})"), "windsurf");
    (void)manager->CallTool("fs", "write", JSONValue{JSONValue::Object{}}, "");

    // Lookups that never reach a backend are not calls
    EXPECT_EQ(kindOf([&]() { (void)manager->CallTool("git", "log", JSONValue{JSONValue::Object{}}, "cursor"); }),
              errors::ErrorKind::ServerNotFound);

    // A session failure still counts, as an error
    liveClient(registry, "fs")->connected = false;
    EXPECT_EQ(kindOf([&]() { (void)manager->CallTool("fs", "read", JSONValue{JSONValue::Object{}}, "cursor"); }),
              errors::ErrorKind::TransportClosed);

    auto stats = manager->GetToolCallStats("fs");
    EXPECT_EQ(stats.totalCalls, 4u);
    EXPECT_EQ(stats.errors, 1u);
    EXPECT_EQ(stats.tools["read"].totalCalls, 3u);
    EXPECT_EQ(stats.tools["read"].errors, 1u);
    EXPECT_EQ(stats.tools["write"].totalCalls, 1u);
    EXPECT_EQ(stats.clients["cursor"], 2u);
    EXPECT_EQ(stats.clients["windsurf"], 1u);
    EXPECT_EQ(stats.clients["unknown"], 1u);
    ASSERT_EQ(stats.recentCalls.size(), 4u);
    EXPECT_EQ(stats.recentCalls.front().client, "cursor");
    EXPECT_TRUE(stats.recentCalls.front().success);
    EXPECT_FALSE(stats.recentCalls.back().success);
    EXPECT_EQ(stats.recentCalls.back().error.value_or(""), "Client is not connected");
    EXPECT_EQ(manager->GetToolCallStats("git").totalCalls, 0u);

    manager->ResetToolCallStats("fs");
    EXPECT_EQ(manager->GetToolCallStats("fs").totalCalls, 0u);
    EXPECT_TRUE(manager->GetToolCallStats("fs").recentCalls.empty());
}

TEST_F(ConnectionManagerTest, ExitedBackendIsEvicted) {
    manager->Connect("fs");
    auto client = liveClient(registry, "fs");
    ASSERT_TRUE(client);
    client->simulateExit();

    ASSERT_TRUE(waitForStatus(catalog, "fs", BackendStatus::Error));
    EXPECT_EQ(catalog.Get("fs")->lastError.value_or(""), "Backend process exited");
    EXPECT_FALSE(registry.Contains("fs"));
    EXPECT_GE(client->shutdownCalls.load(), 1);

    // Reconnect after eviction is allowed
    EXPECT_NO_THROW(manager->Connect("fs"));
}

TEST_F(ConnectionManagerTest, RepeatedExitsDoNotAccumulateReapers) {
    for (int i = 0; i < 20; ++i) {
        manager->Connect("fs");
        auto client = liveClient(registry, "fs");
        ASSERT_TRUE(client);
        client->simulateExit();
        ASSERT_TRUE(waitForStatus(catalog, "fs", BackendStatus::Error)) << "cycle " << i;
    }
    // Finished eviction threads are joined when the next exit arrives
    EXPECT_LE(ConnectionManagerTestHooks::reaperCount(*manager), 2u);
}

TEST_F(ConnectionManagerTest, LateExitDoesNotEvictNewSession) {
    manager->Connect("fs");
    auto first = liveClient(registry, "fs");
    ASSERT_TRUE(first);
    manager->Disconnect("fs");
    manager->Connect("fs");
    ASSERT_NE(liveClient(registry, "fs"), first);

    first->simulateExit();
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(registry.Contains("fs"));
    EXPECT_EQ(catalog.Get("fs")->status, BackendStatus::Connected);
}

TEST_F(ConnectionManagerTest, ConnectEnabledSkipsDisabled) {
    catalog.Add(backend("db", "Database"));
    EXPECT_EQ(manager->ConnectEnabled(), 2u);
    EXPECT_EQ(registry.Ids(), (std::vector<std::string>{"db", "fs"}));
    EXPECT_EQ(catalog.Get("git")->status, BackendStatus::Disconnected);
}

TEST_F(ConnectionManagerTest, ConnectEnabledCountsOnlySuccesses) {
    factory->configure = [](FakeClient& c) {
        c.onConnect = []() { throw errors::BridgeError(errors::ErrorKind::Protocol, "handshake rejected"); };
    };
    EXPECT_EQ(manager->ConnectEnabled(), 0u);
    EXPECT_EQ(catalog.Get("fs")->status, BackendStatus::Error);
}

TEST_F(ConnectionManagerTest, ShutdownAllDisconnectsEverything) {
    catalog.Add(backend("db", "Database"));
    manager->Connect("fs");
    manager->Connect("db");
    manager->ShutdownAll();
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(catalog.Get("fs")->status, BackendStatus::Disconnected);
    EXPECT_EQ(catalog.Get("db")->status, BackendStatus::Disconnected);
}

TEST(ConnectionManagerStub, RealBackendRoundTripAndExit) {
    BackendCatalog catalog;
    BackendConfig cfg;
    cfg.id = "stub";
    cfg.name = "Stub";
    cfg.command = STUB_BACKEND_PATH;
    catalog.Add(cfg);
    ConnectionRegistry registry;
    ConnectionManager manager(catalog, registry);

    manager.Connect("stub");
    auto tools = manager.ListTools("stub");
    ASSERT_FALSE(tools.empty());
    bool hasEcho = false;
    for (const auto& t : tools) {
        hasEcho = hasEcho || t.name == "echo";
    }
    EXPECT_TRUE(hasEcho);

    auto r = manager.CallTool("stub", "echo", ParseJSON(R"({"x":1})"), "claude-code");
    EXPECT_EQ(ParseJSON(firstText(r)), ParseJSON(R"({"x":1})"));

    auto pid = registry.Get("stub")->processId;
    ASSERT_TRUE(pid.has_value());
    ASSERT_EQ(::kill(pid.value(), SIGKILL), 0);

    ASSERT_TRUE(waitForStatus(catalog, "stub", BackendStatus::Error));
    EXPECT_EQ(catalog.Get("stub")->lastError.value_or(""), "Backend process exited");
    EXPECT_EQ(kindOf([&]() { (void)manager.CallTool("stub", "echo", JSONValue{JSONValue::Object{}}, "claude-code"); }),
              errors::ErrorKind::ServerNotFound);
}

TEST(ConnectionManagerStub, ListChangedTriggersRefresh) {
    BackendCatalog catalog;
    BackendConfig cfg;
    cfg.id = "stub";
    cfg.name = "Stub";
    cfg.command = STUB_BACKEND_PATH;
    catalog.Add(cfg);
    ConnectionRegistry registry;
    ConnectionManager manager(catalog, registry);
    manager.Connect("stub");

    auto before = manager.ListTools("stub").size();
    auto r = manager.CallTool("stub", "emit_list_changed", JSONValue{JSONValue::Object{}}, "claude-code");
    EXPECT_EQ(firstText(r), "emitted");
    auto client = registry.Get("stub")->client;
    for (int i = 0; i < 100 && !client->IsToolsStale(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(client->IsToolsStale());
    EXPECT_EQ(manager.ListTools("stub").size(), before);
    EXPECT_FALSE(client->IsToolsStale());
}
