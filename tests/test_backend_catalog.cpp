//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_backend_catalog.cpp
// Purpose: GoogleTests for configuration parsing and backend status transitions
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "mcpbridge/BackendCatalog.h"
#include "mcpbridge/errors/Errors.h"

using namespace mcpbridge;

namespace {

std::string configErrorOf(const std::string& json) {
    try {
        (void)ParseBridgeConfig(json);
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Protocol);
        return e.what();
    }
    ADD_FAILURE() << "expected configuration error for " << json;
    return std::string();
}

BackendConfig backend(const std::string& id, bool enabled = true) {
    BackendConfig b;
    b.id = id;
    b.name = id;
    b.command = "true";
    b.enabled = enabled;
    return b;
}

} // namespace

TEST(BridgeConfig, ParsesFullDocument) {
    auto cfg = ParseBridgeConfig(R"({
        "gateway": {"address": "0.0.0.0", "port": 8700, "workerThreads": 2},
        "backends": [
            {"id": "fs", "name": "Filesystem", "command": "npx", "args": ["-y", "server-fs"],
             "env": {"ROOT": "/srv"}, "enabled": false},
            {"id": "git", "command": "mcp-git"}
        ]})");
    EXPECT_EQ(cfg.gateway.address, "0.0.0.0");
    EXPECT_EQ(cfg.gateway.port, 8700);
    EXPECT_EQ(cfg.gateway.scheme, "http");
    EXPECT_EQ(cfg.gateway.workerThreads, 2u);
    ASSERT_EQ(cfg.backends.size(), 2u);
    EXPECT_EQ(cfg.backends[0].name, "Filesystem");
    EXPECT_EQ(cfg.backends[0].args, (std::vector<std::string>{"-y", "server-fs"}));
    EXPECT_EQ(cfg.backends[0].env.at("ROOT"), "/srv");
    EXPECT_FALSE(cfg.backends[0].enabled);
    // name defaults to id, enabled defaults to true
    EXPECT_EQ(cfg.backends[1].name, "git");
    EXPECT_TRUE(cfg.backends[1].enabled);
}

TEST(BridgeConfig, DefaultsWhenSectionsMissing) {
    auto cfg = ParseBridgeConfig("{}");
    EXPECT_EQ(cfg.gateway.address, "127.0.0.1");
    EXPECT_EQ(cfg.gateway.port, 0);
    EXPECT_EQ(cfg.gateway.workerThreads, 4u);
    EXPECT_TRUE(cfg.backends.empty());
}

TEST(BridgeConfig, RejectsInvalidDocuments) {
    EXPECT_NE(configErrorOf("not json").find("Invalid configuration: "), std::string::npos);
    EXPECT_NE(configErrorOf("[]").find("top level"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"backends":[{"command":"x"}]})").find("missing id"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"backends":[{"id":"a"}]})").find("missing command"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"backends":[{"id":"a","command":"x"},{"id":"a","command":"y"}]})")
                  .find("duplicate backend id 'a'"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"gateway":{"port":70000}})").find("port"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"gateway":{"scheme":"https"}})").find("certFile"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"gateway":{"workerThreads":0}})").find("workerThreads"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"backends":[{"id":"a","command":"x","args":"-v"}]})").find("args"), std::string::npos);
}

TEST(BridgeConfig, LoadMissingFileIsIo) {
    try {
        (void)LoadBridgeConfig("/nonexistent/dir/bridge.json");
        FAIL() << "expected Io error";
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Io);
    }
}

TEST(BridgeConfig, LoadFromFile) {
    char path[] = "/tmp/mcpbridge-config-XXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << R"({"backends":[{"id":"one","command":"cmd"}]})";
    }
    auto cfg = LoadBridgeConfig(path);
    std::remove(path);
    ASSERT_EQ(cfg.backends.size(), 1u);
    EXPECT_EQ(cfg.backends[0].id, "one");
}

TEST(BackendCatalog, ConnectTransitions) {
    BackendCatalog catalog({backend("a"), backend("b")});
    std::vector<std::pair<std::string, BackendStatus>> seen;
    catalog.SetStatusListener([&](const std::string& id, BackendStatus s) { seen.emplace_back(id, s); });

    auto launch = catalog.BeginConnect("a");
    EXPECT_EQ(launch.command, "true");
    EXPECT_EQ(catalog.Get("a")->status, BackendStatus::Connecting);

    bool committed = catalog.CommitConnected("a", []() { return true; });
    EXPECT_TRUE(committed);
    auto state = catalog.Get("a");
    EXPECT_EQ(state->status, BackendStatus::Connected);
    EXPECT_TRUE(state->lastConnected.has_value());
    EXPECT_FALSE(state->lastError.has_value());

    catalog.MarkDisconnected("a");
    EXPECT_EQ(catalog.Get("a")->status, BackendStatus::Disconnected);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].second, BackendStatus::Connecting);
    EXPECT_EQ(seen[1].second, BackendStatus::Connected);
    EXPECT_EQ(seen[2].second, BackendStatus::Disconnected);
}

TEST(BackendCatalog, BeginConnectRejectsUnknownAndBusy) {
    BackendCatalog catalog({backend("a")});
    try {
        (void)catalog.BeginConnect("missing");
        FAIL() << "expected ServerNotFound";
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ServerNotFound);
        EXPECT_EQ(std::string(e.what()), "No server found with id 'missing'");
    }

    (void)catalog.BeginConnect("a");
    try {
        (void)catalog.BeginConnect("a");
        FAIL() << "expected AlreadyConnected";
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::AlreadyConnected);
    }
}

TEST(BackendCatalog, ErrorRecordsMessageAndAllowsRetry) {
    BackendCatalog catalog({backend("a")});
    (void)catalog.BeginConnect("a");
    catalog.MarkError("a", "spawn failed");
    auto state = catalog.Get("a");
    EXPECT_EQ(state->status, BackendStatus::Error);
    EXPECT_EQ(state->lastError.value_or(""), "spawn failed");

    EXPECT_NO_THROW((void)catalog.BeginConnect("a"));
    EXPECT_FALSE(catalog.Get("a")->lastError.has_value());
}

TEST(BackendCatalog, FailedCommitLeavesStatus) {
    BackendCatalog catalog({backend("a")});
    (void)catalog.BeginConnect("a");
    EXPECT_FALSE(catalog.CommitConnected("a", []() { return false; }));
    EXPECT_NE(catalog.Get("a")->status, BackendStatus::Connected);
}

TEST(BackendCatalog, ListKeepsConfigurationOrderAndRejectsDuplicates) {
    BackendCatalog catalog;
    EXPECT_TRUE(catalog.Add(backend("z")));
    EXPECT_TRUE(catalog.Add(backend("a")));
    EXPECT_FALSE(catalog.Add(backend("z")));
    auto list = catalog.List();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].config.id, "z");
    EXPECT_EQ(list[1].config.id, "a");
    EXPECT_TRUE(catalog.Contains("a"));
    EXPECT_FALSE(catalog.Contains("q"));
}

TEST(BackendCatalog, StatusNames) {
    EXPECT_STREQ(backendStatusName(BackendStatus::Disconnected), "disconnected");
    EXPECT_STREQ(backendStatusName(BackendStatus::Connecting), "connecting");
    EXPECT_STREQ(backendStatusName(BackendStatus::Connected), "connected");
    EXPECT_STREQ(backendStatusName(BackendStatus::Error), "error");
}
