//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_call_stats.cpp
// Purpose: GoogleTests for per-backend tool-call statistics (aggregation, bounded history, reset)
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "mcpbridge/ToolCallStats.h"

using namespace mcpbridge;

namespace {

ToolCallRecord call(const std::string& tool, const std::string& client, uint64_t ms, bool ok = true) {
    ToolCallRecord r;
    r.timestamp = std::chrono::system_clock::now();
    r.tool = tool;
    r.client = client;
    r.durationMs = ms;
    r.success = ok;
    if (!ok) {
        r.error = "boom";
    }
    return r;
}

} // namespace

TEST(ToolCallStats, AggregatesPerToolAndClient) {
    ToolCallStats stats;
    stats.Record("fs", call("read", "cursor", 10));
    stats.Record("fs", call("read", "cursor", 30, false));
    stats.Record("fs", call("write", "claude-code", 5));
    stats.Record("git", call("log", "cursor", 7));

    auto fs = stats.Get("fs");
    EXPECT_EQ(fs.totalCalls, 3u);
    EXPECT_EQ(fs.errors, 1u);
    EXPECT_EQ(fs.totalDurationMs, 45u);
    ASSERT_EQ(fs.tools.size(), 2u);
    EXPECT_EQ(fs.tools["read"].totalCalls, 2u);
    EXPECT_EQ(fs.tools["read"].errors, 1u);
    EXPECT_EQ(fs.tools["read"].totalDurationMs, 40u);
    EXPECT_EQ(fs.tools["write"].errors, 0u);
    EXPECT_EQ(fs.clients["cursor"], 2u);
    EXPECT_EQ(fs.clients["claude-code"], 1u);
    ASSERT_EQ(fs.recentCalls.size(), 3u);
    EXPECT_EQ(fs.recentCalls[1].error.value_or(""), "boom");

    EXPECT_EQ(stats.Get("git").totalCalls, 1u);
}

TEST(ToolCallStats, UnknownBackendIsEmpty) {
    ToolCallStats stats;
    auto s = stats.Get("nope");
    EXPECT_EQ(s.totalCalls, 0u);
    EXPECT_TRUE(s.tools.empty());
    EXPECT_TRUE(s.recentCalls.empty());
}

TEST(ToolCallStats, RecentCallsAreBoundedOldestDropped) {
    ToolCallStats stats(3);
    for (int i = 0; i < 5; ++i) {
        stats.Record("fs", call("t" + std::to_string(i), "cursor", 1));
    }
    auto s = stats.Get("fs");
    EXPECT_EQ(s.totalCalls, 5u);
    ASSERT_EQ(s.recentCalls.size(), 3u);
    EXPECT_EQ(s.recentCalls.front().tool, "t2");
    EXPECT_EQ(s.recentCalls.back().tool, "t4");
}

TEST(ToolCallStats, ResetClearsOnlyThatBackend) {
    ToolCallStats stats;
    stats.Record("fs", call("read", "cursor", 1));
    stats.Record("git", call("log", "cursor", 1));
    stats.Reset("fs");
    EXPECT_EQ(stats.Get("fs").totalCalls, 0u);
    EXPECT_EQ(stats.Get("git").totalCalls, 1u);
    EXPECT_NO_THROW(stats.Reset("never-seen"));

    stats.Record("fs", call("read", "cursor", 2));
    EXPECT_EQ(stats.Get("fs").totalCalls, 1u);
}

TEST(ToolCallStats, ConcurrentRecordsAreAllCounted) {
    ToolCallStats stats;
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&stats, w]() {
            for (int i = 0; i < 250; ++i) {
                stats.Record("fs", call("read", "client" + std::to_string(w), 1, i % 10 != 0));
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    auto s = stats.Get("fs");
    EXPECT_EQ(s.totalCalls, 1000u);
    EXPECT_EQ(s.errors, 100u);
    EXPECT_EQ(s.clients.size(), 4u);
    EXPECT_EQ(s.recentCalls.size(), ToolCallStats::kDefaultRecentLimit);
}
