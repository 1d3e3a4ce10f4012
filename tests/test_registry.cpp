//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: GoogleTests for ConnectionRegistry exclusivity, conditional removal and concurrent access
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "FakeClient.h"
#include "mcpbridge/ConnectionRegistry.h"

using namespace mcpbridge;
using mcpbridge::testing_support::FakeClient;

namespace {

Connection makeConnection() {
    return Connection{std::make_shared<FakeClient>(), 100};
}

} // namespace

TEST(ConnectionRegistry, InsertIsExclusivePerId) {
    ConnectionRegistry reg;
    auto first = makeConnection();
    EXPECT_TRUE(reg.Insert("fs", first));
    EXPECT_FALSE(reg.Insert("fs", makeConnection()));
    EXPECT_EQ(reg.Size(), 1u);

    auto got = reg.Get("fs");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->client.get(), first.client.get());
    EXPECT_EQ(got->processId.value_or(-1), 100);
}

TEST(ConnectionRegistry, RemoveReturnsEntryOnce) {
    ConnectionRegistry reg;
    ASSERT_TRUE(reg.Insert("a", makeConnection()));
    auto removed = reg.Remove("a");
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(reg.Remove("a").has_value());
    EXPECT_FALSE(reg.Contains("a"));
    EXPECT_FALSE(reg.Get("a").has_value());
}

TEST(ConnectionRegistry, RemoveIfOnlyMatchesSameClient) {
    ConnectionRegistry reg;
    auto oldConn = makeConnection();
    ASSERT_TRUE(reg.Insert("a", oldConn));
    ASSERT_TRUE(reg.Remove("a").has_value());
    auto newConn = makeConnection();
    ASSERT_TRUE(reg.Insert("a", newConn));

    // A late eviction for the previous session must not drop the new one
    EXPECT_FALSE(reg.RemoveIf("a", oldConn.client.get()).has_value());
    EXPECT_TRUE(reg.Contains("a"));
    EXPECT_TRUE(reg.RemoveIf("a", newConn.client.get()).has_value());
    EXPECT_FALSE(reg.Contains("a"));
}

TEST(ConnectionRegistry, IdsSortedAndDrainEmpties) {
    ConnectionRegistry reg;
    ASSERT_TRUE(reg.Insert("zeta", makeConnection()));
    ASSERT_TRUE(reg.Insert("alpha", makeConnection()));
    ASSERT_TRUE(reg.Insert("mid", makeConnection()));
    EXPECT_EQ(reg.Ids(), (std::vector<std::string>{"alpha", "mid", "zeta"}));

    auto drained = reg.Drain();
    EXPECT_EQ(drained.size(), 3u);
    EXPECT_EQ(reg.Size(), 0u);
}

TEST(ConnectionRegistry, ConcurrentInsertHasSingleWinner) {
    ConnectionRegistry reg;
    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            if (reg.Insert("shared", makeConnection())) {
                wins++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(wins.load(), 1);
}

TEST(ConnectionRegistry, ReadersProceedDuringWrites) {
    ConnectionRegistry reg;
    ASSERT_TRUE(reg.Insert("stable", makeConnection()));
    std::atomic<bool> stop{false};
    std::atomic<int> reads{0};
    std::thread reader([&]() {
        while (!stop.load()) {
            if (reg.Get("stable").has_value()) {
                reads++;
            }
        }
    });
    std::thread writer([&]() {
        // Overlap with a running reader before churning
        while (reads.load() == 0) {
            std::this_thread::yield();
        }
        for (int i = 0; i < 500; ++i) {
            const std::string id = "tmp" + std::to_string(i % 8);
            (void)reg.Insert(id, makeConnection());
            (void)reg.Remove(id);
        }
        stop = true;
    });
    writer.join();
    reader.join();
    EXPECT_GT(reads.load(), 0);
    EXPECT_TRUE(reg.Contains("stable"));
}
