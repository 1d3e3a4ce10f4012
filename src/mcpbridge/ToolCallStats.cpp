//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCallStats.cpp
// Purpose: Per-backend tool-call statistics
//==========================================================================================================

#include "mcpbridge/ToolCallStats.h"

#include "logging/Logger.h"

namespace mcpbridge {

ToolCallStats::ToolCallStats(std::size_t recentLimit) : recentLimit(recentLimit) {}

void ToolCallStats::Record(const std::string& backendId, ToolCallRecord record) {
    std::lock_guard<std::mutex> lock(mutex);
    ServerStats& s = servers[backendId];
    s.totalCalls++;
    s.totalDurationMs += record.durationMs;
    ToolUsage& usage = s.tools[record.tool];
    usage.totalCalls++;
    usage.totalDurationMs += record.durationMs;
    if (!record.success) {
        s.errors++;
        usage.errors++;
    }
    s.clients[record.client]++;

    if (recentLimit == 0) {
        return;
    }
    s.recentCalls.push_back(std::move(record));
    while (s.recentCalls.size() > recentLimit) {
        s.recentCalls.pop_front();
    }
}

ServerStats ToolCallStats::Get(const std::string& backendId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = servers.find(backendId);
    if (it == servers.end()) {
        return ServerStats{};
    }
    return it->second;
}

void ToolCallStats::Reset(const std::string& backendId) {
    std::lock_guard<std::mutex> lock(mutex);
    if (servers.erase(backendId) > 0) {
        LOG_DEBUG("ToolCallStats: reset '{}'", backendId);
    }
}

} // namespace mcpbridge
