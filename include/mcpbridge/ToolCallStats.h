//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCallStats.h
// Purpose: Per-backend tool-call counters, latencies and a bounded history of recent calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpbridge {

struct ToolUsage {
    uint64_t totalCalls{0};
    uint64_t errors{0};
    uint64_t totalDurationMs{0};
};

//==========================================================================================================
// ToolCallRecord
// Purpose: One finished tools/call routed to a backend.
// Fields:
//   timestamp: Wall-clock time the call finished.
//   tool: Tool name as the backend knows it.
//   client: Calling application ("unknown" when the caller did not identify itself).
//   durationMs: Time spent waiting for the backend.
//   success: false when the call threw or the backend flagged the result with isError.
//   error: Failure message for unsuccessful calls.
//==========================================================================================================
struct ToolCallRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string tool;
    std::string client;
    uint64_t durationMs{0};
    bool success{true};
    std::optional<std::string> error;
};

//==========================================================================================================
// ServerStats
// Purpose: Snapshot of everything recorded for one backend since start-up or the last reset.
// Notes:
//   recentCalls is ordered oldest first.
//==========================================================================================================
struct ServerStats {
    uint64_t totalCalls{0};
    uint64_t errors{0};
    uint64_t totalDurationMs{0};
    std::map<std::string, ToolUsage> tools;
    std::map<std::string, uint64_t> clients;
    std::deque<ToolCallRecord> recentCalls;
};

//==========================================================================================================
// ToolCallStats
// Purpose: Thread-safe recorder shared by every gateway worker.
// Notes:
//   - Guarded by its own mutex; never held while a backend is called.
//   - Keeps at most recentLimit records per backend, dropping the oldest first.
//==========================================================================================================
class ToolCallStats {
public:
    static constexpr std::size_t kDefaultRecentLimit = 50;

    explicit ToolCallStats(std::size_t recentLimit = kDefaultRecentLimit);
    ToolCallStats(const ToolCallStats&) = delete;
    ToolCallStats& operator=(const ToolCallStats&) = delete;

    void Record(const std::string& backendId, ToolCallRecord record);

    // Empty stats for a backend that has no calls recorded
    ServerStats Get(const std::string& backendId) const;

    void Reset(const std::string& backendId);

private:
    const std::size_t recentLimit;
    mutable std::mutex mutex;
    std::unordered_map<std::string, ServerStats> servers;
};

} // namespace mcpbridge
