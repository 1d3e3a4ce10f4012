//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.h
// Purpose: Thread-safe table of live backend sessions keyed by backend id
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpbridge/Client.h"

namespace mcpbridge {

//==========================================================================================================
// Connection
// Purpose: One live backend session.
// Fields:
//   client: Session whose handshake has completed.
//   processId: Backend OS process id captured at registration (for orphan cleanup and diagnostics).
//==========================================================================================================
struct Connection {
    std::shared_ptr<IClient> client;
    std::optional<int> processId;
};

//==========================================================================================================
// ConnectionRegistry
// Purpose: Single source of truth for which backends are connected.
// Notes:
//   - Readers take a shared lock; Insert/Remove take it exclusively and never perform I/O under it.
//   - Entries are only inserted after a completed handshake; removal hands the session back to the
//     caller, which is responsible for shutting it down.
//   - Lock order: BackendCatalog before ConnectionRegistry, never the reverse.
//==========================================================================================================
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    //==========================================================================================================
    // Insert
    // Purpose: Registers a live session.
    // Returns:
    //   false when the id is already present (an existing entry is never overwritten).
    //==========================================================================================================
    bool Insert(const std::string& id, Connection connection);

    //==========================================================================================================
    // Remove
    // Purpose: Removes and returns the session for id, or std::nullopt when absent.
    //==========================================================================================================
    std::optional<Connection> Remove(const std::string& id);

    //==========================================================================================================
    // RemoveIf
    // Purpose: Removes the entry only when it still refers to the given client (process-exit eviction
    //          must not remove a newer session registered under the same id).
    //==========================================================================================================
    std::optional<Connection> RemoveIf(const std::string& id, const IClient* client);

    std::optional<Connection> Get(const std::string& id) const;
    bool Contains(const std::string& id) const;
    std::vector<std::string> Ids() const;
    std::size_t Size() const;

    // Removes every entry (used on daemon shutdown)
    std::vector<std::pair<std::string, Connection>> Drain();

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, Connection> connections;
};

} // namespace mcpbridge
