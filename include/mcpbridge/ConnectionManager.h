//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.h
// Purpose: Connect/disconnect flows over the backend catalog and the connection registry
//==========================================================================================================

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcpbridge/BackendCatalog.h"
#include "mcpbridge/Client.h"
#include "mcpbridge/ConnectionRegistry.h"
#include "mcpbridge/Gateway.h"
#include "mcpbridge/ToolCallStats.h"

namespace mcpbridge {

//==========================================================================================================
// ConnectionManager
// Purpose: Owns the lifecycle of backend sessions.
// Notes:
//   - No lock is held while a backend is spawned, handshaken, called or shut down.
//   - A session is registered only after its handshake completed, and removed before it is shut down.
//   - A backend that exits on its own is evicted and its status becomes Error ("Backend process exited").
//   - Every tools/call that reaches a backend is recorded in the per-backend tool-call statistics.
//   - Catalog and registry are injected so tests can observe them.
//==========================================================================================================
class ConnectionManager : public IGatewayBackends {
public:
    //==========================================================================================================
    // Args:
    //   catalog: Configured backends and their status.
    //   registry: Live sessions.
    //   clientFactory: Creates session objects (a fake can be injected in tests).
    //   transportConfig: ProcessTransportFactory settings applied to every spawned backend.
    //==========================================================================================================
    ConnectionManager(BackendCatalog& catalog, ConnectionRegistry& registry,
                      std::shared_ptr<IClientFactory> clientFactory = std::make_shared<ClientFactory>(),
                      std::string transportConfig = "");
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    //==========================================================================================================
    // Connect
    // Purpose: Spawns and handshakes the backend, then registers it. Blocks until done.
    // Throws:
    //   errors::BridgeError: ServerNotFound, AlreadyConnected, or the session's failure (status -> Error).
    //==========================================================================================================
    void Connect(const std::string& id);

    //==========================================================================================================
    // Disconnect
    // Purpose: Removes the session from the registry, shuts it down and marks the backend Disconnected.
    // Throws:
    //   errors::BridgeError(ServerNotFound) when the backend has no live session.
    //==========================================================================================================
    void Disconnect(const std::string& id);

    //==========================================================================================================
    // ConnectEnabled
    // Purpose: Connects every enabled backend concurrently; individual failures are logged.
    // Returns:
    //   Number of backends connected by this call.
    //==========================================================================================================
    std::size_t ConnectEnabled();

    // Tools of every connected backend with names namespaced as "<backend name>.<tool>"
    std::vector<Tool> ListAllTools();

    // Disconnects every live session (daemon shutdown)
    void ShutdownAll();

    ////////////////////////////////////////// IGatewayBackends //////////////////////////////////////////
    bool HasBackend(const std::string& id) const override;
    bool IsConnected(const std::string& id) const override;

    //==========================================================================================================
    // ListTools
    // Purpose: Tools of one connected backend, stamped with backendId/backendName. A backend that
    //          announced tools/list_changed is refreshed first; a failed refresh falls back to the stored set.
    // Returns:
    //   Empty list when the backend is configured but not connected.
    // Throws:
    //   errors::BridgeError(ServerNotFound) for an unknown id.
    //==========================================================================================================
    std::vector<Tool> ListTools(const std::string& id) override;

    //==========================================================================================================
    // CallTool
    // Purpose: Routes the call to the backend's session and records its outcome and latency.
    // Args:
    //   client: Calling application, counted in the statistics.
    // Throws:
    //   errors::BridgeError: ServerNotFound (unknown or not connected), or the session's failure.
    //==========================================================================================================
    CallToolResult CallTool(const std::string& id, const std::string& name, const JSONValue& arguments,
                            const std::string& client) override;

    ////////////////////////////////////////// Statistics //////////////////////////////////////////
    // Calls recorded for a backend; stats survive disconnects until reset
    ServerStats GetToolCallStats(const std::string& id) const;
    void ResetToolCallStats(const std::string& id);

private:
    // One eviction thread; done is set when it has nothing left to do but exit
    struct Reaper {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void onBackendExited(const std::string& id, const std::weak_ptr<IClient>& weak);
    void evict(const std::string& id, const std::shared_ptr<IClient>& client);
    void pruneReapersLocked();

    BackendCatalog& catalog;
    ConnectionRegistry& registry;
    std::shared_ptr<IClientFactory> clientFactory;
    std::string transportConfig;

    ToolCallStats stats;

    std::mutex reaperMutex; // protects reapers and stopping
    std::vector<Reaper> reapers;
    bool stopping{false};

    friend struct ConnectionManagerTestHooks;
};

// Test-only view of eviction bookkeeping
struct ConnectionManagerTestHooks {
    static std::size_t reaperCount(ConnectionManager& m);
};

} // namespace mcpbridge
