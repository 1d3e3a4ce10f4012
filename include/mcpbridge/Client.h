//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: MCP client session towards one backend - handshake, tool discovery and tool calls
//==========================================================================================================

#pragma once

#include "Transport.h"
#include "JSONRPCTypes.h"
#include "Protocol.h"
#include "ProcessTransport.hpp"
#include <memory>
#include <string>
#include <vector>
#include <future>
#include <functional>
#include <optional>

namespace mcpbridge {

//==========================================================================================================
// IClient
// Purpose: One MCP protocol session layered on a transport.
// Notes:
//   - Failures are errors::BridgeError exceptions stored in the returned futures.
//   - After Shutdown() every operation fails with TransportClosed.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport and runs the session handshake in order: initialize, notifications/initialized,
    // tools/list. The session is usable only after the returned future completes.
    // Args:
    //   transport: The transport implementation to use (takes ownership).
    // Returns:
    //   A future that completes when the handshake and first tool listing are done, or holds the first
    //   failure (SpawnFailed, Timeout, TransportClosed, Protocol). On failure the transport is closed.
    //==========================================================================================================
    virtual std::future<void> Connect(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Shuts the session down and closes the transport. Idempotent.
    //==========================================================================================================
    virtual std::future<void> Shutdown() = 0;

    //==========================================================================================================
    // True once the handshake has completed and until shutdown or peer exit.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    ////////////////////////////////////////// Tool operations /////////////////////////////////////////////////
    //==========================================================================================================
    // Re-issues tools/list and replaces the stored tool set.
    // Returns:
    //   A future with the new tool list.
    //==========================================================================================================
    virtual std::future<std::vector<Tool>> RefreshTools() = 0;

    //==========================================================================================================
    // Invokes a backend tool by name.
    // Args:
    //   name: The tool name as reported by the backend.
    //   arguments: JSON object with the tool parameters.
    // Returns:
    //   A future with the parsed result; a backend error response is a Protocol failure.
    //==========================================================================================================
    virtual std::future<CallToolResult> CallTool(const std::string& name,
                                                 const JSONValue& arguments) = 0;

    // Snapshot of the tools stored by the last successful listing
    virtual std::vector<Tool> GetTools() const = 0;

    virtual ServerCapabilities GetServerCapabilities() const = 0;
    virtual Implementation GetServerInfo() const = 0;

    //==========================================================================================================
    // Returns the OS process id of the backend when the transport owns one.
    //==========================================================================================================
    virtual std::optional<int> ChildProcessId() const = 0;

    ////////////////////////////////////////// Change tracking /////////////////////////////////////////////////
    //==========================================================================================================
    // True after the backend sent notifications/tools/list_changed and before the next RefreshTools().
    //==========================================================================================================
    virtual bool IsToolsStale() const = 0;

    using ToolsChangedListener = std::function<void()>;
    virtual void SetToolsChangedListener(ToolsChangedListener listener) = 0;

    //==========================================================================================================
    // Registers a callback fired once when the backend goes away on its own. Runs on the transport's
    // reader thread; the callback must not call Shutdown() synchronously.
    //==========================================================================================================
    using ClosedHandler = std::function<void()>;
    virtual void SetClosedHandler(ClosedHandler handler) = 0;
};

//==========================================================================================================
// Client
// Purpose: Standard IClient implementation.
//==========================================================================================================
class Client : public IClient {
public:
    explicit Client(const Implementation& clientInfo);
    virtual ~Client();

    std::future<void> Connect(std::unique_ptr<ITransport> transport) override;

    //==========================================================================================================
    // ConnectProcess
    // Purpose: Spawns a backend through ProcessTransportFactory and runs Connect() on it.
    // Args:
    //   launch: Executable, arguments and environment overlay.
    //   transportConfig: Optional ProcessTransportFactory settings (e.g. "timeout_ms=5000").
    //==========================================================================================================
    std::future<void> ConnectProcess(const ProcessLaunch& launch, const std::string& transportConfig = "");

    std::future<void> Shutdown() override;
    bool IsConnected() const override;

    std::future<std::vector<Tool>> RefreshTools() override;
    std::future<CallToolResult> CallTool(const std::string& name,
                                         const JSONValue& arguments) override;
    std::vector<Tool> GetTools() const override;
    ServerCapabilities GetServerCapabilities() const override;
    Implementation GetServerInfo() const override;
    std::optional<int> ChildProcessId() const override;

    bool IsToolsStale() const override;
    void SetToolsChangedListener(ToolsChangedListener listener) override;
    void SetClosedHandler(ClosedHandler handler) override;

    class Impl;

private:
    // Shared with in-flight coroutines so a late resume never touches freed state
    std::shared_ptr<Impl> pImpl;
};

// Client factory interface
class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<IClient> CreateClient(const Implementation& clientInfo) = 0;
};

// Standard client factory
class ClientFactory : public IClientFactory {
public:
    std::unique_ptr<IClient> CreateClient(const Implementation& clientInfo) override;
};

} // namespace mcpbridge
