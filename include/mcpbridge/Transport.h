//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - abstract JSON-RPC channel to one backend
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <optional>
#include <cstdint>

namespace mcpbridge {

class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: Duplex JSON-RPC channel to a single backend.
// Notes:
//   - Failures are delivered as errors::BridgeError exceptions stored in the returned futures
//     (TransportClosed, Timeout, Protocol, SpawnFailed), so future.get() rethrows them.
//   - Implementations must allow concurrent SendRequest calls; correlation is by id only.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loops (and, for process transports, the backend process).
    // Returns:
    //   A future that completes when the transport is running, or holds SpawnFailed/Io.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport, terminates the peer if owned, and fails outstanding requests with
    // TransportClosed. Idempotent.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics and log tagging.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    //==========================================================================================================
    // Returns the OS process id of the peer when the transport owns a child process.
    // Returns:
    //   Process id, or std::nullopt when there is no live child.
    //==========================================================================================================
    virtual std::optional<int> GetProcessId() const { return std::nullopt; }

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request. The transport assigns a fresh id, overriding any id on the request.
    // Args:
    //   request: Request to send (method and params are used as given).
    // Returns:
    //   Future resolving to the matching response, or holding Timeout/TransportClosed/Protocol.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing once the notification has been written, or holding TransportClosed.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    //==========================================================================================================
    // Registers a handler for peer-initiated requests; the transport writes back the returned response.
    // Without a handler, peer requests are answered with method-not-found.
    //==========================================================================================================
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    //==========================================================================================================
    // Registers a callback fired once when the peer goes away on its own (EOF on its output).
    // Not fired for a local Close(). Runs on the transport's reader thread; it must not call Close()
    // synchronously.
    //==========================================================================================================
    using ClosedHandler = std::function<void()>;
    virtual void SetClosedHandler(ClosedHandler handler) = 0;
};

//==========================================================================================================
// ITransportFactory
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific "key=value;key=value" settings.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace mcpbridge
