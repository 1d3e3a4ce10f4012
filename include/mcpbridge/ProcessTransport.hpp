//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that spawns a backend process and speaks newline-delimited JSON-RPC over its stdio
//==========================================================================================================
#pragma once

#include "mcpbridge/Transport.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpbridge {

//==========================================================================================================
// ProcessLaunch
// Purpose: What to execute for a backend.
// Fields:
//   command: Executable name or path (resolved through PATH of the overlaid environment).
//   args: Arguments, not including argv[0].
//   env: Variables added to (or replacing those of) the gateway's own environment.
//==========================================================================================================
struct ProcessLaunch {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

//==========================================================================================================
// ProcessTransport
// Purpose: One child process; its stdin carries our requests, its stdout carries responses and
//          notifications (one JSON value per line), and its stderr is forwarded to the log.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(ProcessLaunch launch);
    virtual ~ProcessTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the child and starts the reader/writer/timeout loops.
    // Returns:
    //   Ready future; holds SpawnFailed when the executable cannot be launched.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Terminates the child (SIGTERM, then SIGKILL after the grace period), joins loops and fails every
    // outstanding request with TransportClosed. Idempotent.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::optional<int> GetProcessId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetClosedHandler(ClosedHandler handler) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Maximum time to wait for a single request/response pair.
    // Args:
    //   timeoutMs: Timeout in milliseconds (default 30000 or MCPBRIDGE_REQUEST_TIMEOUT_MS); 0 disables.
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    //==========================================================================================================
    // SetKillGraceMs
    // Purpose: Time between SIGTERM and SIGKILL during Close().
    //==========================================================================================================
    void SetKillGraceMs(uint64_t graceMs);

    void SetMaxLineLength(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct ProcessTransportTestHooks;
};

//==========================================================================================================
// ProcessTransportFactory
// Purpose: Creates process transports for a fixed launch description.
// Notes:
//   Config keys: timeout_ms, kill_grace_ms, max_line_bytes (separated by ';' or whitespace).
//==========================================================================================================
class ProcessTransportFactory : public ITransportFactory {
public:
    explicit ProcessTransportFactory(ProcessLaunch launch) : launch(std::move(launch)) {}
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;

private:
    ProcessLaunch launch;
};

// Test-only access to the line dispatcher without a live process
struct ProcessTransportTestHooks {
    static void drainLines(ProcessTransport& t, std::string& buffer);
    static void setConnected(ProcessTransport& t, bool v);
    static bool isConnected(const ProcessTransport& t);
    static std::size_t pendingCount(ProcessTransport& t);
    static std::vector<std::string> queuedLines(ProcessTransport& t);
};

} // namespace mcpbridge
