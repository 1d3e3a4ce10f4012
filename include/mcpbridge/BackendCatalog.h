//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BackendCatalog.h
// Purpose: Configured backends, their connection status, and the bridge configuration file
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge {

enum class BackendStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

const char* backendStatusName(BackendStatus status);

//==========================================================================================================
// BackendConfig
// Purpose: One configured backend process.
// Fields:
//   id: Stable identifier used in gateway paths (/mcp/{id}).
//   name: Display name; also the namespace prefix in aggregated tool listings.
//   command/args/env: Launch description.
//   enabled: Connected by ConnectEnabled() at daemon start.
//==========================================================================================================
struct BackendConfig {
    std::string id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled{true};
};

struct BackendState {
    BackendConfig config;
    BackendStatus status{BackendStatus::Disconnected};
    std::optional<std::chrono::system_clock::time_point> lastConnected;
    std::optional<std::string> lastError;
};

//==========================================================================================================
// GatewaySettings
// Purpose: Listener settings for the HTTP gateway.
// Fields:
//   address: Bind address (default loopback).
//   port: Bind port; 0 picks an ephemeral port.
//   scheme: "http" or "https" (https requires certFile and keyFile, PEM).
//   workerThreads: Threads running backend calls off the I/O thread.
//==========================================================================================================
struct GatewaySettings {
    std::string address{"127.0.0.1"};
    uint16_t port{0};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;
    unsigned int workerThreads{4};
};

struct BridgeConfig {
    GatewaySettings gateway;
    std::vector<BackendConfig> backends;
};

//==========================================================================================================
// ParseBridgeConfig
// Purpose: Parses the bridge configuration JSON document.
// Throws:
//   errors::BridgeError(Protocol) for malformed JSON, wrong member types, a backend without id or
//   command, or duplicate backend ids.
//==========================================================================================================
BridgeConfig ParseBridgeConfig(const std::string& jsonText);

//==========================================================================================================
// LoadBridgeConfig
// Purpose: Reads and parses a configuration file.
// Throws:
//   errors::BridgeError(Io) when the file cannot be read; Protocol as for ParseBridgeConfig.
//==========================================================================================================
BridgeConfig LoadBridgeConfig(const std::string& path);

//==========================================================================================================
// BackendCatalog
// Purpose: Configured backends plus their status, guarded by a single mutex.
// Notes:
//   - The catalog lock is only ever held briefly; it is never held across process or network I/O.
//   - Lock order: catalog before registry. CommitConnected() is the one place both are held.
//==========================================================================================================
class BackendCatalog {
public:
    using StatusListener = std::function<void(const std::string& id, BackendStatus status)>;

    BackendCatalog() = default;
    explicit BackendCatalog(const std::vector<BackendConfig>& backends);
    BackendCatalog(const BackendCatalog&) = delete;
    BackendCatalog& operator=(const BackendCatalog&) = delete;

    // Adds a backend; false when the id is already configured
    bool Add(const BackendConfig& backend);

    std::optional<BackendState> Get(const std::string& id) const;
    std::vector<BackendState> List() const;
    bool Contains(const std::string& id) const;

    //==========================================================================================================
    // BeginConnect
    // Purpose: Atomically checks that id can be connected and marks it Connecting.
    // Returns:
    //   Copy of the launch configuration to use with no lock held.
    // Throws:
    //   errors::BridgeError(ServerNotFound) for an unknown id; AlreadyConnected when Connecting/Connected.
    //==========================================================================================================
    BackendConfig BeginConnect(const std::string& id);

    //==========================================================================================================
    // CommitConnected
    // Purpose: Under the catalog lock, runs commit (the registry insert) and marks the backend Connected
    //          with a fresh lastConnected timestamp when commit returns true.
    // Returns:
    //   The value returned by commit; false also when the backend was removed meanwhile.
    //==========================================================================================================
    bool CommitConnected(const std::string& id, const std::function<bool()>& commit);

    void MarkDisconnected(const std::string& id);
    void MarkError(const std::string& id, const std::string& message);

    void SetStatusListener(StatusListener listener);

private:
    BackendState* findLocked(const std::string& id);
    const BackendState* findLocked(const std::string& id) const;
    void setStatus(const std::string& id, BackendStatus status, const std::optional<std::string>& error);
    void notify(const std::string& id, BackendStatus status);

    mutable std::mutex mutex;
    std::vector<BackendState> backends; // configuration order
    StatusListener statusListener;
};

} // namespace mcpbridge
