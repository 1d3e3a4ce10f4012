//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.cpp
// Purpose: Connect/disconnect flows, tool routing and process-exit eviction
//==========================================================================================================

#include "mcpbridge/ConnectionManager.h"

#include <chrono>
#include <future>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpbridge/ProcessTransport.hpp"
#include "mcpbridge/errors/Errors.h"
#include "mcpbridge/version.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

ConnectionManager::ConnectionManager(BackendCatalog& catalog, ConnectionRegistry& registry,
                                     std::shared_ptr<IClientFactory> clientFactory, std::string transportConfig)
    : catalog(catalog),
      registry(registry),
      clientFactory(std::move(clientFactory)),
      transportConfig(std::move(transportConfig)) {}

ConnectionManager::~ConnectionManager() {
    FUNC_SCOPE();
    ShutdownAll();
}

void ConnectionManager::Connect(const std::string& id) {
    FUNC_SCOPE();
    // Catalog lock is taken and released inside BeginConnect; nothing below holds it during I/O
    BackendConfig cfg = catalog.BeginConnect(id);
    LOG_INFO("Connecting backend '{}' ({} {} arg(s))", id, cfg.command, cfg.args.size());

    std::shared_ptr<IClient> client;
    try {
        client = std::shared_ptr<IClient>(
            clientFactory->CreateClient(Implementation{BRIDGE_IMPLEMENTATION_NAME, getVersionString()}));
        std::weak_ptr<IClient> weak = client;
        client->SetClosedHandler([this, id, weak]() { onBackendExited(id, weak); });
        ProcessTransportFactory factory(ProcessLaunch{cfg.command, cfg.args, cfg.env});
        client->Connect(factory.CreateTransport(transportConfig)).get();
    } catch (const std::exception& e) {
        LOG_ERROR("Backend '{}' failed to connect: {}", id, e.what());
        catalog.MarkError(id, e.what());
        throw;
    }

    Connection conn{client, client->ChildProcessId()};
    const bool committed = catalog.CommitConnected(id, [&]() { return registry.Insert(id, conn); });
    if (!committed) {
        client->Shutdown().get();
        catalog.MarkError(id, "Registration failed");
        throw BridgeError(ErrorKind::AlreadyConnected, fmt::format("Server '{}' is already registered", id));
    }
    // The backend may have exited between handshake and registration; its exit callback found nothing to evict
    if (!client->IsConnected()) {
        evict(id, client);
        throw BridgeError(ErrorKind::TransportClosed, fmt::format("Server '{}' exited during connect", id));
    }
    LOG_INFO("Backend '{}' connected (pid={}, {} tool(s))", id, conn.processId.value_or(-1), client->GetTools().size());
}

void ConnectionManager::Disconnect(const std::string& id) {
    FUNC_SCOPE();
    auto removed = registry.Remove(id);
    if (!removed.has_value()) {
        throw BridgeError(ErrorKind::ServerNotFound, fmt::format("Server '{}' is not connected", id));
    }
    removed->client->Shutdown().get();
    catalog.MarkDisconnected(id);
    LOG_INFO("Backend '{}' disconnected", id);
}

std::size_t ConnectionManager::ConnectEnabled() {
    FUNC_SCOPE();
    std::vector<std::pair<std::string, std::future<void>>> pending;
    for (const auto& state : catalog.List()) {
        if (!state.config.enabled) {
            continue;
        }
        const std::string id = state.config.id;
        pending.emplace_back(id, std::async(std::launch::async, [this, id]() { Connect(id); }));
    }
    std::size_t connected = 0;
    for (auto& [id, fut] : pending) {
        try {
            fut.get();
            ++connected;
        } catch (const std::exception& e) {
            LOG_WARN("Skipping backend '{}': {}", id, e.what());
        }
    }
    LOG_INFO("Connected {} of {} enabled backend(s)", connected, pending.size());
    return connected;
}

bool ConnectionManager::HasBackend(const std::string& id) const {
    return catalog.Contains(id);
}

bool ConnectionManager::IsConnected(const std::string& id) const {
    auto conn = registry.Get(id);
    return conn.has_value() && conn->client->IsConnected();
}

std::vector<Tool> ConnectionManager::ListTools(const std::string& id) {
    auto state = catalog.Get(id);
    if (!state.has_value()) {
        throw BridgeError(ErrorKind::ServerNotFound, fmt::format("No server found with id '{}'", id));
    }
    auto conn = registry.Get(id);
    if (!conn.has_value()) {
        return {};
    }
    std::vector<Tool> tools;
    if (conn->client->IsToolsStale()) {
        try {
            tools = conn->client->RefreshTools().get();
        } catch (const std::exception& e) {
            LOG_WARN("Refreshing tools of '{}' failed, using stored list: {}", id, e.what());
            tools = conn->client->GetTools();
        }
    } else {
        tools = conn->client->GetTools();
    }
    for (auto& tool : tools) {
        tool.backendId = id;
        tool.backendName = state->config.name;
    }
    return tools;
}

std::vector<Tool> ConnectionManager::ListAllTools() {
    std::vector<Tool> all;
    for (const auto& state : catalog.List()) {
        if (!registry.Contains(state.config.id)) {
            continue;
        }
        for (auto& tool : ListTools(state.config.id)) {
            tool.name = tool.backendName + "." + tool.name;
            all.push_back(std::move(tool));
        }
    }
    return all;
}

CallToolResult ConnectionManager::CallTool(const std::string& id, const std::string& name, const JSONValue& arguments,
                                           const std::string& client) {
    FUNC_SCOPE();
    auto conn = registry.Get(id);
    if (!conn.has_value()) {
        if (!catalog.Contains(id)) {
            throw BridgeError(ErrorKind::ServerNotFound, fmt::format("No server found with id '{}'", id));
        }
        throw BridgeError(ErrorKind::ServerNotFound, fmt::format("Server '{}' is not connected", id));
    }

    ToolCallRecord record;
    record.tool = name;
    record.client = client.empty() ? std::string("unknown") : client;
    const auto started = std::chrono::steady_clock::now();
    auto finish = [&]() {
        record.timestamp = std::chrono::system_clock::now();
        record.durationMs = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    };
    try {
        CallToolResult result = conn->client->CallTool(name, arguments).get();
        finish();
        if (result.isError.value_or(false)) {
            record.success = false;
            record.error = "Tool returned an error result";
        }
        stats.Record(id, std::move(record));
        return result;
    } catch (const std::exception& e) {
        finish();
        record.success = false;
        record.error = e.what();
        stats.Record(id, std::move(record));
        throw;
    }
}

ServerStats ConnectionManager::GetToolCallStats(const std::string& id) const {
    return stats.Get(id);
}

void ConnectionManager::ResetToolCallStats(const std::string& id) {
    stats.Reset(id);
    LOG_INFO("Tool-call statistics for '{}' reset", id);
}

void ConnectionManager::ShutdownAll() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(reaperMutex);
        stopping = true;
    }
    for (auto& [id, conn] : registry.Drain()) {
        conn.client->Shutdown().get();
        catalog.MarkDisconnected(id);
        LOG_INFO("Backend '{}' shut down", id);
    }
    std::vector<Reaper> toJoin;
    {
        std::lock_guard<std::mutex> lk(reaperMutex);
        toJoin.swap(reapers);
    }
    for (auto& r : toJoin) {
        if (r.thread.joinable()) {
            r.thread.join();
        }
    }
}

void ConnectionManager::onBackendExited(const std::string& id, const std::weak_ptr<IClient>& weak) {
    auto client = weak.lock();
    if (!client) {
        return;
    }
    LOG_WARN("Backend '{}' exited", id);
    // Runs on the transport reader thread, which must not shut its own transport down
    std::lock_guard<std::mutex> lk(reaperMutex);
    if (stopping) {
        return;
    }
    pruneReapersLocked();
    Reaper reaper;
    reaper.done = std::make_shared<std::atomic<bool>>(false);
    reaper.thread = std::thread([this, id, client, done = reaper.done]() {
        evict(id, client);
        done->store(true);
    });
    reapers.push_back(std::move(reaper));
}

void ConnectionManager::pruneReapersLocked() {
    for (auto it = reapers.begin(); it != reapers.end();) {
        if (!it->done->load()) {
            ++it;
            continue;
        }
        if (it->thread.joinable()) {
            it->thread.join();
        }
        it = reapers.erase(it);
    }
}

void ConnectionManager::evict(const std::string& id, const std::shared_ptr<IClient>& client) {
    auto removed = registry.RemoveIf(id, client.get());
    client->Shutdown().get();
    if (removed.has_value()) {
        catalog.MarkError(id, "Backend process exited");
        LOG_INFO("Backend '{}' evicted after process exit", id);
    }
}

////////////////////////////////////////// Test hooks //////////////////////////////////////////
std::size_t ConnectionManagerTestHooks::reaperCount(ConnectionManager& m) {
    std::lock_guard<std::mutex> lk(m.reaperMutex);
    return m.reapers.size();
}

} // namespace mcpbridge
