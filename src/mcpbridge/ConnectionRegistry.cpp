//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.cpp
// Purpose: Thread-safe table of live backend sessions
//==========================================================================================================

#include "mcpbridge/ConnectionRegistry.h"

#include <algorithm>
#include <mutex>

#include "logging/Logger.h"

namespace mcpbridge {

bool ConnectionRegistry::Insert(const std::string& id, Connection connection) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto [it, inserted] = connections.try_emplace(id, std::move(connection));
    if (!inserted) {
        LOG_WARN("ConnectionRegistry: refusing duplicate registration for '{}'", id);
        return false;
    }
    LOG_DEBUG("ConnectionRegistry: registered '{}' ({} live)", id, connections.size());
    return true;
}

std::optional<Connection> ConnectionRegistry::Remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = connections.find(id);
    if (it == connections.end()) {
        return std::nullopt;
    }
    Connection out = std::move(it->second);
    connections.erase(it);
    LOG_DEBUG("ConnectionRegistry: removed '{}' ({} live)", id, connections.size());
    return out;
}

std::optional<Connection> ConnectionRegistry::RemoveIf(const std::string& id, const IClient* client) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = connections.find(id);
    if (it == connections.end() || it->second.client.get() != client) {
        return std::nullopt;
    }
    Connection out = std::move(it->second);
    connections.erase(it);
    return out;
}

std::optional<Connection> ConnectionRegistry::Get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = connections.find(id);
    if (it == connections.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ConnectionRegistry::Contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return connections.find(id) != connections.end();
}

std::vector<std::string> ConnectionRegistry::Ids() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        ids.reserve(connections.size());
        for (const auto& [id, conn] : connections) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t ConnectionRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return connections.size();
}

std::vector<std::pair<std::string, Connection>> ConnectionRegistry::Drain() {
    std::vector<std::pair<std::string, Connection>> out;
    std::unique_lock<std::shared_mutex> lock(mutex);
    out.reserve(connections.size());
    for (auto& [id, conn] : connections) {
        out.emplace_back(id, std::move(conn));
    }
    connections.clear();
    return out;
}

} // namespace mcpbridge
