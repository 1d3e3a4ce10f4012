//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BackendCatalog.cpp
// Purpose: Backend catalog state transitions and configuration file parsing
//==========================================================================================================

#include "mcpbridge/BackendCatalog.h"

#include <fstream>
#include <set>
#include <sstream>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpbridge/JSONRPCTypes.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

const char* backendStatusName(BackendStatus status) {
    switch (status) {
        case BackendStatus::Disconnected: return "disconnected";
        case BackendStatus::Connecting: return "connecting";
        case BackendStatus::Connected: return "connected";
        case BackendStatus::Error: return "error";
    }
    return "unknown";
}

////////////////////////////////////////// Configuration parsing //////////////////////////////////////////
namespace {

[[noreturn]] void configError(const std::string& msg) {
    throw BridgeError(ErrorKind::Protocol, "Invalid configuration: " + msg);
}

std::string readString(const JSONValue& obj, const std::string& key, const std::string& where,
                       const std::string& fallback) {
    const JSONValue* v = obj.Find(key);
    if (v == nullptr || v->IsNull()) {
        return fallback;
    }
    if (!v->IsString()) {
        configError(fmt::format("{}.{} must be a string", where, key));
    }
    return std::get<std::string>(v->value);
}

int64_t readInt(const JSONValue& obj, const std::string& key, const std::string& where, int64_t fallback) {
    const JSONValue* v = obj.Find(key);
    if (v == nullptr || v->IsNull()) {
        return fallback;
    }
    if (!std::holds_alternative<int64_t>(v->value)) {
        configError(fmt::format("{}.{} must be an integer", where, key));
    }
    return std::get<int64_t>(v->value);
}

GatewaySettings parseGateway(const JSONValue& g) {
    if (!g.IsObject()) {
        configError("gateway must be an object");
    }
    GatewaySettings s;
    s.address = readString(g, "address", "gateway", s.address);
    int64_t port = readInt(g, "port", "gateway", s.port);
    if (port < 0 || port > 65535) {
        configError(fmt::format("gateway.port out of range: {}", port));
    }
    s.port = static_cast<uint16_t>(port);
    s.scheme = readString(g, "scheme", "gateway", s.scheme);
    if (s.scheme != "http" && s.scheme != "https") {
        configError("gateway.scheme must be \"http\" or \"https\"");
    }
    s.certFile = readString(g, "certFile", "gateway", "");
    s.keyFile = readString(g, "keyFile", "gateway", "");
    if (s.scheme == "https" && (s.certFile.empty() || s.keyFile.empty())) {
        configError("gateway.scheme https requires certFile and keyFile");
    }
    int64_t workers = readInt(g, "workerThreads", "gateway", s.workerThreads);
    if (workers < 1 || workers > 256) {
        configError(fmt::format("gateway.workerThreads out of range: {}", workers));
    }
    s.workerThreads = static_cast<unsigned int>(workers);
    return s;
}

BackendConfig parseBackend(const JSONValue& b, std::size_t index) {
    const std::string where = fmt::format("backends[{}]", index);
    if (!b.IsObject()) {
        configError(where + " must be an object");
    }
    BackendConfig cfg;
    cfg.id = readString(b, "id", where, "");
    if (cfg.id.empty()) {
        configError(where + " is missing id");
    }
    cfg.command = readString(b, "command", where, "");
    if (cfg.command.empty()) {
        configError(fmt::format("backend '{}' is missing command", cfg.id));
    }
    cfg.name = readString(b, "name", where, cfg.id);
    if (const JSONValue* args = b.Find("args")) {
        if (!args->IsArray()) {
            configError(where + ".args must be an array");
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->IsString()) {
                configError(where + ".args entries must be strings");
            }
            cfg.args.push_back(std::get<std::string>(a->value));
        }
    }
    if (const JSONValue* env = b.Find("env")) {
        if (!env->IsObject()) {
            configError(where + ".env must be an object");
        }
        for (const auto& [k, v] : std::get<JSONValue::Object>(env->value)) {
            if (!v || !v->IsString()) {
                configError(fmt::format("{}.env.{} must be a string", where, k));
            }
            cfg.env[k] = std::get<std::string>(v->value);
        }
    }
    if (const JSONValue* enabled = b.Find("enabled")) {
        if (!std::holds_alternative<bool>(enabled->value)) {
            configError(where + ".enabled must be a boolean");
        }
        cfg.enabled = std::get<bool>(enabled->value);
    }
    return cfg;
}

} // namespace

BridgeConfig ParseBridgeConfig(const std::string& jsonText) {
    JSONValue doc;
    try {
        doc = ParseJSON(jsonText);
    } catch (const std::runtime_error& e) {
        configError(e.what());
    }
    if (!doc.IsObject()) {
        configError("top level must be an object");
    }
    BridgeConfig config;
    if (const JSONValue* g = doc.Find("gateway")) {
        config.gateway = parseGateway(*g);
    }
    if (const JSONValue* list = doc.Find("backends")) {
        if (!list->IsArray()) {
            configError("backends must be an array");
        }
        std::set<std::string> seen;
        const auto& arr = std::get<JSONValue::Array>(list->value);
        for (std::size_t i = 0; i < arr.size(); ++i) {
            auto cfg = parseBackend(arr[i] ? *arr[i] : JSONValue{}, i);
            if (!seen.insert(cfg.id).second) {
                configError(fmt::format("duplicate backend id '{}'", cfg.id));
            }
            config.backends.push_back(std::move(cfg));
        }
    }
    return config;
}

BridgeConfig LoadBridgeConfig(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw BridgeError(ErrorKind::Io, fmt::format("Cannot open configuration file '{}'", path));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw BridgeError(ErrorKind::Io, fmt::format("Failed reading configuration file '{}'", path));
    }
    auto config = ParseBridgeConfig(ss.str());
    LOG_INFO("Loaded configuration '{}' ({} backend(s))", path, config.backends.size());
    return config;
}

////////////////////////////////////////// BackendCatalog //////////////////////////////////////////
BackendCatalog::BackendCatalog(const std::vector<BackendConfig>& initial) {
    for (const auto& b : initial) {
        (void)Add(b);
    }
}

bool BackendCatalog::Add(const BackendConfig& backend) {
    std::lock_guard<std::mutex> lock(mutex);
    if (findLocked(backend.id) != nullptr) {
        LOG_WARN("BackendCatalog: duplicate backend id '{}' ignored", backend.id);
        return false;
    }
    BackendState state;
    state.config = backend;
    if (state.config.name.empty()) {
        state.config.name = backend.id;
    }
    backends.push_back(std::move(state));
    return true;
}

BackendState* BackendCatalog::findLocked(const std::string& id) {
    for (auto& b : backends) {
        if (b.config.id == id) {
            return &b;
        }
    }
    return nullptr;
}

const BackendState* BackendCatalog::findLocked(const std::string& id) const {
    for (const auto& b : backends) {
        if (b.config.id == id) {
            return &b;
        }
    }
    return nullptr;
}

std::optional<BackendState> BackendCatalog::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const BackendState* b = findLocked(id);
    if (b == nullptr) {
        return std::nullopt;
    }
    return *b;
}

std::vector<BackendState> BackendCatalog::List() const {
    std::lock_guard<std::mutex> lock(mutex);
    return backends;
}

bool BackendCatalog::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    return findLocked(id) != nullptr;
}

BackendConfig BackendCatalog::BeginConnect(const std::string& id) {
    BackendConfig launch;
    {
        std::lock_guard<std::mutex> lock(mutex);
        BackendState* b = findLocked(id);
        if (b == nullptr) {
            throw BridgeError(ErrorKind::ServerNotFound, fmt::format("No server found with id '{}'", id));
        }
        if (b->status == BackendStatus::Connected || b->status == BackendStatus::Connecting) {
            throw BridgeError(ErrorKind::AlreadyConnected,
                              fmt::format("Server '{}' is already {}", id, backendStatusName(b->status)));
        }
        b->status = BackendStatus::Connecting;
        b->lastError.reset();
        launch = b->config;
    }
    notify(id, BackendStatus::Connecting);
    return launch;
}

bool BackendCatalog::CommitConnected(const std::string& id, const std::function<bool()>& commit) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        BackendState* b = findLocked(id);
        if (b == nullptr || !commit()) {
            return false;
        }
        b->status = BackendStatus::Connected;
        b->lastConnected = std::chrono::system_clock::now();
        b->lastError.reset();
    }
    notify(id, BackendStatus::Connected);
    return true;
}

void BackendCatalog::MarkDisconnected(const std::string& id) {
    setStatus(id, BackendStatus::Disconnected, std::nullopt);
}

void BackendCatalog::MarkError(const std::string& id, const std::string& message) {
    setStatus(id, BackendStatus::Error, message);
}

void BackendCatalog::setStatus(const std::string& id, BackendStatus status, const std::optional<std::string>& error) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        BackendState* b = findLocked(id);
        if (b == nullptr) {
            return;
        }
        b->status = status;
        b->lastError = error;
    }
    notify(id, status);
}

void BackendCatalog::SetStatusListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex);
    statusListener = std::move(listener);
}

void BackendCatalog::notify(const std::string& id, BackendStatus status) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex);
        listener = statusListener;
    }
    LOG_DEBUG("BackendCatalog: '{}' is now {}", id, backendStatusName(status));
    if (listener) {
        listener(id, status);
    }
}

} // namespace mcpbridge
