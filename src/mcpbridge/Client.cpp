//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: MCP client session implementation
//==========================================================================================================
#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpbridge/Client.h"
#include "mcpbridge/Protocol.h"
#include "mcpbridge/async/FutureAwaitable.h"
#include "mcpbridge/async/Task.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

// Client implementation
class Client::Impl {
public:
    Implementation clientInfo;

    mutable std::mutex transportMutex; // protects transport installation
    std::unique_ptr<ITransport> transport;
    std::atomic<bool> connected{false};
    std::atomic<bool> shutdown{false};
    std::atomic<bool> toolsStale{false};

    mutable std::mutex stateMutex; // protects tools, serverCapabilities, serverInfo, listeners
    std::vector<Tool> tools;
    ServerCapabilities serverCapabilities;
    Implementation serverInfo;
    std::string negotiatedVersion;
    IClient::ToolsChangedListener toolsChangedListener;
    IClient::ClosedHandler closedHandler;

    explicit Impl(const Implementation& info) : clientInfo(info) {}

    ~Impl() {
        if (transport) {
            transport->Close().get();
        }
    }

    // Installs the transport and wires inbound handlers; fails once shut down
    ITransport* installTransport(std::unique_ptr<ITransport> t) {
        std::lock_guard<std::mutex> lk(transportMutex);
        if (shutdown.load()) {
            throw BridgeError(ErrorKind::TransportClosed, "Client has been shut down");
        }
        if (transport) {
            throw BridgeError(ErrorKind::AlreadyConnected, "Client already has a transport");
        }
        transport = std::move(t);
        transport->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
            this->onNotification(std::move(n));
        });
        transport->SetRequestHandler([this](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
            return this->onRequest(req);
        });
        transport->SetErrorHandler([this](const std::string& err) {
            LOG_WARN("Client[{}]: transport error: {}", this->transport->GetSessionId(), err);
        });
        transport->SetClosedHandler([this]() { this->onPeerClosed(); });
        return transport.get();
    }

    // Transport of a live session; TransportClosed otherwise
    ITransport* requireTransport() const {
        if (shutdown.load()) {
            throw BridgeError(ErrorKind::TransportClosed, "Client has been shut down");
        }
        std::lock_guard<std::mutex> lk(transportMutex);
        if (!transport || !connected.load()) {
            throw BridgeError(ErrorKind::TransportClosed, "Client is not connected");
        }
        return transport.get();
    }

    void closeTransport() {
        ITransport* t = nullptr;
        {
            std::lock_guard<std::mutex> lk(transportMutex);
            t = transport.get();
        }
        connected = false;
        if (t) {
            t->Close().get();
        }
    }

    void onNotification(std::unique_ptr<JSONRPCNotification> n) {
        if (n->method == Methods::ToolListChanged) {
            toolsStale = true;
            IClient::ToolsChangedListener listener;
            {
                std::lock_guard<std::mutex> lk(stateMutex);
                LOG_INFO("Client: backend '{}' reported a changed tool list", serverInfo.name);
                listener = toolsChangedListener;
            }
            if (listener) {
                listener();
            }
            return;
        }
        LOG_DEBUG("Client: ignoring notification {}", n->method);
    }

    std::unique_ptr<JSONRPCResponse> onRequest(const JSONRPCRequest& req) {
        if (req.method == Methods::Ping) {
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        }
        LOG_DEBUG("Client: unsupported backend request {}", req.method);
        return nullptr; // transport answers method-not-found
    }

    void onPeerClosed() {
        connected = false;
        IClient::ClosedHandler handler;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            handler = closedHandler;
        }
        if (handler && !shutdown.load()) {
            handler();
        }
    }

    std::unique_ptr<JSONRPCRequest> makeInitializeRequest() const {
        auto request = std::make_unique<JSONRPCRequest>();
        request->method = Methods::Initialize;
        JSONValue::Object paramsObj;
        paramsObj["protocolVersion"] = std::make_shared<JSONValue>(std::string(CLIENT_PROTOCOL_VERSION));
        paramsObj["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        JSONValue::Object ci;
        ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
        ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
        paramsObj["clientInfo"] = std::make_shared<JSONValue>(ci);
        request->params = JSONValue{paramsObj};
        return request;
    }

    void parseInitializeResult(const JSONValue& result) {
        const auto& obj = std::get<JSONValue::Object>(result.value);
        ServerCapabilities caps;
        auto capsIt = obj.find("capabilities");
        if (capsIt != obj.end() && capsIt->second->IsObject()) {
            const auto& capsObj = std::get<JSONValue::Object>(capsIt->second->value);
            auto readFlag = [](const JSONValue& v, const char* key) {
                const JSONValue* f = v.Find(key);
                return f != nullptr && std::holds_alternative<bool>(f->value) && std::get<bool>(f->value);
            };
            auto toolsIt = capsObj.find("tools");
            if (toolsIt != capsObj.end()) {
                caps.tools = ToolsCapability{readFlag(*toolsIt->second, "listChanged")};
            }
            auto resourcesIt = capsObj.find("resources");
            if (resourcesIt != capsObj.end()) {
                caps.resources = ResourcesCapability{readFlag(*resourcesIt->second, "subscribe"),
                                                     readFlag(*resourcesIt->second, "listChanged")};
            }
            auto promptsIt = capsObj.find("prompts");
            if (promptsIt != capsObj.end()) {
                caps.prompts = PromptsCapability{readFlag(*promptsIt->second, "listChanged")};
            }
            if (capsObj.find("logging") != capsObj.end()) {
                caps.logging = LoggingCapability{};
            }
            auto expIt = capsObj.find("experimental");
            if (expIt != capsObj.end() && expIt->second->IsObject()) {
                for (const auto& [k, v] : std::get<JSONValue::Object>(expIt->second->value)) {
                    caps.experimental[k] = *v;
                }
            }
        }

        Implementation info;
        if (const JSONValue* si = result.Find("serverInfo")) {
            info.name = si->FindString("name").value_or("");
            info.version = si->FindString("version").value_or("");
        }

        std::lock_guard<std::mutex> lk(stateMutex);
        serverCapabilities = std::move(caps);
        serverInfo = std::move(info);
        negotiatedVersion = result.FindString("protocolVersion").value_or("");
    }

    static std::vector<Tool> parseToolsResult(const JSONValue& result) {
        const JSONValue* list = result.Find("tools");
        if (list == nullptr || !list->IsArray()) {
            throw BridgeError(ErrorKind::Protocol, "Invalid tools/list result: missing tools array");
        }
        std::vector<Tool> out;
        for (const auto& entry : std::get<JSONValue::Array>(list->value)) {
            auto name = entry ? entry->FindString("name") : std::nullopt;
            if (!name.has_value()) {
                LOG_WARN("Client: skipping tools/list entry without a string name");
                continue;
            }
            Tool tool;
            tool.name = std::move(name.value());
            tool.title = entry->FindString("title");
            tool.description = entry->FindString("description");
            if (const JSONValue* schema = entry->Find("inputSchema")) {
                tool.inputSchema = *schema;
            } else {
                JSONValue::Object schemaObj;
                schemaObj["type"] = std::make_shared<JSONValue>(std::string("object"));
                tool.inputSchema = JSONValue{schemaObj};
            }
            out.push_back(std::move(tool));
        }
        return out;
    }

    static CallToolResult parseCallToolResult(const JSONValue& result) {
        if (!result.IsObject()) {
            throw BridgeError(ErrorKind::Protocol, "Invalid tools/call result: not an object");
        }
        const JSONValue* content = result.Find("content");
        if (content == nullptr || !content->IsArray()) {
            throw BridgeError(ErrorKind::Protocol, "Invalid tools/call result: missing content array");
        }
        CallToolResult out;
        for (const auto& item : std::get<JSONValue::Array>(content->value)) {
            out.content.push_back(item ? *item : JSONValue{});
        }
        if (const JSONValue* isError = result.Find("isError")) {
            if (!std::holds_alternative<bool>(isError->value)) {
                throw BridgeError(ErrorKind::Protocol, "Invalid tools/call result: isError is not a boolean");
            }
            out.isError = std::get<bool>(isError->value);
        }
        return out;
    }

    // Validates a tools/list response and replaces the stored tool set
    std::vector<Tool> acceptToolsResponse(const JSONRPCResponse& response) {
        if (response.IsError()) {
            throw errors::protocolErrorFromResponse(Methods::ListTools, response);
        }
        if (!response.result.has_value()) {
            throw BridgeError(ErrorKind::Protocol, "No result in tools/list response");
        }
        auto fresh = parseToolsResult(response.result.value());
        LOG_DEBUG("Client: tools/list returned {} tool(s)", fresh.size());
        std::lock_guard<std::mutex> lk(stateMutex);
        tools = fresh;
        toolsStale = false;
        return fresh;
    }
};

namespace {

std::unique_ptr<JSONRPCRequest> makeListToolsRequest() {
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::ListTools;
    request->params = JSONValue{JSONValue::Object{}};
    return request;
}

// Coroutine helpers take the Impl by shared_ptr so the frame keeps it alive across resumes
async::Task<void> coConnect(std::shared_ptr<Client::Impl> self, std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    ITransport* t = self->installTransport(std::move(transport));
    try {
        co_await async::makeFutureAwaitable(t->Start());

        auto initResponse = co_await async::makeFutureAwaitable(t->SendRequest(self->makeInitializeRequest()));
        if (initResponse->IsError()) {
            throw errors::protocolErrorFromResponse(Methods::Initialize, *initResponse);
        }
        if (!initResponse->result.has_value() || !initResponse->result->IsObject()) {
            throw BridgeError(ErrorKind::Protocol, "No result in initialize response");
        }
        self->parseInitializeResult(initResponse->result.value());

        co_await async::makeFutureAwaitable(
            t->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized)));

        auto listResponse = co_await async::makeFutureAwaitable(t->SendRequest(makeListToolsRequest()));
        (void)self->acceptToolsResponse(*listResponse);
        if (self->shutdown.load()) {
            throw BridgeError(ErrorKind::TransportClosed, "Client has been shut down");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Client: connect failed: {}", e.what());
        self->closeTransport();
        throw;
    }
    self->connected = true;
    {
        std::lock_guard<std::mutex> lk(self->stateMutex);
        LOG_INFO("Client: session {} ready with '{}' {} (protocol {})", t->GetSessionId(),
                 self->serverInfo.name, self->serverInfo.version, self->negotiatedVersion);
    }
    co_return;
}

async::Task<std::vector<Tool>> coRefreshTools(std::shared_ptr<Client::Impl> self) {
    FUNC_SCOPE();
    ITransport* t = self->requireTransport();
    auto response = co_await async::makeFutureAwaitable(t->SendRequest(makeListToolsRequest()));
    co_return self->acceptToolsResponse(*response);
}

async::Task<CallToolResult> coCallTool(std::shared_ptr<Client::Impl> self, std::string name, JSONValue arguments) {
    FUNC_SCOPE();
    ITransport* t = self->requireTransport();
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::CallTool;
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(name);
    paramsObj["arguments"] = std::make_shared<JSONValue>(std::move(arguments));
    request->params = JSONValue{paramsObj};
    LOG_DEBUG("Client: calling tool {}", name);
    auto response = co_await async::makeFutureAwaitable(t->SendRequest(std::move(request)));
    if (response->IsError()) {
        throw errors::protocolErrorFromResponse(Methods::CallTool, *response);
    }
    if (!response->result.has_value()) {
        throw BridgeError(ErrorKind::Protocol, "No result in tools/call response");
    }
    co_return Client::Impl::parseCallToolResult(response->result.value());
}

} // namespace

Client::Client(const Implementation& clientInfo)
    : pImpl(std::make_shared<Impl>(clientInfo)) {
    FUNC_SCOPE();
}

Client::~Client() {
    FUNC_SCOPE();
    Shutdown().get();
}

std::future<void> Client::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    return coConnect(pImpl, std::move(transport)).toFuture();
}

std::future<void> Client::ConnectProcess(const ProcessLaunch& launch, const std::string& transportConfig) {
    FUNC_SCOPE();
    ProcessTransportFactory factory(launch);
    return Connect(factory.CreateTransport(transportConfig));
}

std::future<void> Client::Shutdown() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->shutdown.exchange(true)) {
        done.set_value();
        return fut;
    }
    LOG_DEBUG("Client: shutting down");
    pImpl->closeTransport();
    done.set_value();
    return fut;
}

bool Client::IsConnected() const {
    return pImpl->connected.load() && !pImpl->shutdown.load();
}

std::future<std::vector<Tool>> Client::RefreshTools() {
    FUNC_SCOPE();
    return coRefreshTools(pImpl).toFuture();
}

std::future<CallToolResult> Client::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    return coCallTool(pImpl, name, arguments).toFuture();
}

std::vector<Tool> Client::GetTools() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->tools;
}

ServerCapabilities Client::GetServerCapabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->serverCapabilities;
}

Implementation Client::GetServerInfo() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->serverInfo;
}

std::optional<int> Client::ChildProcessId() const {
    std::lock_guard<std::mutex> lk(pImpl->transportMutex);
    if (!pImpl->transport) {
        return std::nullopt;
    }
    return pImpl->transport->GetProcessId();
}

bool Client::IsToolsStale() const {
    return pImpl->toolsStale.load();
}

void Client::SetToolsChangedListener(ToolsChangedListener listener) {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    pImpl->toolsChangedListener = std::move(listener);
}

void Client::SetClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    pImpl->closedHandler = std::move(handler);
}

std::unique_ptr<IClient> ClientFactory::CreateClient(const Implementation& clientInfo) {
    return std::make_unique<Client>(clientInfo);
}

} // namespace mcpbridge
