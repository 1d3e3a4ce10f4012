//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process transport: spawn, newline framing, request correlation and teardown
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpbridge/JSONRPCTypes.h"
#include "mcpbridge/ProcessTransport.hpp"
#include "mcpbridge/errors/Errors.h"

extern char** environ;

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Writes to a dead child must surface as EPIPE instead of killing the gateway
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::exception_ptr makeError(ErrorKind kind, const std::string& message) {
    return std::make_exception_ptr(BridgeError(kind, message));
}

std::string baseName(const std::string& path) {
    auto slash = path.find_last_of('/');
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

std::atomic<unsigned int> gSessionCounter{0u};

} // namespace

class ProcessTransport::Impl {
public:
    struct OutboundLine {
        std::string data;
        std::string requestKey; // empty for notifications and replies
        std::optional<std::promise<void>> written;
    };

    ProcessLaunch launch;
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> peerClosedFired{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::ClosedHandler closedHandler;
    std::thread readerThread;
    std::thread writerThread;
    std::thread timeoutThread;

    std::mutex requestMutex; // protects pendingRequests and requestDeadlines
    std::condition_variable cvTimeout;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requestDeadlines;
    std::atomic<unsigned int> requestCounter{0u};

    std::mutex writeMutex; // protects writeQueue
    std::condition_variable cvWrite;
    std::deque<OutboundLine> writeQueue;

    std::atomic<int> childPid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds killGrace{2000};
    std::size_t maxLineLength{8 * 1024 * 1024};

    explicit Impl(ProcessLaunch l) : launch(std::move(l)) {
        sessionId = fmt::format("proc-{}-{}", baseName(launch.command), ++gSessionCounter);
        requestTimeout = std::chrono::milliseconds(GetEnvUint64("MCPBRIDGE_REQUEST_TIMEOUT_MS", 30000));
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(wakeEventFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("ProcessTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ////////////////////////////////////////// Spawning //////////////////////////////////////////
    void spawn() {
        ignoreSigpipeOnce();
        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int execPipe[2]{-1, -1};
        auto closeAll = [&]() {
            for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
            int err = errno;
            closeAll();
            throw BridgeError(ErrorKind::Io, fmt::format("pipe creation failed: {}", ::strerror(err)));
        }

        // argv/envp are built before fork; the child only calls async-signal-safe functions
        std::vector<std::string> argvStore;
        argvStore.push_back(launch.command);
        argvStore.insert(argvStore.end(), launch.args.begin(), launch.args.end());
        std::vector<char*> argv;
        for (auto& a : argvStore) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        std::map<std::string, std::string> envMap;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string kv(*e);
            auto eq = kv.find('=');
            if (eq != std::string::npos) {
                envMap[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
        }
        for (const auto& [k, v] : launch.env) {
            envMap[k] = v;
        }
        std::vector<std::string> envStore;
        envStore.reserve(envMap.size());
        for (const auto& [k, v] : envMap) {
            envStore.push_back(k + "=" + v);
        }
        std::vector<char*> envp;
        for (auto& kv : envStore) {
            envp.push_back(kv.data());
        }
        envp.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            closeAll();
            throw BridgeError(ErrorKind::SpawnFailed,
                              fmt::format("Failed to spawn '{}': fork failed: {}", launch.command, ::strerror(err)));
        }
        if (pid == 0) {
            ::signal(SIGPIPE, SIG_DFL);
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::execvpe(argv[0], argv.data(), envp.data());
            int err = errno;
            ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(execPipe[1]);

        // exec success closes the CLOEXEC pipe without data; failure sends errno
        int childErr = 0;
        ssize_t n;
        do {
            n = ::read(execPipe[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        closeFd(execPipe[0]);
        if (n == static_cast<ssize_t>(sizeof(childErr))) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            closeFd(inPipe[1]);
            closeFd(outPipe[0]);
            closeFd(errPipe[0]);
            throw BridgeError(ErrorKind::SpawnFailed,
                              fmt::format("Failed to spawn '{}': {}", launch.command, ::strerror(childErr)));
        }

        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        setNonBlocking(stdoutFd);
        setNonBlocking(stderrFd);
        childPid.store(static_cast<int>(pid));
        LOG_INFO("ProcessTransport[{}]: spawned '{}' (pid={})", sessionId, launch.command, static_cast<int>(pid));
    }

    void terminateChild() {
        int pid = childPid.exchange(-1);
        if (pid <= 0) {
            return;
        }
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == 0) {
            ::kill(pid, SIGTERM);
            auto deadline = std::chrono::steady_clock::now() + killGrace;
            while ((r = ::waitpid(pid, &status, WNOHANG)) == 0 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            if (r == 0) {
                LOG_WARN("ProcessTransport[{}]: pid {} ignored SIGTERM; sending SIGKILL", sessionId, pid);
                ::kill(pid, SIGKILL);
                do {
                    r = ::waitpid(pid, &status, 0);
                } while (r < 0 && errno == EINTR);
            }
        }
        if (r == pid) {
            if (WIFEXITED(status)) {
                LOG_INFO("ProcessTransport[{}]: pid {} exited with status {}", sessionId, pid, WEXITSTATUS(status));
            } else if (WIFSIGNALED(status)) {
                LOG_INFO("ProcessTransport[{}]: pid {} terminated by signal {}", sessionId, pid, WTERMSIG(status));
            }
        }
    }

    ////////////////////////////////////////// Writer //////////////////////////////////////////
    bool enqueueLine(OutboundLine item) {
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (!closing.load() && connected.load()) {
                writeQueue.push_back(std::move(item));
                cvWrite.notify_one();
                return true;
            }
        }
        auto err = makeError(ErrorKind::TransportClosed, "Transport closed");
        if (item.written) {
            item.written->set_exception(err);
        }
        if (!item.requestKey.empty()) {
            failPending(item.requestKey, err);
        }
        return false;
    }

    bool writeAll(const std::string& data, int& errOut) {
        std::size_t total = 0;
        while (total < data.size()) {
            ssize_t w = ::write(stdinFd, data.data() + total, data.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            errOut = (w < 0) ? errno : EIO;
            return false;
        }
        return true;
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            while (true) {
                OutboundLine item;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&] { return !connected.load() || !writeQueue.empty(); });
                    if (!connected.load()) {
                        break; // remaining items are failed by Close()
                    }
                    item = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                int err = 0;
                if (writeAll(item.data, err)) {
                    if (item.written) {
                        item.written->set_value();
                    }
                    continue;
                }
                LOG_ERROR("ProcessTransport[{}]: write to backend stdin failed (errno={} msg={})", sessionId, err, ::strerror(err));
                reportError("ProcessTransport: write failed");
                auto ex = makeError(ErrorKind::TransportClosed,
                                    fmt::format("Failed to write to backend: {}", ::strerror(err)));
                if (item.written) {
                    item.written->set_exception(ex);
                }
                if (!item.requestKey.empty()) {
                    failPending(item.requestKey, ex);
                }
            }
        });
    }

    void failQueuedWrites() {
        std::deque<OutboundLine> leftovers;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            leftovers.swap(writeQueue);
        }
        auto err = makeError(ErrorKind::TransportClosed, "Transport closed");
        for (auto& item : leftovers) {
            if (item.written) {
                item.written->set_exception(err);
            }
        }
    }

    ////////////////////////////////////////// Pending table //////////////////////////////////////////
    void failPending(const std::string& key, std::exception_ptr err) {
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(key);
        if (it != pendingRequests.end()) {
            it->second.set_exception(err);
            pendingRequests.erase(it);
        }
        requestDeadlines.erase(key);
    }

    void failAllPending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(requestMutex);
        if (!pendingRequests.empty()) {
            LOG_DEBUG("ProcessTransport[{}]: failing {} pending request(s): {}", sessionId, pendingRequests.size(), reason);
        }
        auto err = makeError(ErrorKind::TransportClosed, reason);
        for (auto& [key, prom] : pendingRequests) {
            prom.set_exception(err);
        }
        pendingRequests.clear();
        requestDeadlines.clear();
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            std::unique_lock<std::mutex> lk(requestMutex);
            // Runs until Close() so entries added after a peer exit still expire
            while (!closing.load()) {
                cvTimeout.wait_for(lk, std::chrono::milliseconds(50));
                auto now = std::chrono::steady_clock::now();
                for (auto it = requestDeadlines.begin(); it != requestDeadlines.end();) {
                    if (it->second > now) {
                        ++it;
                        continue;
                    }
                    auto p = pendingRequests.find(it->first);
                    if (p != pendingRequests.end()) {
                        LOG_WARN("ProcessTransport[{}]: request {} timed out", sessionId, it->first);
                        p->second.set_exception(makeError(ErrorKind::Timeout,
                            fmt::format("Request {} timed out after {} ms", it->first,
                                        static_cast<long long>(requestTimeout.count()))));
                        pendingRequests.erase(p);
                    }
                    it = requestDeadlines.erase(it);
                }
            }
        });
    }

    ////////////////////////////////////////// Reader //////////////////////////////////////////
    bool drainLines(std::string& buf) {
        std::size_t start = 0;
        while (connected.load()) {
            auto nl = buf.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            std::string line = buf.substr(start, nl - start);
            start = nl + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            processLine(line);
        }
        buf.erase(0, start);
        if (buf.size() > maxLineLength) {
            LOG_ERROR("ProcessTransport[{}]: output line exceeds {} bytes; dropping channel", sessionId, maxLineLength);
            reportError("ProcessTransport: line too long");
            buf.clear();
            return false;
        }
        return true;
    }

    void drainStderr(std::string& buf, bool eof) {
        std::size_t start = 0;
        for (auto nl = buf.find('\n'); nl != std::string::npos; nl = buf.find('\n', start)) {
            std::string line = buf.substr(start, nl - start);
            start = nl + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                LOG_INFO("[{}] stderr: {}", sessionId, line);
            }
        }
        buf.erase(0, start);
        if ((eof && !buf.empty()) || buf.size() > 64 * 1024) {
            LOG_INFO("[{}] stderr: {}", sessionId, buf);
            buf.clear();
        }
    }

    void processLine(const std::string& line) {
        LOG_DEBUG("ProcessTransport[{}] <- {}", sessionId, line);
        JSONValue doc;
        try {
            doc = ParseJSON(line);
        } catch (const std::exception& e) {
            LOG_WARN("ProcessTransport[{}]: ignoring non-JSON output line ({}): {}", sessionId, e.what(), line);
            return;
        }

        switch (ClassifyMessage(doc)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromValue(doc)) {
                    handleResponse(std::move(response));
                    return;
                }
                break;
            }
            case MessageKind::Notification: {
                auto note = std::make_unique<JSONRPCNotification>();
                if (note->FromValue(doc)) {
                    if (notificationHandler) {
                        notificationHandler(std::move(note));
                    } else {
                        LOG_DEBUG("ProcessTransport[{}]: notification {} (no handler)", sessionId, note->method);
                    }
                    return;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (request.FromValue(doc)) {
                    handlePeerRequest(request);
                    return;
                }
                break;
            }
            case MessageKind::Invalid:
                break;
        }

        // An envelope that names one of our ids but is not a valid response still settles that request
        if (const JSONValue* idVal = doc.Find("id")) {
            std::string key;
            if (idVal->IsString()) key = std::get<std::string>(idVal->value);
            else if (std::holds_alternative<int64_t>(idVal->value)) key = std::to_string(std::get<int64_t>(idVal->value));
            if (!key.empty()) {
                std::lock_guard<std::mutex> lock(requestMutex);
                auto it = pendingRequests.find(key);
                if (it != pendingRequests.end()) {
                    it->second.set_exception(makeError(ErrorKind::Protocol,
                        "Malformed JSON-RPC response for request " + key));
                    pendingRequests.erase(it);
                    requestDeadlines.erase(key);
                    return;
                }
            }
        }
        LOG_WARN("ProcessTransport[{}]: unrecognized JSON-RPC message: {}", sessionId, line);
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string key = IdToKey(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(key);
        if (it == pendingRequests.end()) {
            LOG_WARN("ProcessTransport[{}]: dropping response for unknown or already resolved id '{}'", sessionId, key);
            return;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pendingRequests.erase(it);
        requestDeadlines.erase(key);
    }

    void handlePeerRequest(const JSONRPCRequest& req) {
        std::unique_ptr<JSONRPCResponse> resp;
        if (requestHandler) {
            try {
                resp = requestHandler(req);
            } catch (const std::exception& e) {
                LOG_ERROR("ProcessTransport[{}]: request handler exception: {}", sessionId, e.what());
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
            }
        }
        if (!resp) {
            resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
        resp->id = req.id;
        OutboundLine item;
        item.data = resp->Serialize() + "\n";
        (void)enqueueLine(std::move(item));
    }

    void onPeerClosed() {
        connected = false;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
        }
        cvWrite.notify_all();
        failQueuedWrites();
        failAllPending("Backend process exited");
        if (!peerClosedFired.exchange(true) && closedHandler) {
            closedHandler();
        }
    }

    void readLoop() {
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("ProcessTransport[{}]: epoll_create1 failed (errno={} msg={})", sessionId, errno, ::strerror(errno));
            reportError("ProcessTransport: epoll_create1 failed");
            onPeerClosed();
            return;
        }
        for (int fd : {stdoutFd, stderrFd, wakeEventFd}) {
            if (fd < 0) continue;
            epoll_event ev{};
            ev.events = EPOLLIN | EPOLLRDHUP;
            ev.data.fd = fd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &ev);
        }

        std::string outBuf;
        std::string errBuf;
        std::vector<char> tmp(64 * 1024);
        bool stdoutOpen = true;
        while (connected.load() && stdoutOpen) {
            epoll_event events[3];
            int rc = ::epoll_wait(ep, events, 3, 100);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("ProcessTransport[{}]: epoll_wait failed (errno={} msg={})", sessionId, errno, ::strerror(errno));
                reportError("ProcessTransport: epoll_wait failed");
                break;
            }
            for (int k = 0; k < rc; ++k) {
                const int fd = events[k].data.fd;
                if (fd == wakeEventFd) {
                    uint64_t v = 0;
                    ssize_t r;
                    do {
                        r = ::read(fd, &v, sizeof(v));
                    } while (r < 0 && errno == EINTR);
                    continue;
                }
                std::string& buf = (fd == stdoutFd) ? outBuf : errBuf;
                bool eof = false;
                while (true) {
                    ssize_t n = ::read(fd, tmp.data(), tmp.size());
                    if (n > 0) {
                        buf.append(tmp.data(), static_cast<std::size_t>(n));
                        continue;
                    }
                    if (n == 0) {
                        eof = true;
                        break;
                    }
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno != EAGAIN && errno != EWOULDBLOCK) {
                        LOG_ERROR("ProcessTransport[{}]: read error (errno={} msg={})", sessionId, errno, ::strerror(errno));
                        eof = true;
                    }
                    break;
                }
                if (fd == stdoutFd) {
                    if (eof && !outBuf.empty() && outBuf.back() != '\n') {
                        outBuf.push_back('\n'); // flush a final unterminated line
                    }
                    if (!drainLines(outBuf) || eof) {
                        stdoutOpen = false;
                    }
                } else {
                    drainStderr(errBuf, eof);
                    if (eof) {
                        (void)::epoll_ctl(ep, EPOLL_CTL_DEL, fd, nullptr);
                    }
                }
            }
        }
        ::close(ep);
        if (!closing.load() && !stdoutOpen) {
            LOG_WARN("ProcessTransport[{}]: backend output closed", sessionId);
            onPeerClosed();
        }
    }

    void startReader() {
        readerThread = std::thread([this]() { readLoop(); });
    }

    void joinThread(std::thread& t) {
        if (!t.joinable()) {
            return;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            LOG_WARN("ProcessTransport[{}]: Close() called from an I/O thread; detaching it", sessionId);
            t.detach();
            return;
        }
        t.join();
    }

    std::string generateRequestId() { return "req-" + std::to_string(++requestCounter); }
};

ProcessTransport::ProcessTransport(ProcessLaunch launch) : pImpl(std::make_unique<Impl>(std::move(launch))) { FUNC_SCOPE(); }

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    Close().get();
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> started;
    auto fut = started.get_future();
    if (pImpl->closing.load()) {
        started.set_exception(makeError(ErrorKind::TransportClosed, "Transport closed"));
        return fut;
    }
    try {
        pImpl->spawn();
    } catch (const BridgeError& e) {
        LOG_ERROR("ProcessTransport[{}]: {}", pImpl->sessionId, e.what());
        started.set_exception(std::current_exception());
        return fut;
    }
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startWriter();
    pImpl->startTimeouts();
    started.set_value();
    return fut;
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->closing.exchange(true)) {
        done.set_value();
        return fut;
    }
    LOG_DEBUG("ProcessTransport[{}]: closing", pImpl->sessionId);
    pImpl->connected = false;
    pImpl->wake();
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    }
    pImpl->cvWrite.notify_all();
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
    }
    pImpl->cvTimeout.notify_all();

    pImpl->terminateChild();
    pImpl->joinThread(pImpl->readerThread);
    pImpl->joinThread(pImpl->writerThread);
    pImpl->joinThread(pImpl->timeoutThread);

    pImpl->failAllPending("Transport closed");
    pImpl->failQueuedWrites();
    closeFd(pImpl->stdinFd);
    closeFd(pImpl->stdoutFd);
    closeFd(pImpl->stderrFd);
    done.set_value();
    return fut;
}

bool ProcessTransport::IsConnected() const { return pImpl->connected.load(); }
std::string ProcessTransport::GetSessionId() const { return pImpl->sessionId; }

std::optional<int> ProcessTransport::GetProcessId() const {
    int pid = pImpl->childPid.load();
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

std::future<std::unique_ptr<JSONRPCResponse>> ProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(makeError(ErrorKind::TransportClosed, "Transport not connected"));
        return future;
    }

    const std::string requestId = pImpl->generateRequestId();
    request->id = requestId;
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->closing.load()) {
            promise.set_exception(makeError(ErrorKind::TransportClosed, "Transport closed"));
            return future;
        }
        // The peer may have exited after the check above; failAllPending runs under this lock
        if (!pImpl->connected.load()) {
            promise.set_exception(makeError(ErrorKind::TransportClosed, "Backend process exited"));
            return future;
        }
        pImpl->pendingRequests.emplace(requestId, std::move(promise));
        if (pImpl->requestTimeout.count() > 0) {
            pImpl->requestDeadlines[requestId] = std::chrono::steady_clock::now() + pImpl->requestTimeout;
        }
    }

    Impl::OutboundLine item;
    item.data = request->Serialize() + "\n";
    item.requestKey = requestId;
    LOG_DEBUG("ProcessTransport[{}] -> {} ({} bytes)", pImpl->sessionId, request->method, item.data.size());
    (void)pImpl->enqueueLine(std::move(item));
    return future;
}

std::future<void> ProcessTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    Impl::OutboundLine item;
    item.data = notification->Serialize() + "\n";
    item.written.emplace();
    auto fut = item.written->get_future();
    if (!pImpl->connected.load()) {
        item.written->set_exception(makeError(ErrorKind::TransportClosed, "Transport not connected"));
        return fut;
    }
    LOG_DEBUG("ProcessTransport[{}] -> {} (notification)", pImpl->sessionId, notification->method);
    (void)pImpl->enqueueLine(std::move(item));
    return fut;
}

void ProcessTransport::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void ProcessTransport::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void ProcessTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void ProcessTransport::SetClosedHandler(ClosedHandler handler) { pImpl->closedHandler = std::move(handler); }

void ProcessTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    pImpl->requestTimeout = std::chrono::milliseconds(timeoutMs);
}

void ProcessTransport::SetKillGraceMs(uint64_t graceMs) {
    pImpl->killGrace = std::chrono::milliseconds(graceMs);
}

void ProcessTransport::SetMaxLineLength(std::size_t maxBytes) {
    pImpl->maxLineLength = (maxBytes == 0) ? 1 : maxBytes;
}

std::unique_ptr<ITransport> ProcessTransportFactory::CreateTransport(const std::string& config) {
    auto t = std::make_unique<ProcessTransport>(launch);
    auto parseUint = [](const std::string& s, uint64_t& out) -> bool {
        if (s.empty() || s[0] == '-') return false;
        try { out = static_cast<uint64_t>(std::stoull(s)); return true; } catch (const std::logic_error&) { return false; }
    };
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        std::string token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("ProcessTransportFactory: ignoring malformed setting '{}'", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        uint64_t v = 0;
        if (!parseUint(val, v)) {
            LOG_WARN("ProcessTransportFactory: invalid value for {}: '{}'", key, val);
            continue;
        }
        if (key == "timeout_ms") {
            t->SetRequestTimeoutMs(v);
        } else if (key == "kill_grace_ms") {
            t->SetKillGraceMs(v);
        } else if (key == "max_line_bytes") {
            t->SetMaxLineLength(static_cast<std::size_t>(v));
        } else {
            LOG_WARN("ProcessTransportFactory: unknown setting '{}'", key);
        }
    }
    return t;
}

////////////////////////////////////////// Test hooks //////////////////////////////////////////
void ProcessTransportTestHooks::drainLines(ProcessTransport& t, std::string& buffer) {
    (void)t.pImpl->drainLines(buffer);
}

void ProcessTransportTestHooks::setConnected(ProcessTransport& t, bool v) {
    t.pImpl->connected = v;
}

bool ProcessTransportTestHooks::isConnected(const ProcessTransport& t) {
    return t.pImpl->connected.load();
}

std::size_t ProcessTransportTestHooks::pendingCount(ProcessTransport& t) {
    std::lock_guard<std::mutex> lock(t.pImpl->requestMutex);
    return t.pImpl->pendingRequests.size();
}

std::vector<std::string> ProcessTransportTestHooks::queuedLines(ProcessTransport& t) {
    std::lock_guard<std::mutex> lk(t.pImpl->writeMutex);
    std::vector<std::string> out;
    for (const auto& item : t.pImpl->writeQueue) {
        out.push_back(item.data);
    }
    return out;
}

} // namespace mcpbridge
