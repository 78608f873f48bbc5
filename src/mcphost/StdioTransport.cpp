//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Child-process stdio transport built on Boost.Asio coroutines
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/StdioTransport.hpp"
#include "mcphost/errors/Errors.h"

namespace mcphost {
namespace net = boost::asio;
using errors::ErrorCategory;

namespace {

constexpr std::size_t DefaultMaxLineBytes = 4 * 1024 * 1024; // 4 MiB per JSON-RPC line
constexpr std::size_t LoggedLinePrefix = 200;

std::string abbreviate(const std::string& line) {
    if (line.size() <= LoggedLinePrefix) {
        return line;
    }
    return line.substr(0, LoggedLinePrefix) + "...";
}

} // namespace

class StdioTransport::Impl {
public:
    struct PendingRequest {
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        std::unique_ptr<net::steady_timer> timer; // created on the I/O thread
    };

    struct OutboundMessage {
        std::unique_ptr<JSONRPCMessage> message;
        std::optional<JSONRPCId> requestId; // set for requests only
    };

    ServerConfig config;
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    // io_context is declared before every I/O object bound to it so it is destroyed last
    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::posix::stream_descriptor> stdinPipe;
    std::unique_ptr<net::posix::stream_descriptor> stdoutPipe;
    std::unique_ptr<net::posix::stream_descriptor> stderrPipe;
    net::steady_timer writeSignal{ioc};

    mutable std::mutex childMutex;
    std::unique_ptr<ChildProcess> child;

    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<int64_t> nextId{1};
    std::atomic<std::size_t> unmatchedResponses{0};

    mutable std::mutex requestMutex; // protects pendingRequests
    std::unordered_map<JSONRPCId, PendingRequest> pendingRequests;

    mutable std::mutex writeMutex; // protects writeQueue and queueClosed
    std::deque<OutboundMessage> writeQueue;
    bool queueClosed{true};

    // Read on the I/O thread per request/line; the setters may run at any time
    std::atomic<int64_t> requestTimeoutMs{30000}; // 0 = disabled
    std::atomic<std::size_t> maxLineBytes{DefaultMaxLineBytes};
    std::atomic<std::size_t> wakeupsPosted{0};

    explicit Impl(ServerConfig cfg) : config(std::move(cfg)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
        if (auto v = GetEnvUint64("MCPHOST_STDIOTRANSPORT_TIMEOUT_MS")) {
            requestTimeoutMs = static_cast<int64_t>(*v);
        }
    }

    ~Impl() {
        shutdown();
    }

    void reportError(const std::string& msg) {
        if (!errorHandler) {
            return;
        }
        try {
            errorHandler(msg);
        } catch (const std::exception& e) {
            LOG_WARN("StdioTransport[{}]: error handler threw: {}", sessionId, e.what());
        }
    }

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////

    void start() {
        if (closed.load()) {
            throw errors::makeException(ErrorCategory::Connection, "transport already closed");
        }
        if (started.exchange(true)) {
            throw errors::makeException(ErrorCategory::Connection, "transport already started");
        }
        std::unique_ptr<ChildProcess> proc;
        try {
            proc = ChildProcess::Spawn(config);
            stdinPipe = std::make_unique<net::posix::stream_descriptor>(ioc, proc->ReleaseStdin());
            stdoutPipe = std::make_unique<net::posix::stream_descriptor>(ioc, proc->ReleaseStdout());
            stderrPipe = std::make_unique<net::posix::stream_descriptor>(ioc, proc->ReleaseStderr());
        } catch (const boost::system::system_error& e) {
            started = false;
            stdinPipe.reset(); stdoutPipe.reset(); stderrPipe.reset();
            throw errors::makeException(ErrorCategory::Connection,
                fmt::format("failed to attach pipes for '{}': {}", config.CommandLine(), e.what()));
        } catch (const errors::McpException&) {
            started = false;
            throw;
        }
        LOG_INFO("StdioTransport[{}]: started '{}' (pid={})", sessionId, config.CommandLine(), static_cast<long>(proc->Pid()));
        {
            std::lock_guard<std::mutex> lock(childMutex);
            child = std::move(proc);
        }
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            queueClosed = false;
        }
        net::co_spawn(ioc, writerLoop(), net::detached);
        net::co_spawn(ioc, readerLoop(), net::detached);
        net::co_spawn(ioc, stderrLoop(), net::detached);
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport[{}]: I/O loop terminated: {}", sessionId, e.what());
                reportError(std::string("StdioTransport: I/O loop terminated: ") + e.what());
            }
        });
    }

    void killChild() {
        std::unique_ptr<ChildProcess> proc;
        {
            std::lock_guard<std::mutex> lock(childMutex);
            proc = std::move(child);
        }
        if (proc) {
            proc->Kill();
        }
    }

    void shutdown() {
        if (closed.exchange(true)) {
            return;
        }
        if (started.load()) {
            LOG_INFO("StdioTransport[{}]: closing '{}'", sessionId, config.CommandLine());
        }
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            queueClosed = true;
            // Queued requests still sit in pendingRequests and are failed below
            writeQueue.clear();
        }
        net::post(ioc, [this]() { writeSignal.cancel(); });
        killChild();
        ioc.stop();
        bool onIoThread = false;
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                onIoThread = true;
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
        failAllPending("transport closed");
        if (!onIoThread) {
            stdinPipe.reset();
            stdoutPipe.reset();
            stderrPipe.reset();
        }
    }

    /////////////////////////////////////////// Pending requests ///////////////////////////////////////////

    void failAllPending(const std::string& reason) {
        std::unordered_map<JSONRPCId, PendingRequest> drained;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            drained.swap(pendingRequests);
        }
        if (!drained.empty()) {
            LOG_WARN("StdioTransport[{}]: failing {} pending request(s): {}", sessionId, drained.size(), reason);
        }
        for (auto& [id, entry] : drained) {
            entry.promise.set_exception(std::make_exception_ptr(
                errors::makeException(ErrorCategory::Connection, reason)));
        }
    }

    std::optional<PendingRequest> takePending(const JSONRPCId& id) {
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(id);
        if (it == pendingRequests.end()) {
            return std::nullopt;
        }
        PendingRequest entry = std::move(it->second);
        pendingRequests.erase(it);
        return entry;
    }

    void failPending(const JSONRPCId& id, ErrorCategory category, const std::string& reason) {
        auto entry = takePending(id);
        if (entry) {
            entry->promise.set_exception(std::make_exception_ptr(errors::makeException(category, reason)));
        }
    }

    // Runs on the I/O thread; the entry may already be gone when the reply beat this handler.
    void armTimeout(const JSONRPCId& id) {
        const std::chrono::milliseconds timeout{requestTimeoutMs.load()};
        if (timeout.count() <= 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(id);
        if (it == pendingRequests.end()) {
            return;
        }
        it->second.timer = std::make_unique<net::steady_timer>(ioc, timeout);
        it->second.timer->async_wait([this, id, timeout](const boost::system::error_code& ec) {
            if (ec) {
                return; // cancelled: the reply arrived or the transport closed
            }
            auto entry = takePending(id);
            if (!entry) {
                return;
            }
            LOG_WARN("StdioTransport[{}]: request {} timed out after {} ms", sessionId, IdToString(id),
                     static_cast<long long>(timeout.count()));
            entry->promise.set_exception(std::make_exception_ptr(errors::makeException(
                ErrorCategory::Timeout,
                fmt::format("request {} timed out after {} ms", IdToString(id), static_cast<long long>(timeout.count())))));
        });
    }

    /////////////////////////////////////////// Writer ///////////////////////////////////////////

    void wakeWriter(std::optional<JSONRPCId> armFor) {
        ++wakeupsPosted;
        net::post(ioc, [this, armFor = std::move(armFor)]() {
            if (armFor) {
                armTimeout(*armFor);
            }
            writeSignal.cancel();
        });
    }

    net::awaitable<void> writerLoop() {
        for (;;) {
            OutboundMessage next;
            {
                std::lock_guard<std::mutex> lock(writeMutex);
                if (queueClosed) {
                    break;
                }
                if (!writeQueue.empty()) {
                    next = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
            }
            if (!next.message) {
                boost::system::error_code ec;
                writeSignal.expires_at(net::steady_timer::time_point::max());
                co_await writeSignal.async_wait(net::redirect_error(net::use_awaitable, ec));
                continue;
            }

            std::string line;
            try {
                line = next.message->Serialize();
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport[{}]: dropping unserializable message: {}", sessionId, e.what());
                if (next.requestId) {
                    failPending(*next.requestId, ErrorCategory::JsonRpcParse,
                                std::string("request could not be serialized: ") + e.what());
                }
                continue;
            }
            line.push_back('\n');

            boost::system::error_code ec;
            co_await net::async_write(*stdinPipe, net::buffer(line), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_ERROR("StdioTransport[{}]: write to server stdin failed: {}", sessionId, ec.message());
                if (next.requestId) {
                    failPending(*next.requestId, ErrorCategory::Connection,
                                "write to server stdin failed: " + ec.message());
                }
                reportError("StdioTransport: write failed: " + ec.message());
                break;
            }
            LOG_DEBUG("StdioTransport[{}]: sent {} bytes", sessionId, line.size());
        }
        closeQueue("writer stopped before the request was sent");
        co_return;
    }

    // Closes the outbound queue and fails requests that will now never be written.
    void closeQueue(const std::string& reason) {
        std::deque<OutboundMessage> stranded;
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            queueClosed = true;
            stranded.swap(writeQueue);
        }
        for (auto& msg : stranded) {
            if (msg.requestId) {
                failPending(*msg.requestId, ErrorCategory::Connection, reason);
            }
        }
    }

    /////////////////////////////////////////// Reader ///////////////////////////////////////////

    net::awaitable<void> readerLoop() {
        std::string buffer;
        bool discarding = false;
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = co_await net::async_read_until(*stdoutPipe, net::dynamic_buffer(buffer, maxLineBytes.load()), '\n',
                                                           net::redirect_error(net::use_awaitable, ec));
            if (ec == net::error::not_found) {
                if (!discarding) {
                    LOG_WARN("StdioTransport[{}]: inbound line exceeds {} bytes; discarding it", sessionId, maxLineBytes.load());
                    reportError("StdioTransport: inbound line too long");
                }
                buffer.clear();
                discarding = true;
                continue;
            }
            if (ec) {
                if (ec != net::error::eof && !closed.load()) {
                    LOG_WARN("StdioTransport[{}]: read from server stdout failed: {}", sessionId, ec.message());
                }
                break;
            }
            std::string line = buffer.substr(0, n - 1);
            buffer.erase(0, n);
            if (discarding) {
                discarding = false;
                continue;
            }
            handleLine(std::move(line));
        }
        if (!closed.load()) {
            LOG_INFO("StdioTransport[{}]: server '{}' closed its stdout", sessionId, config.CommandLine());
            reportError("StdioTransport: server closed stdout");
            closeQueue("server closed its stdout");
            writeSignal.cancel();
            failAllPending("server closed its stdout");
        }
        co_return;
    }

    void handleLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            return;
        }
        std::optional<JSONRPCInboundMessage> message;
        try {
            message = ParseMessage(line);
        } catch (const std::runtime_error& e) {
            LOG_WARN("StdioTransport[{}]: protocol error, skipping line: {} ({})", sessionId, e.what(), abbreviate(line));
            reportError(std::string("StdioTransport: protocol error: ") + e.what());
            return;
        }
        std::visit([this](auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, JSONRPCResponse>) {
                handleResponse(std::make_unique<JSONRPCResponse>(std::move(m)));
            } else if constexpr (std::is_same_v<T, JSONRPCNotification>) {
                handleNotification(std::make_unique<JSONRPCNotification>(std::move(m)));
            } else {
                LOG_WARN("StdioTransport[{}]: ignoring server request '{}' (id {}); not supported by this client",
                         sessionId, m.method, IdToString(m.id));
            }
        }, *message);
    }

    void handleResponse(std::unique_ptr<JSONRPCResponse> response) {
        auto entry = takePending(response->id);
        if (!entry) {
            ++unmatchedResponses;
            LOG_WARN("StdioTransport[{}]: dropping response for unknown id {}", sessionId, IdToString(response->id));
            return;
        }
        entry->promise.set_value(std::move(response));
        // entry->timer is destroyed here, cancelling the pending timeout wait
    }

    void handleNotification(std::unique_ptr<JSONRPCNotification> notification) {
        LOG_DEBUG("StdioTransport[{}]: notification '{}'", sessionId, notification->method);
        if (!notificationHandler) {
            return;
        }
        try {
            notificationHandler(std::move(notification));
        } catch (const std::exception& e) {
            LOG_WARN("StdioTransport[{}]: notification handler threw: {}", sessionId, e.what());
        }
    }

    /////////////////////////////////////////// Stderr ///////////////////////////////////////////

    net::awaitable<void> stderrLoop() {
        std::string buffer;
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = co_await net::async_read_until(*stderrPipe, net::dynamic_buffer(buffer, maxLineBytes.load()), '\n',
                                                           net::redirect_error(net::use_awaitable, ec));
            if (ec == net::error::not_found) {
                LOG_DEBUG("[{}] stderr: {}", sessionId, abbreviate(buffer));
                buffer.clear();
                continue;
            }
            if (ec) {
                break;
            }
            std::string line = buffer.substr(0, n - 1);
            buffer.erase(0, n);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                LOG_DEBUG("[{}] stderr: {}", sessionId, line);
            }
        }
        co_return;
    }
};

StdioTransport::StdioTransport(ServerConfig config) : pImpl(std::make_unique<Impl>(std::move(config))) { FUNC_SCOPE(); }
StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->start();
        ready.set_value();
    } catch (const errors::McpException& e) {
        LOG_ERROR("StdioTransport[{}]: start failed: {}", pImpl->sessionId, e.what());
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    pImpl->shutdown();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const {
    FUNC_SCOPE();
    if (!pImpl->started.load() || pImpl->closed.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    return !pImpl->queueClosed;
}

std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

bool StdioTransport::IsAlive() const {
    std::lock_guard<std::mutex> lock(pImpl->childMutex);
    return pImpl->child != nullptr;
}

std::future<std::unique_ptr<JSONRPCResponse>> StdioTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    JSONRPCId id;
    {
        // Registration and enqueue happen under writeMutex so a concurrent close cannot strand the entry
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        if (pImpl->queueClosed) {
            LOG_DEBUG("StdioTransport[{}]: SendRequest '{}' on closed transport", pImpl->sessionId, request->method);
            promise.set_exception(std::make_exception_ptr(errors::makeException(
                ErrorCategory::Connection, "transport is not connected")));
            return future;
        }
        id = JSONRPCId{pImpl->nextId.fetch_add(1)};
        request->id = id;
        {
            std::lock_guard<std::mutex> reqLock(pImpl->requestMutex);
            pImpl->pendingRequests.emplace(id, Impl::PendingRequest{std::move(promise), nullptr});
        }
        LOG_DEBUG("StdioTransport[{}]: queue request {} '{}'", pImpl->sessionId, IdToString(id), request->method);
        pImpl->writeQueue.push_back(Impl::OutboundMessage{std::move(request), id});
    }
    pImpl->wakeWriter(id);
    return future;
}

std::future<void> StdioTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    bool wake = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        if (pImpl->queueClosed) {
            LOG_DEBUG("StdioTransport[{}]: SendNotification '{}' on closed transport; ignoring",
                      pImpl->sessionId, notification->method);
        } else {
            pImpl->writeQueue.push_back(Impl::OutboundMessage{std::move(notification), std::nullopt});
            wake = true;
        }
    }
    if (wake) {
        pImpl->wakeWriter(std::nullopt);
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) { FUNC_SCOPE(); pImpl->notificationHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->requestTimeoutMs = static_cast<int64_t>(timeoutMs);
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    pImpl->maxLineBytes = (maxBytes == 0) ? DefaultMaxLineBytes : maxBytes;
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const ServerConfig& config) {
    auto t = std::make_unique<StdioTransport>(config);
    // Parse key=value pairs separated by ';' or whitespace
    auto parseUint = [](const std::string& s, uint64_t& out) -> bool {
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
        try { out = static_cast<uint64_t>(std::stoull(s)); return true; } catch (const std::out_of_range&) { return false; }
    };
    for (std::size_t i = 0; i < options.size();) {
        // Skip separators and spaces
        while (i < options.size() && (options[i] == ';' || options[i] == ' ' || options[i] == '\t')) ++i;
        if (i >= options.size()) break;
        std::size_t start = i;
        while (i < options.size() && options[i] != ';' && options[i] != ' ' && options[i] != '\t') ++i;
        const std::string token = options.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioTransportFactory: ignoring option without value: {}", token);
            continue;
        }
        const auto key = token.substr(0, eq);
        const auto val = token.substr(eq + 1);
        uint64_t v = 0;
        if (!parseUint(val, v)) {
            LOG_WARN("StdioTransportFactory: ignoring non-numeric {}={}", key, val);
        } else if (key == "timeout_ms") {
            t->SetRequestTimeoutMs(v);
        } else if (key == "max_line_bytes") {
            t->SetMaxLineBytes(static_cast<std::size_t>(v));
        } else {
            LOG_WARN("StdioTransportFactory: unknown option {}", key);
        }
    }
    return t;
}

std::size_t StdioTransportTestHooks::pendingCount(const StdioTransport& t) {
    std::lock_guard<std::mutex> lock(t.pImpl->requestMutex);
    return t.pImpl->pendingRequests.size();
}

std::size_t StdioTransportTestHooks::unmatchedResponses(const StdioTransport& t) {
    return t.pImpl->unmatchedResponses.load();
}

std::size_t StdioTransportTestHooks::wakeupsPosted(const StdioTransport& t) {
    return t.pImpl->wakeupsPosted.load();
}

long StdioTransportTestHooks::childPid(const StdioTransport& t) {
    std::lock_guard<std::mutex> lock(t.pImpl->childMutex);
    return t.pImpl->child ? static_cast<long>(t.pImpl->child->Pid()) : -1L;
}

} // namespace mcphost
