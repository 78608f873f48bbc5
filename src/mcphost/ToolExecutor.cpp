//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecutor.cpp
// Purpose: Tool execution, history ring buffer and per-tool statistics
//==========================================================================================================

#include <algorithm>
#include <deque>
#include <mutex>
#include <sstream>

#include "logging/Logger.h"
#include "mcphost/ToolExecutor.h"
#include "mcphost/async/FutureAwaitable.h"
#include "mcphost/async/Task.h"

namespace mcphost {

using errors::ErrorCategory;

namespace {
constexpr const char* kToolIdPrefix = "mcp";
} // namespace

std::optional<ToolAddress> ParseToolId(const std::string& toolId) {
    std::vector<std::string> parts;
    std::stringstream ss(toolId);
    std::string part;
    while (std::getline(ss, part, '_')) {
        parts.push_back(part);
    }
    // getline drops a trailing empty segment
    if (!toolId.empty() && toolId.back() == '_') {
        parts.emplace_back();
    }
    if (parts.size() < 3 || parts[0] != kToolIdPrefix) {
        return std::nullopt;
    }
    ToolAddress address;
    address.server = parts[1];
    for (std::size_t i = 2; i < parts.size(); ++i) {
        if (i > 2) address.tool += '_';
        address.tool += parts[i];
    }
    return address;
}

std::string MakeToolId(const std::string& server, const std::string& tool) {
    return std::string(kToolIdPrefix) + "_" + server + "_" + tool;
}

class ToolExecutor::Impl {
public:
    using ImplPtr = std::shared_ptr<Impl>;

    std::shared_ptr<IClient> client;
    const std::size_t maxHistorySize;

    mutable std::mutex historyMutex;
    std::deque<ToolExecutionResult> history;

    mutable std::mutex statsMutex;
    std::unordered_map<std::string, ToolStats> stats;

    Impl(std::shared_ptr<IClient> c, std::size_t maxHistory) : client(std::move(c)), maxHistorySize(maxHistory) {}

    void record(const ToolExecutionResult& result) {
        {
            std::lock_guard<std::mutex> lock(historyMutex);
            if (maxHistorySize > 0) {
                while (history.size() >= maxHistorySize) {
                    history.pop_front();
                }
                history.push_back(result);
            }
        }
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            auto& s = stats[result.toolId];
            s.toolId = result.toolId;
            s.totalExecutions += 1;
            if (result.success) {
                s.successfulExecutions += 1;
            } else {
                s.failedExecutions += 1;
            }
            const double n = static_cast<double>(s.totalExecutions);
            s.avgDurationMs = (s.avgDurationMs * (n - 1.0) + static_cast<double>(result.durationMs)) / n;
            s.lastExecution = result.timestamp;
        }
    }

    std::vector<ToolStats> snapshotStats() const {
        std::vector<ToolStats> out;
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            out.reserve(stats.size());
            for (const auto& [id, s] : stats) {
                out.push_back(s);
            }
        }
        std::sort(out.begin(), out.end(), [](const ToolStats& a, const ToolStats& b) { return a.toolId < b.toolId; });
        return out;
    }

    static async::Task<ToolExecutionResult> coExecute(ImplPtr self, std::string toolId, ToolArguments arguments);
    static async::Task<std::vector<ToolExecutionOutcome>> coExecuteParallel(
        ImplPtr self, std::vector<std::pair<std::string, ToolArguments>> executions);
};

async::Task<ToolExecutionResult> ToolExecutor::Impl::coExecute(ImplPtr self, std::string toolId, ToolArguments arguments) {
    FUNC_SCOPE();
    auto address = ParseToolId(toolId);
    if (!address) {
        LOG_WARN("Rejecting malformed tool id '{}'", toolId);
        throw errors::makeException(ErrorCategory::McpToolNotFound, "Invalid MCP tool ID: " + toolId);
    }

    JSONValue::Object argsObj;
    for (auto& [key, value] : arguments) {
        argsObj[key] = std::make_shared<JSONValue>(std::move(value));
    }

    LOG_DEBUG("Executing tool '{}' on server '{}'", address->tool, address->server);
    const auto start = std::chrono::steady_clock::now();
    std::optional<JSONValue> value;
    std::string failure;
    try {
        value = co_await async::makeFutureAwaitable(
            self->client->CallTool(address->server, address->tool, JSONValue{std::move(argsObj)}));
    } catch (const std::exception& e) {
        failure = e.what();
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ToolExecutionResult result;
    result.toolId = toolId;
    result.serverName = address->server;
    result.durationMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    result.timestamp = std::chrono::system_clock::now();
    result.success = value.has_value();
    if (value) {
        result.result = std::move(*value);
    } else {
        result.error = failure;
    }
    self->record(result);

    if (!result.success) {
        LOG_WARN("Tool '{}' failed after {} ms: {}", toolId, result.durationMs, failure);
        throw errors::makeException(ErrorCategory::McpToolNotFound, failure);
    }
    LOG_DEBUG("Tool '{}' completed in {} ms", toolId, result.durationMs);
    co_return result;
}

async::Task<std::vector<ToolExecutionOutcome>> ToolExecutor::Impl::coExecuteParallel(
    ImplPtr self, std::vector<std::pair<std::string, ToolArguments>> executions) {
    FUNC_SCOPE();
    // Every execution is started before any of them is awaited
    std::vector<std::pair<std::string, std::future<ToolExecutionResult>>> inflight;
    inflight.reserve(executions.size());
    for (auto& [toolId, arguments] : executions) {
        inflight.emplace_back(toolId, coExecute(self, toolId, std::move(arguments)).toFuture());
    }

    std::vector<ToolExecutionOutcome> outcomes;
    outcomes.reserve(inflight.size());
    for (auto& entry : inflight) {
        ToolExecutionOutcome outcome;
        outcome.toolId = entry.first;
        try {
            outcome.result = co_await async::makeFutureAwaitable(std::move(entry.second));
        } catch (const errors::McpException& e) {
            outcome.error = e.error();
        }
        outcomes.push_back(std::move(outcome));
    }
    co_return outcomes;
}

ToolExecutor::ToolExecutor(std::shared_ptr<IClient> client, std::size_t maxHistorySize)
    : pImpl(std::make_shared<Impl>(std::move(client), maxHistorySize)) {
    FUNC_SCOPE();
}

ToolExecutor::~ToolExecutor() { FUNC_SCOPE(); }

std::future<ToolExecutionResult> ToolExecutor::ExecuteTool(const std::string& toolId, const ToolArguments& arguments) {
    FUNC_SCOPE();
    return Impl::coExecute(pImpl, toolId, arguments).toFuture();
}

std::future<ToolExecutionResult> ToolExecutor::ExecuteToolWithTimeout(const std::string& toolId,
                                                                     const ToolArguments& arguments,
                                                                     std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    auto inner = Impl::coExecute(pImpl, toolId, arguments).toFuture();
    return std::async(std::launch::async, [inner = std::move(inner), timeout, toolId]() mutable {
        if (inner.wait_for(timeout) != std::future_status::ready) {
            LOG_WARN("Tool '{}' abandoned after {} ms", toolId, static_cast<long long>(timeout.count()));
            throw errors::makeException(ErrorCategory::McpToolNotFound,
                fmt::format("Tool execution timed out after {}ms", static_cast<long long>(timeout.count())));
        }
        return inner.get();
    });
}

std::future<std::vector<ToolExecutionOutcome>> ToolExecutor::ExecuteToolsParallel(
    const std::vector<std::pair<std::string, ToolArguments>>& executions) {
    FUNC_SCOPE();
    return Impl::coExecuteParallel(pImpl, executions).toFuture();
}

void ToolExecutor::RecordExecution(const ToolExecutionResult& result) {
    FUNC_SCOPE();
    pImpl->record(result);
}

std::vector<ToolExecutionResult> ToolExecutor::GetToolHistory(const std::string& toolId) const {
    std::lock_guard<std::mutex> lock(pImpl->historyMutex);
    std::vector<ToolExecutionResult> out;
    for (const auto& r : pImpl->history) {
        if (r.toolId == toolId) {
            out.push_back(r);
        }
    }
    return out;
}

std::vector<ToolExecutionResult> ToolExecutor::GetRecentHistory(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(pImpl->historyMutex);
    const std::size_t count = std::min(limit, pImpl->history.size());
    return std::vector<ToolExecutionResult>(pImpl->history.end() - static_cast<std::ptrdiff_t>(count),
                                            pImpl->history.end());
}

std::optional<ToolStats> ToolExecutor::GetToolStats(const std::string& toolId) const {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    auto it = pImpl->stats.find(toolId);
    if (it == pImpl->stats.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ToolStats> ToolExecutor::GetAllStats() const {
    return pImpl->snapshotStats();
}

double ToolExecutor::GetSuccessRate(const std::string& toolId) const {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    auto it = pImpl->stats.find(toolId);
    if (it == pImpl->stats.end() || it->second.totalExecutions == 0) {
        return 0.0;
    }
    return static_cast<double>(it->second.successfulExecutions) /
           static_cast<double>(it->second.totalExecutions) * 100.0;
}

std::vector<ToolStats> ToolExecutor::GetMostUsedTools(std::size_t limit) const {
    auto tools = pImpl->snapshotStats();
    std::stable_sort(tools.begin(), tools.end(), [](const ToolStats& a, const ToolStats& b) {
        return a.totalExecutions > b.totalExecutions;
    });
    if (tools.size() > limit) tools.resize(limit);
    return tools;
}

std::vector<ToolStats> ToolExecutor::GetSlowestTools(std::size_t limit) const {
    auto tools = pImpl->snapshotStats();
    std::stable_sort(tools.begin(), tools.end(), [](const ToolStats& a, const ToolStats& b) {
        return a.avgDurationMs > b.avgDurationMs;
    });
    if (tools.size() > limit) tools.resize(limit);
    return tools;
}

std::vector<ToolStats> ToolExecutor::GetToolsWithErrors() const {
    auto tools = pImpl->snapshotStats();
    tools.erase(std::remove_if(tools.begin(), tools.end(),
                               [](const ToolStats& s) { return s.failedExecutions == 0; }),
                tools.end());
    return tools;
}

void ToolExecutor::ClearHistory() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->historyMutex);
    pImpl->history.clear();
}

void ToolExecutor::ClearStats() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    pImpl->stats.clear();
}

std::size_t ToolExecutor::MaxHistorySize() const {
    return pImpl->maxHistorySize;
}

} // namespace mcphost
