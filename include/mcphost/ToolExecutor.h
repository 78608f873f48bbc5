//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecutor.h
// Purpose: Tool invocation by prefixed tool id with bounded history and per-tool statistics
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mcphost/Client.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

// Server and tool addressed by a tool id.
struct ToolAddress {
    std::string server;
    std::string tool;
};

//==========================================================================================================
// ParseToolId
// Purpose: Splits "mcp_<server>_<tool>" on '_'. Needs at least three segments with "mcp" first; the tool
//          name is every segment after the server joined back with '_'.
// Returns:
//   The address, or std::nullopt for a malformed id.
//==========================================================================================================
std::optional<ToolAddress> ParseToolId(const std::string& toolId);

// Inverse of ParseToolId for server names without '_'.
std::string MakeToolId(const std::string& server, const std::string& tool);

using ToolArguments = std::unordered_map<std::string, JSONValue>;

//==========================================================================================================
// ToolExecutionResult
// Purpose: Record of one execution, success or failure.
// Fields:
//   result: Tool output on success; null on failure.
//   durationMs: Wall-clock time around the client call.
//   error: Failure message when success is false.
//==========================================================================================================
struct ToolExecutionResult {
    std::string toolId;
    std::string serverName;
    JSONValue result;
    uint64_t durationMs{0};
    std::chrono::system_clock::time_point timestamp;
    bool success{false};
    std::optional<std::string> error;
};

struct ToolStats {
    std::string toolId;
    uint64_t totalExecutions{0};
    uint64_t successfulExecutions{0};
    uint64_t failedExecutions{0};
    double avgDurationMs{0.0};
    std::optional<std::chrono::system_clock::time_point> lastExecution;
};

// One entry of ExecuteToolsParallel: exactly one of result and error is set.
struct ToolExecutionOutcome {
    std::string toolId;
    std::optional<ToolExecutionResult> result;
    std::optional<errors::McpError> error;
};

//==========================================================================================================
// ToolExecutor
// Purpose: Routes tool ids to IClient::CallTool and keeps execution history and statistics.
// Notes:
//   - History and statistics have separate locks; neither is held across a tool call.
//   - Futures returned here keep the executor state alive until they complete.
//==========================================================================================================
class ToolExecutor {
public:
    static constexpr std::size_t kDefaultMaxHistorySize = 1000;

    explicit ToolExecutor(std::shared_ptr<IClient> client, std::size_t maxHistorySize = kDefaultMaxHistorySize);
    ~ToolExecutor();

    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    ////////////////////////////////////////// Execution ///////////////////////////////////////////////////
    //==========================================================================================================
    // ExecuteTool
    // Purpose: Calls the addressed tool; the outcome is recorded before the future completes.
    // Args:
    //   toolId: "mcp_<server>_<tool>".
    //   arguments: Tool arguments, sent as a JSON object.
    // Returns:
    //   Future with the successful result; fails with a ToolNotFound McpException for a malformed id
    //   (without any I/O) or when the call fails.
    //==========================================================================================================
    std::future<ToolExecutionResult> ExecuteTool(const std::string& toolId, const ToolArguments& arguments);

    //==========================================================================================================
    // ExecuteToolWithTimeout
    // Purpose: As ExecuteTool, but fails with ToolNotFound "Tool execution timed out after ..." when the
    //          call takes longer than timeout. The abandoned call still completes and records in the
    //          background.
    //==========================================================================================================
    std::future<ToolExecutionResult> ExecuteToolWithTimeout(const std::string& toolId,
                                                            const ToolArguments& arguments,
                                                            std::chrono::milliseconds timeout);

    //==========================================================================================================
    // ExecuteToolsParallel
    // Purpose: Starts every execution concurrently and collects one outcome per input, in input order.
    //==========================================================================================================
    std::future<std::vector<ToolExecutionOutcome>> ExecuteToolsParallel(
        const std::vector<std::pair<std::string, ToolArguments>>& executions);

    //==========================================================================================================
    // RecordExecution
    // Purpose: Appends to history (evicting the oldest entry beyond maxHistorySize) and folds the result
    //          into the tool's running statistics.
    //==========================================================================================================
    void RecordExecution(const ToolExecutionResult& result);

    ////////////////////////////////////////// Queries ///////////////////////////////////////////////////
    // Entries recorded for toolId, oldest first.
    std::vector<ToolExecutionResult> GetToolHistory(const std::string& toolId) const;
    // The last `limit` entries in chronological order.
    std::vector<ToolExecutionResult> GetRecentHistory(std::size_t limit) const;
    std::optional<ToolStats> GetToolStats(const std::string& toolId) const;
    std::vector<ToolStats> GetAllStats() const;
    // Percentage of successful executions of toolId; 0.0 when nothing was recorded for it.
    double GetSuccessRate(const std::string& toolId) const;
    std::vector<ToolStats> GetMostUsedTools(std::size_t limit) const;
    std::vector<ToolStats> GetSlowestTools(std::size_t limit) const;
    std::vector<ToolStats> GetToolsWithErrors() const;
    void ClearHistory();
    void ClearStats();

    std::size_t MaxHistorySize() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphost
