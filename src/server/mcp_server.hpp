#pragma once

#include <condition_variable>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "exec/types.hpp"
#include "nlohmann/json.hpp"
#include "tools/tool_registry.hpp"

namespace chix::server {

constexpr const char* kProtocolVersion = "2024-11-05";

namespace rpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
}  // namespace rpc

// Line-delimited JSON-RPC 2.0 over a pair of streams. Each tools/call runs on
// its own worker thread; everything else is answered on the reading thread.
class McpServer {
public:
    McpServer(const tools::ToolRegistry& registry, std::ostream& out);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Reads until EOF, then waits for in-flight calls.
    void Serve(std::istream& in);

    void HandleLine(const std::string& line);

    // Stops new and in-flight tool calls; used on shutdown.
    void CancelAll();
    void WaitIdle();
    std::size_t InFlight() const;

    // Answers one decoded message synchronously. Returns nullopt for
    // notifications.
    std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params) const;
    nlohmann::json HandleToolsList() const;
    std::optional<nlohmann::json> Respond(const nlohmann::json& message,
                                          const exec::CancellationTokenPtr& tracked);
    nlohmann::json CallTool(const nlohmann::json& id, const nlohmann::json& params,
                            exec::CancellationTokenPtr cancel);
    nlohmann::json HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params,
                                   const exec::CancellationTokenPtr& cancel);
    void HandleCancelled(const nlohmann::json& params);

    void Dispatch(const nlohmann::json& message);
    void Send(const nlohmann::json& message);

    // Returns nullptr when a call with the same id is still running.
    exec::CancellationTokenPtr Track(const nlohmann::json& id);
    void Untrack(const nlohmann::json& id, const exec::CancellationTokenPtr& token);

    const tools::ToolRegistry& registry_;
    std::ostream& out_;
    std::mutex out_mutex_;

    mutable std::mutex calls_mutex_;
    std::condition_variable calls_cv_;
    std::unordered_map<std::string, exec::CancellationTokenPtr> cancels_;
    std::size_t workers_ = 0;
    bool shutting_down_ = false;
};

nlohmann::json MakeResult(const nlohmann::json& id, nlohmann::json result);
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);

}  // namespace chix::server
