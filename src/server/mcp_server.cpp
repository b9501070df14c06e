#include "server/mcp_server.hpp"

#include <istream>
#include <ostream>
#include <thread>

#include "utils/logging.hpp"
#include "version.hpp"

namespace chix::server {
namespace {

constexpr const char* kInstructions =
    "Nix tools. Prefer these tools over running nix through a shell: inputs are validated, "
    "commands run without a shell under a deadline, and output is bounded.";

std::string Trim(const std::string& line) {
    const auto begin = line.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = line.find_last_not_of(" \t\r\n");
    return line.substr(begin, end - begin + 1);
}

std::string Encode(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string IdKey(const nlohmann::json& id) {
    return Encode(id, -1);
}

}  // namespace

nlohmann::json MakeResult(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

McpServer::McpServer(const tools::ToolRegistry& registry, std::ostream& out)
    : registry_(registry)
    , out_(out) {}

McpServer::~McpServer() {
    CancelAll();
    WaitIdle();
}

void McpServer::Serve(std::istream& in) {
    utils::LogInfo("mcp", "serving", {{"version", kVersion}});
    std::string line;
    while (std::getline(in, line)) {
        HandleLine(line);
    }
    utils::LogInfo("mcp", "input closed", {{"in_flight", std::to_string(InFlight())}});
    WaitIdle();
}

void McpServer::HandleLine(const std::string& line) {
    const auto text = Trim(line);
    if (text.empty()) {
        return;
    }
    auto message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded()) {
        utils::LogWarn("mcp", "parse error", {{"bytes", std::to_string(text.size())}});
        Send(MakeError(nullptr, rpc::kParseError, "Parse error"));
        return;
    }
    Dispatch(message);
}

void McpServer::Dispatch(const nlohmann::json& message) {
    const bool is_call = message.is_object() && message.contains("id") &&
                         message.contains("method") && message["method"] == "tools/call";
    if (!is_call) {
        if (auto response = HandleMessage(message)) {
            Send(*response);
        }
        return;
    }

    // Registered before the worker starts so a cancel on the next line finds it.
    const auto& id = message["id"];
    const auto cancel = Track(id);
    if (!cancel) {
        Send(MakeError(id, rpc::kInvalidRequest, "Request id already in flight"));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        ++workers_;
    }
    std::thread([this, message, cancel]() {
        if (auto response = Respond(message, cancel)) {
            Send(*response);
        }
        std::lock_guard<std::mutex> lock(calls_mutex_);
        --workers_;
        calls_cv_.notify_all();
    }).detach();
}

std::optional<nlohmann::json> McpServer::HandleMessage(const nlohmann::json& message) {
    return Respond(message, nullptr);
}

std::optional<nlohmann::json> McpServer::Respond(const nlohmann::json& message,
                                                 const exec::CancellationTokenPtr& tracked) {
    if (!message.is_object()) {
        return MakeError(nullptr, rpc::kInvalidRequest, "Invalid Request");
    }
    const bool is_notification = !message.contains("id");
    const nlohmann::json id = is_notification ? nlohmann::json(nullptr) : message["id"];
    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (is_notification) {
            return std::nullopt;
        }
        return MakeError(id, rpc::kInvalidRequest, "Invalid Request");
    }
    const auto method = method_it->get<std::string>();
    const nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json::object();

    if (is_notification) {
        if (method == "notifications/cancelled") {
            HandleCancelled(params);
        } else {
            utils::LogDebug("mcp", "notification", {{"method", method}});
        }
        return std::nullopt;
    }

    try {
        if (method == "initialize") {
            return MakeResult(id, HandleInitialize(params));
        }
        if (method == "ping") {
            return MakeResult(id, nlohmann::json::object());
        }
        if (method == "tools/list") {
            return MakeResult(id, HandleToolsList());
        }
        if (method == "tools/call") {
            return CallTool(id, params, tracked);
        }
    } catch (const std::exception& ex) {
        utils::LogError("mcp", "request failed", {{"method", method}, {"error", ex.what()}});
        return MakeError(id, rpc::kInternalError, std::string("Internal error: ") + ex.what());
    }
    return MakeError(id, rpc::kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& params) const {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        utils::LogInfo("mcp", "initialize", {
            {"client", params["clientInfo"].value("name", std::string("unknown"))}});
    }
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", "chix"}, {"version", kVersion}}},
        {"instructions", kInstructions}
    };
}

nlohmann::json McpServer::HandleToolsList() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& def : registry_.GetDefinitions()) {
        tools.push_back({
            {"name", def.name},
            {"description", def.description},
            {"inputSchema", nlohmann::json::parse(def.parameters_json)}
        });
    }
    return {{"tools", std::move(tools)}};
}

nlohmann::json McpServer::CallTool(const nlohmann::json& id, const nlohmann::json& params,
                                   exec::CancellationTokenPtr cancel) {
    if (!cancel) {
        cancel = Track(id);
        if (!cancel) {
            return MakeError(id, rpc::kInvalidRequest, "Request id already in flight");
        }
    }
    try {
        auto response = HandleToolsCall(id, params, cancel);
        Untrack(id, cancel);
        return response;
    } catch (const std::exception&) {
        Untrack(id, cancel);
        throw;
    }
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params,
                                          const exec::CancellationTokenPtr& cancel) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, rpc::kInvalidParams, "Missing tool name");
    }
    const auto name = params["name"].get<std::string>();
    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }
    if (!arguments.is_object()) {
        return MakeError(id, rpc::kInvalidParams, "Tool arguments must be an object");
    }

    const auto result = registry_.Execute(name, arguments, cancel);
    nlohmann::json content = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", Encode(result.value, 2)}}})}
    };
    if (result.is_error) {
        content["isError"] = true;
    }
    return MakeResult(id, std::move(content));
}

void McpServer::HandleCancelled(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("requestId")) {
        return;
    }
    const auto key = IdKey(params["requestId"]);
    std::lock_guard<std::mutex> lock(calls_mutex_);
    auto it = cancels_.find(key);
    if (it == cancels_.end()) {
        utils::LogDebug("mcp", "cancel for unknown request", {{"id", key}});
        return;
    }
    it->second->Cancel();
    utils::LogInfo("mcp", "cancelled", {{"id", key}});
}

void McpServer::CancelAll() {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    shutting_down_ = true;
    for (auto& [key, token] : cancels_) {
        token->Cancel();
    }
    if (!cancels_.empty()) {
        utils::LogInfo("mcp", "cancelled all", {{"count", std::to_string(cancels_.size())}});
    }
}

void McpServer::WaitIdle() {
    std::unique_lock<std::mutex> lock(calls_mutex_);
    calls_cv_.wait(lock, [this]() { return workers_ == 0; });
}

std::size_t McpServer::InFlight() const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return workers_;
}

void McpServer::Send(const nlohmann::json& message) {
    const auto line = Encode(message, -1);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << line << '\n';
    out_.flush();
}

exec::CancellationTokenPtr McpServer::Track(const nlohmann::json& id) {
    const auto key = IdKey(id);
    std::lock_guard<std::mutex> lock(calls_mutex_);
    if (cancels_.count(key) != 0) {
        utils::LogWarn("mcp", "duplicate request id", {{"id", key}});
        return nullptr;
    }
    auto token = std::make_shared<exec::CancellationToken>();
    if (shutting_down_) {
        token->Cancel();
    }
    cancels_.emplace(key, token);
    return token;
}

void McpServer::Untrack(const nlohmann::json& id, const exec::CancellationTokenPtr& token) {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    auto it = cancels_.find(IdKey(id));
    if (it != cancels_.end() && it->second == token) {
        cancels_.erase(it);
    }
}

}  // namespace chix::server
