#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "server/mcp_server.hpp"

using namespace chix;
using nlohmann::json;

namespace {

class EchoTool : public tools::Tool {
public:
    std::string Name() const override { return "echo"; }
    std::string Description() const override { return "Echo the parameters back."; }
    std::string ParametersJson() const override {
        return R"({"type":"object","properties":{"text":{"type":"string"}}})";
    }
    tools::ToolResult Execute(const json& params, const exec::CancellationTokenPtr&) const override {
        return tools::ToolResult::Ok({{"echo", params}});
    }
};

// Blocks until its token trips, then reports that it saw the cancellation.
class WaitTool : public tools::Tool {
public:
    explicit WaitTool(std::atomic<bool>& started) : started_(started) {}

    std::string Name() const override { return "wait"; }
    std::string Description() const override { return "Wait for cancellation."; }
    std::string ParametersJson() const override { return R"({"type":"object","properties":{}})"; }
    tools::ToolResult Execute(const json&, const exec::CancellationTokenPtr& cancel) const override {
        started_.store(true);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!cancel->IsCancelled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return tools::ToolResult::Ok({{"cancelled", cancel->IsCancelled()}});
    }

private:
    std::atomic<bool>& started_;
};

class ThrowTool : public tools::Tool {
public:
    std::string Name() const override { return "throw"; }
    std::string Description() const override { return "Always throws."; }
    std::string ParametersJson() const override { return R"({"type":"object","properties":{}})"; }
    tools::ToolResult Execute(const json&, const exec::CancellationTokenPtr&) const override {
        throw std::runtime_error("broken tool");
    }
};

class McpServerTest : public ::testing::Test {
protected:
    McpServerTest() {
        registry_.Register(std::make_unique<EchoTool>());
        registry_.Register(std::make_unique<WaitTool>(started_));
        registry_.Register(std::make_unique<ThrowTool>());
        server_ = std::make_unique<server::McpServer>(registry_, out_);
    }

    json Request(const json& id, const std::string& method, const json& params = json::object()) {
        const auto response = server_->HandleMessage(
            {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
        EXPECT_TRUE(response.has_value());
        return response.value_or(json());
    }

    // Lines written so far, decoded.
    std::vector<json> Output() {
        std::vector<json> messages;
        std::istringstream lines(out_.str());
        std::string line;
        while (std::getline(lines, line)) {
            messages.push_back(json::parse(line));
        }
        return messages;
    }

    void WaitForStart() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!started_.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(started_.load());
    }

    std::atomic<bool> started_{false};
    tools::ToolRegistry registry_;
    std::ostringstream out_;
    std::unique_ptr<server::McpServer> server_;
};

}  // namespace

TEST_F(McpServerTest, InitializeDescribesServer) {
    const auto response = Request(1, "initialize", {{"clientInfo", {{"name", "test"}}}});
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    const auto& result = response["result"];
    EXPECT_EQ(result["protocolVersion"], server::kProtocolVersion);
    EXPECT_EQ(result["serverInfo"]["name"], "chix");
    EXPECT_TRUE(result["capabilities"].contains("tools"));
}

TEST_F(McpServerTest, PingAnswersEmptyObject) {
    const auto response = Request("abc", "ping");
    EXPECT_EQ(response["id"], "abc");
    EXPECT_EQ(response["result"], json::object());
}

TEST_F(McpServerTest, NotificationsGetNoResponse) {
    EXPECT_FALSE(server_->HandleMessage({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));
    EXPECT_FALSE(server_->HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}, {"params", {{"requestId", 99}}}}));
}

TEST_F(McpServerTest, UnknownMethodIsMethodNotFound) {
    const auto response = Request(2, "resources/list");
    EXPECT_EQ(response["error"]["code"], server::rpc::kMethodNotFound);
}

TEST_F(McpServerTest, NonObjectIsInvalidRequest) {
    const auto response = server_->HandleMessage(json::array({1, 2}));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["error"]["code"], server::rpc::kInvalidRequest);
    EXPECT_TRUE((*response)["id"].is_null());
}

TEST_F(McpServerTest, ToolsListCarriesSchemas) {
    const auto response = Request(3, "tools/list");
    const auto& tools = response["result"]["tools"];
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
    EXPECT_EQ(tools[0]["description"], "Echo the parameters back.");
}

TEST_F(McpServerTest, ToolsCallReturnsTextContent) {
    const auto response = Request(4, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hi"}}}});
    const auto& result = response["result"];
    EXPECT_FALSE(result.contains("isError"));
    ASSERT_EQ(result["content"].size(), 1u);
    EXPECT_EQ(result["content"][0]["type"], "text");
    const auto payload = json::parse(result["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["echo"]["text"], "hi");
}

TEST_F(McpServerTest, ToolsCallWithoutArgumentsUsesEmptyObject) {
    const auto response = Request(5, "tools/call", {{"name", "echo"}});
    const auto payload = json::parse(response["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["echo"], json::object());
}

TEST_F(McpServerTest, ToolsCallValidatesParams) {
    EXPECT_EQ(Request(6, "tools/call", json::object())["error"]["code"], server::rpc::kInvalidParams);
    EXPECT_EQ(Request(7, "tools/call", {{"name", "echo"}, {"arguments", "x"}})["error"]["code"],
              server::rpc::kInvalidParams);
}

TEST_F(McpServerTest, UnknownToolIsToolError) {
    const auto response = Request(8, "tools/call", {{"name", "missing"}});
    const auto& result = response["result"];
    EXPECT_EQ(result["isError"], true);
    const auto payload = json::parse(result["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["code"], "InvalidParams");
}

TEST_F(McpServerTest, ThrowingToolIsInternalError) {
    const auto response = Request(9, "tools/call", {{"name", "throw"}});
    EXPECT_EQ(response["error"]["code"], server::rpc::kInternalError);
    EXPECT_EQ(server_->InFlight(), 0u);
}

TEST_F(McpServerTest, MalformedLineIsParseError) {
    server_->HandleLine("{not json");
    const auto messages = Output();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["error"]["code"], server::rpc::kParseError);
    EXPECT_TRUE(messages[0]["id"].is_null());
}

TEST_F(McpServerTest, BlankLinesAreIgnored) {
    server_->HandleLine("");
    server_->HandleLine("   \r");
    EXPECT_TRUE(Output().empty());
}

TEST_F(McpServerTest, ServeAnswersEachLine) {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"n":1}}})" "\n");
    server_->Serve(in);

    const auto messages = Output();
    ASSERT_EQ(messages.size(), 2u);
    std::vector<int> ids;
    for (const auto& message : messages) {
        ids.push_back(message["id"].get<int>());
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<int>{1, 2}));
}

TEST_F(McpServerTest, CancelledNotificationTripsInFlightCall) {
    server_->HandleLine(R"({"jsonrpc":"2.0","id":"call-1","method":"tools/call","params":{"name":"wait"}})");
    WaitForStart();
    server_->HandleLine(
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":"call-1"}})");
    server_->WaitIdle();

    const auto messages = Output();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["id"], "call-1");
    const auto payload = json::parse(messages[0]["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["cancelled"], true);
}

TEST_F(McpServerTest, CancelAllStopsCallsAndLaterOnes) {
    server_->HandleLine(R"({"jsonrpc":"2.0","id":10,"method":"tools/call","params":{"name":"wait"}})");
    WaitForStart();
    server_->CancelAll();
    server_->WaitIdle();
    EXPECT_EQ(server_->InFlight(), 0u);

    const auto late = Request(11, "tools/call", {{"name", "wait"}});
    const auto payload = json::parse(late["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["cancelled"], true);
}

TEST_F(McpServerTest, CancelRightAfterCallIsNotLost) {
    const auto begin = std::chrono::steady_clock::now();
    server_->HandleLine(R"({"jsonrpc":"2.0","id":"call-2","method":"tools/call","params":{"name":"wait"}})");
    server_->HandleLine(
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":"call-2"}})");
    server_->WaitIdle();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    const auto messages = Output();
    ASSERT_EQ(messages.size(), 1u);
    const auto payload = json::parse(messages[0]["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["cancelled"], true);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(McpServerTest, DuplicateInFlightIdIsRejected) {
    server_->HandleLine(R"({"jsonrpc":"2.0","id":20,"method":"tools/call","params":{"name":"wait"}})");
    WaitForStart();
    server_->HandleLine(R"({"jsonrpc":"2.0","id":20,"method":"tools/call","params":{"name":"echo"}})");

    auto messages = Output();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["id"], 20);
    EXPECT_EQ(messages[0]["error"]["code"], server::rpc::kInvalidRequest);

    // The first call still owns the id and can be cancelled through it.
    server_->HandleLine(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":20}})");
    server_->WaitIdle();
    messages = Output();
    ASSERT_EQ(messages.size(), 2u);
    const auto payload = json::parse(messages[1]["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(payload["cancelled"], true);

    const auto reused = Request(20, "tools/call", {{"name", "echo"}});
    EXPECT_TRUE(reused.contains("result"));
}
