#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "exec/process_runner.hpp"
#include "server/mcp_server.hpp"
#include "tools/catalog.hpp"
#include "tools/tool_registry.hpp"
#include "utils/logging.hpp"
#include "version.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage(std::ostream& out) {
    out << "chix " << chix::kVersion << " - Nix tools over the Model Context Protocol\n"
        << "\n"
        << "Usage:\n"
        << "  chix                 serve MCP on stdin/stdout\n"
        << "  chix install-claude  register chix with Claude Code\n"
        << "  chix --version       print the version\n"
        << "  chix --help          print this help\n";
}

std::string SelfPath(const char* argv0) {
    std::error_code ec;
    const auto path = std::filesystem::canonical("/proc/self/exe", ec);
    if (!ec) {
        return path.string();
    }
    return argv0 ? argv0 : "chix";
}

int InstallClaude(const char* argv0) {
    const auto self = SelfPath(argv0);
    chix::exec::ProcessOptions options{};
    options.timeout = std::chrono::seconds(60);

    // A missing registration is fine; remove only makes add idempotent.
    const auto removed = chix::exec::ProcessRunner::Run("claude", {"mcp", "remove", "chix"}, options);
    if (removed.spawn_error) {
        std::cerr << "claude CLI not found: " << *removed.spawn_error << std::endl;
        return 1;
    }

    const auto added = chix::exec::ProcessRunner::Run(
        "claude", {"mcp", "add", "chix", "--", self}, options);
    if (!added.Succeeded()) {
        std::cerr << "claude mcp add failed";
        if (added.exit_code) {
            std::cerr << " (exit " << *added.exit_code << ")";
        }
        std::cerr << "\n" << added.error << std::endl;
        return 1;
    }
    std::cout << "Registered chix with Claude Code: " << self << std::endl;
    return 0;
}

int Serve() {
    const auto config = chix::config::LoadConfig();
    chix::utils::LogConfig log_config{};
    log_config.min_level = chix::utils::ParseLogLevel(config.log.level, chix::utils::LogLevel::kInfo);
    chix::utils::SetLogConfig(log_config);

    chix::tools::ToolRegistry registry;
    chix::tools::RegisterNixTools(registry, chix::tools::NixToolSettings::FromConfig(config));
    chix::utils::LogInfo("cli", "starting", {
        {"nix", config.exec.nix_binary},
        {"timeout_s", std::to_string(config.exec.timeout_s)},
        {"tools", std::to_string(registry.List().size())}});

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    chix::server::McpServer server(registry, std::cout);
    std::atomic<bool> input_closed{false};
    std::thread reader([&server, &input_closed]() {
        server.Serve(std::cin);
        input_closed.store(true);
    });

    while (!input_closed.load()) {
        if (g_signal != 0) {
            const int signal = g_signal;
            chix::utils::LogInfo("cli", "shutting down", {{"signal", std::to_string(signal)}});
            std::thread([] {
                std::this_thread::sleep_for(std::chrono::seconds(5));
                std::_Exit(130);
            }).detach();
            server.CancelAll();
            server.WaitIdle();
            std::cout.flush();
            // The reader is blocked on stdin and cannot be joined.
            std::_Exit(128 + signal);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (reader.joinable()) {
        reader.join();
    }
    chix::utils::LogInfo("cli", "stopped");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        return Serve();
    }

    const std::string command = argv[1];
    if (command == "--version" || command == "-V") {
        std::cout << "chix " << chix::kVersion << std::endl;
        return 0;
    }
    if (command == "--help" || command == "-h") {
        PrintUsage(std::cout);
        return 0;
    }
    if (command == "install-claude") {
        return InstallClaude(argc > 0 ? argv[0] : nullptr);
    }

    std::cerr << "unknown command: " << command << "\n\n";
    PrintUsage(std::cerr);
    return 1;
}
