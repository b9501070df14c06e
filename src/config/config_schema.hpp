#pragma once

#include <cstddef>
#include <string>

namespace chix::config {

// Upper bound for exec.timeoutS; larger values are ignored.
constexpr long long kMaxTimeoutS = 7LL * 24 * 60 * 60;

struct ExecConfig {
    std::string nix_binary = "nix";
    int timeout_s = 300;
};

struct OutputLimitsConfig {
    std::size_t default_max_bytes = 100000;
    std::size_t default_max_lines = 2000;
    std::size_t log_tail_default = 500;
    std::size_t search_limit_default = 50;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    ExecConfig exec;
    OutputLimitsConfig output_limits;
    LogSettings log;
};

}  // namespace chix::config
