#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

#include "exec/errors.hpp"
#include "exec/types.hpp"

namespace chix::exec {

struct ProcessResult {
    std::optional<int> exit_code;
    bool timed_out = false;
    bool cancelled = false;
    // The child ended but its wait status could not be collected.
    bool status_lost = false;
    std::optional<std::string> spawn_error;
    pid_t pid = -1;
    std::string output;
    std::string error;

    bool Succeeded() const { return exit_code && *exit_code == 0; }
    std::optional<Failure> ToFailure() const;
};

struct ProcessOptions {
    std::optional<std::string> working_dir;
    std::vector<std::pair<std::string, std::string>> env;
    std::chrono::milliseconds timeout = kDefaultTimeout;
    CancellationTokenPtr cancel;
};

// Runs one program directly (never through a shell) in its own process group.
// Whatever path leaves Run, the group is killed and the child reaped before
// control returns.
class ProcessRunner {
public:
    static ProcessResult Run(const std::string& program,
                             const std::vector<std::string>& arguments,
                             const ProcessOptions& options);

    static ProcessResult Run(const CommandSpec& spec, const ExecutionContext& context);
};

}  // namespace chix::exec
