#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "exec/errors.hpp"
#include "exec/limited_text.hpp"
#include "utils/common.hpp"

namespace chix::exec {

constexpr std::chrono::seconds kDefaultTimeout{300};

class CommandSpec {
public:
    CommandSpec(std::string program, std::vector<std::string> arguments)
        : program_(std::move(program))
        , arguments_(std::move(arguments)) {}

    const std::string& Program() const { return program_; }
    const std::vector<std::string>& Arguments() const { return arguments_; }

    // Appends an argument the caller already checked against a grammar of its
    // own (a Nix expression). The metacharacter check does not apply to it.
    void AppendVerbatim(std::string argument) {
        verbatim_.push_back(arguments_.size());
        arguments_.push_back(std::move(argument));
    }

    bool IsVerbatim(std::size_t index) const {
        return std::find(verbatim_.begin(), verbatim_.end(), index) != verbatim_.end();
    }

    std::string Display() const {
        if (arguments_.empty()) {
            return program_;
        }
        return program_ + " " + utils::Join(arguments_, " ");
    }

private:
    std::string program_;
    std::vector<std::string> arguments_;
    std::vector<std::size_t> verbatim_;
};

// Shared between the caller that may abort an invocation and the runner
// polling it. Tripping it is one-way.
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

struct ExecutionContext {
    std::optional<std::string> working_dir;
    std::vector<std::pair<std::string, std::string>> env;
    std::chrono::milliseconds timeout = kDefaultTimeout;
    CancellationTokenPtr cancel;
    std::size_t stderr_budget = kDiagnosticMaxBytes;
};

struct ExecutionOutcome {
    std::string command_display;
    bool succeeded = false;
    std::string stdout_text;
    LimitedText stderr_text;
    std::optional<int> exit_code;
    std::optional<Failure> failure;
};

struct SequenceResult {
    bool overall_succeeded = true;
    std::vector<ExecutionOutcome> outcomes;
};

}  // namespace chix::exec
