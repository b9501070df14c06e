#include "exec/sequential_executor.hpp"

#include <vector>

#include "exec/limited_text.hpp"
#include "exec/process_runner.hpp"
#include "exec/validators.hpp"
#include "utils/logging.hpp"

namespace chix::exec {
namespace {

ExecutionOutcome RejectedOutcome(const CommandSpec& spec,
                                 const ValidationVerdict& verdict,
                                 const ExecutionContext& context) {
    ExecutionOutcome outcome{};
    outcome.command_display = spec.Display();
    outcome.succeeded = false;
    outcome.failure = Failure{verdict.code, LimitText(verdict.message, context.stderr_budget).content};
    return outcome;
}

std::vector<std::string> CheckedArguments(const CommandSpec& spec) {
    std::vector<std::string> checked;
    const auto& arguments = spec.Arguments();
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (!spec.IsVerbatim(i)) {
            checked.push_back(arguments[i]);
        }
    }
    return checked;
}

}  // namespace

ExecutionOutcome SequentialExecutor::RunSingle(const CommandSpec& spec,
                                               const ExecutionContext& context) {
    auto verdict = ValidateArgument(spec.Program());
    if (verdict) {
        verdict = ValidateArguments(CheckedArguments(spec));
    }
    if (!verdict) {
        utils::LogWarn("exec", "rejected before spawn", {
            {"command", spec.Program()},
            {"reason", ToString(verdict.code)}});
        return RejectedOutcome(spec, verdict, context);
    }

    const auto result = ProcessRunner::Run(spec, context);

    ExecutionOutcome outcome{};
    outcome.command_display = spec.Display();
    outcome.succeeded = result.Succeeded();
    outcome.stdout_text = result.output;
    outcome.stderr_text = LimitText(result.error, context.stderr_budget);
    outcome.exit_code = result.exit_code;
    outcome.failure = result.ToFailure();
    if (outcome.failure) {
        outcome.failure->message = LimitText(outcome.failure->message, context.stderr_budget).content;
    }
    return outcome;
}

SequenceResult SequentialExecutor::Run(const std::vector<CommandSpec>& commands,
                                       const ExecutionContext& context) {
    SequenceResult result{};
    result.overall_succeeded = true;
    for (const auto& spec : commands) {
        auto outcome = RunSingle(spec, context);
        const bool succeeded = outcome.succeeded;
        result.outcomes.push_back(std::move(outcome));
        if (!succeeded) {
            result.overall_succeeded = false;
            utils::LogInfo("exec", "sequence stopped", {
                {"step", std::to_string(result.outcomes.size())},
                {"of", std::to_string(commands.size())}});
            break;
        }
    }
    return result;
}

}  // namespace chix::exec
