#pragma once

#include <vector>

#include "exec/types.hpp"

namespace chix::exec {

class SequentialExecutor {
public:
    // Validates, runs and limits one command. Never throws for a failed
    // command; the failure is recorded on the outcome.
    static ExecutionOutcome RunSingle(const CommandSpec& spec, const ExecutionContext& context);

    // Logical AND over `commands`: runs them in order and stops after the
    // first outcome that did not succeed. An empty list succeeds vacuously.
    static SequenceResult Run(const std::vector<CommandSpec>& commands,
                              const ExecutionContext& context);
};

}  // namespace chix::exec
