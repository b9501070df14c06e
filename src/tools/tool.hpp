#pragma once

#include <stdexcept>
#include <string>

#include "exec/errors.hpp"
#include "exec/types.hpp"
#include "nlohmann/json.hpp"

namespace chix::tools {

struct ToolResult {
    bool is_error = false;
    nlohmann::json value;

    static ToolResult Ok(nlohmann::json value) {
        ToolResult result{};
        result.value = std::move(value);
        return result;
    }

    static ToolResult Error(const exec::Failure& failure) {
        ToolResult result{};
        result.is_error = true;
        result.value = {{"code", exec::ToString(failure.code)}, {"message", failure.message}};
        return result;
    }
};

// Thrown by parameter parsing and validation inside a tool; the registry turns
// it into an error result. Never escapes ToolRegistry::Execute.
class ToolError : public std::runtime_error {
public:
    explicit ToolError(exec::Failure failure)
        : std::runtime_error(failure.message)
        , failure_(std::move(failure)) {}

    ToolError(exec::ErrorCode code, const std::string& message)
        : ToolError(exec::Failure{code, message}) {}

    const exec::Failure& GetFailure() const { return failure_; }

private:
    exec::Failure failure_;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual ToolResult Execute(const nlohmann::json& params,
                               const exec::CancellationTokenPtr& cancel) const = 0;
};

}  // namespace chix::tools
