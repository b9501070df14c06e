#include "exec/validators.hpp"

#include <algorithm>
#include <regex>

namespace chix::exec {
namespace {

const std::regex& ReferencePattern() {
    static const std::regex pattern(R"(^[a-zA-Z0-9._\-/:#+]+$)");
    return pattern;
}

const std::regex& AttrPathPattern() {
    static const std::regex pattern(R"(^[a-zA-Z0-9._\-]+$)");
    return pattern;
}

const std::regex& StorePathPattern() {
    static const std::regex pattern(R"(^/nix/store/[a-z0-9]{32}-[a-zA-Z0-9._\-]+$)");
    return pattern;
}

const std::regex& StoreSubpathPattern() {
    static const std::regex pattern(R"(^/nix/store/[a-z0-9]{32}-[a-zA-Z0-9._\-]+(/[a-zA-Z0-9._\-]+)*$)");
    return pattern;
}

const std::regex& PathPattern() {
    static const std::regex pattern(R"(^[a-zA-Z0-9._\-/~]+$)");
    return pattern;
}

constexpr const char* kShellMetacharacters = ";&|`$(){}\\<>!";

}  // namespace

ValidationVerdict ValidationVerdict::Accept() {
    return ValidationVerdict{};
}

ValidationVerdict ValidationVerdict::Reject(ErrorCode code,
                                            std::string message,
                                            std::string offending) {
    ValidationVerdict verdict{};
    verdict.ok = false;
    verdict.code = code;
    verdict.message = std::move(message);
    verdict.offending = std::move(offending);
    return verdict;
}

ValidationVerdict ValidateReference(const std::string& value) {
    if (!std::regex_match(value, ReferencePattern())) {
        return ValidationVerdict::Reject(
            ErrorCode::kInvalidReference,
            "invalid flake reference: `" + value + "`",
            value);
    }
    return ValidationVerdict::Accept();
}

ValidationVerdict ValidateAttrPath(const std::string& value) {
    if (!std::regex_match(value, AttrPathPattern())) {
        return ValidationVerdict::Reject(
            ErrorCode::kInvalidAttrPath,
            "invalid attribute path: `" + value + "`",
            value);
    }
    return ValidationVerdict::Accept();
}

ValidationVerdict ValidateStorePath(const std::string& value) {
    if (!std::regex_match(value, StorePathPattern())) {
        return ValidationVerdict::Reject(
            ErrorCode::kInvalidStorePath,
            "invalid store path: `" + value + "`",
            value);
    }
    return ValidationVerdict::Accept();
}

ValidationVerdict ValidateStoreSubpath(const std::string& value) {
    auto reject = [&value]() {
        return ValidationVerdict::Reject(
            ErrorCode::kInvalidStorePath,
            "invalid store subpath: `" + value + "`",
            value);
    };
    if (!std::regex_match(value, StoreSubpathPattern())) {
        return reject();
    }
    std::size_t begin = 0;
    while (begin <= value.size()) {
        const auto end = std::min(value.find('/', begin), value.size());
        const auto component = value.substr(begin, end - begin);
        if (component == "." || component == "..") {
            return reject();
        }
        begin = end + 1;
    }
    return ValidationVerdict::Accept();
}

ValidationVerdict ValidatePath(const std::string& value) {
    if (!std::regex_match(value, PathPattern())) {
        return ValidationVerdict::Reject(
            ErrorCode::kInvalidPath,
            "invalid path: `" + value + "`",
            value);
    }
    return ValidationVerdict::Accept();
}

ValidationVerdict ValidateArgument(const std::string& value) {
    if (value.find_first_of(kShellMetacharacters) != std::string::npos) {
        return ValidationVerdict::Reject(
            ErrorCode::kUnsafeArgument,
            "shell metacharacters not allowed: `" + value +
                "`. Retry with the metacharacters removed; use separate array entries "
                "or tool parameters instead of shell operators",
            value);
    }
    return ValidationVerdict::Accept();
}

ValidationVerdict ValidateArguments(const std::vector<std::string>& values) {
    for (const auto& value : values) {
        auto verdict = ValidateArgument(value);
        if (!verdict) {
            return verdict;
        }
    }
    return ValidationVerdict::Accept();
}

ValidationVerdict ValidateExpression(const std::string& value) {
    if (value.find('\0') != std::string::npos) {
        return ValidationVerdict::Reject(
            ErrorCode::kInvalidExpression,
            "nix expression contains invalid characters (null bytes)",
            value);
    }
    return ValidationVerdict::Accept();
}

}  // namespace chix::exec
