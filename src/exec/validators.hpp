#pragma once

#include <optional>
#include <string>
#include <vector>

#include "exec/errors.hpp"

namespace chix::exec {

struct ValidationVerdict {
    bool ok = true;
    ErrorCode code = ErrorCode::kInvalidParams;
    std::string message;
    std::string offending;

    explicit operator bool() const { return ok; }

    static ValidationVerdict Accept();
    static ValidationVerdict Reject(ErrorCode code, std::string message, std::string offending);

    Failure ToFailure() const { return Failure{code, message}; }
};

// Flake references and installables: ".#default", "github:NixOS/nixpkgs#hello".
ValidationVerdict ValidateReference(const std::string& value);

// One attribute name or dotted path segment, e.g. an input name: "nixpkgs".
ValidationVerdict ValidateAttrPath(const std::string& value);

// /nix/store/<32-char hash>-<name>
ValidationVerdict ValidateStorePath(const std::string& value);

// A store path optionally followed by /-separated components; "." and ".."
// components are rejected.
ValidationVerdict ValidateStoreSubpath(const std::string& value);

ValidationVerdict ValidatePath(const std::string& value);

ValidationVerdict ValidateArgument(const std::string& value);

// Fails on the first element carrying a shell metacharacter and names it.
ValidationVerdict ValidateArguments(const std::vector<std::string>& values);

// Nix expressions reach nix through argv, never a shell, so only NUL is rejected.
ValidationVerdict ValidateExpression(const std::string& value);

}  // namespace chix::exec
