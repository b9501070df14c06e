#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace chix::exec {

// Budget for a subprocess's stderr. No tool parameter changes it.
constexpr std::size_t kDiagnosticMaxBytes = 100000;

struct TruncationInfo {
    std::size_t original_size = 0;
    std::size_t kept_size = 0;
    std::optional<std::size_t> original_lines;
    std::optional<std::size_t> kept_lines;
    std::optional<std::string> position;
};

struct LimitedText {
    std::string content;
    bool truncated = false;
    std::optional<TruncationInfo> truncation_info;
};

// Caller-directed shaping of primary output. head wins over tail.
struct OutputLimits {
    std::optional<std::size_t> head;
    std::optional<std::size_t> tail;
    std::optional<std::size_t> max_bytes;
    std::optional<std::size_t> max_lines;
};

// Caller-directed paging of a list of items.
struct ArrayLimits {
    std::optional<std::size_t> offset;
    std::optional<std::size_t> limit;
};

// Window [begin, end) over `total` items. has_more is set when items remain
// after the window.
struct Pagination {
    std::size_t offset = 0;
    std::size_t limit = 0;
    std::size_t total = 0;
    std::size_t begin = 0;
    std::size_t end = 0;
    bool has_more = false;

    std::size_t Kept() const { return end - begin; }
    bool Truncated() const { return Kept() < total; }
};

LimitedText LimitText(const std::string& text, std::size_t max_bytes);

LimitedText LimitDiagnostic(const std::string& text);

LimitedText LimitOutput(const std::string& text, const OutputLimits& limits);

// Without a limit every item from the offset on is kept.
Pagination Paginate(std::size_t total, const ArrayLimits& limits);

// Length of the longest prefix of `text` no longer than `max_bytes` that does
// not end inside a UTF-8 sequence.
std::size_t Utf8PrefixLength(const std::string& text, std::size_t max_bytes);

// Lossy decoding: every byte that does not start a well-formed UTF-8 sequence
// is replaced by U+FFFD.
std::string SanitizeUtf8(const std::string& bytes);

}  // namespace chix::exec
