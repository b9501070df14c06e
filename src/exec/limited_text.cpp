#include "exec/limited_text.hpp"

#include <algorithm>

namespace chix::exec {
namespace {

constexpr const char* kReplacementCharacter = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

std::size_t CountLines(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    std::size_t count = 0;
    for (const char c : text) {
        if (c == '\n') {
            ++count;
        }
    }
    if (text.back() != '\n') {
        ++count;
    }
    return count;
}

// Byte offset just past the end (newline included) of the first `lines` lines.
std::size_t HeadOffset(const std::string& text, std::size_t lines) {
    std::size_t offset = 0;
    for (std::size_t i = 0; i < lines && offset < text.size(); ++i) {
        const auto newline = text.find('\n', offset);
        if (newline == std::string::npos) {
            return text.size();
        }
        offset = newline + 1;
    }
    return offset;
}

// Byte offset where the last `lines` lines begin.
std::size_t TailOffset(const std::string& text, std::size_t lines) {
    const auto total = CountLines(text);
    if (lines >= total) {
        return 0;
    }
    return HeadOffset(text, total - lines);
}

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0.
std::size_t SequenceLength(const std::string& bytes, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    const auto remaining = bytes.size() - pos;
    auto at = [&](std::size_t i) { return static_cast<unsigned char>(bytes[pos + i]); };

    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return (remaining >= 2 && IsContinuation(at(1))) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (remaining < 3) {
            return 0;
        }
        const auto second = at(1);
        if (lead == 0xE0 && (second < 0xA0 || second > 0xBF)) {
            return 0;
        }
        if (lead == 0xED && (second < 0x80 || second > 0x9F)) {
            return 0;
        }
        if (!IsContinuation(second) || !IsContinuation(at(2))) {
            return 0;
        }
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (remaining < 4) {
            return 0;
        }
        const auto second = at(1);
        if (lead == 0xF0 && (second < 0x90 || second > 0xBF)) {
            return 0;
        }
        if (lead == 0xF4 && (second < 0x80 || second > 0x8F)) {
            return 0;
        }
        if (!IsContinuation(second) || !IsContinuation(at(2)) || !IsContinuation(at(3))) {
            return 0;
        }
        return 4;
    }
    return 0;
}

}  // namespace

std::size_t Utf8PrefixLength(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text.size();
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && IsContinuation(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    return cut;
}

LimitedText LimitText(const std::string& text, std::size_t max_bytes) {
    LimitedText result{};
    if (text.size() <= max_bytes) {
        result.content = text;
        return result;
    }
    const auto kept = Utf8PrefixLength(text, max_bytes);
    result.content = text.substr(0, kept);
    result.truncated = true;
    TruncationInfo info{};
    info.original_size = text.size();
    info.kept_size = kept;
    result.truncation_info = info;
    return result;
}

LimitedText LimitDiagnostic(const std::string& text) {
    return LimitText(text, kDiagnosticMaxBytes);
}

LimitedText LimitOutput(const std::string& text, const OutputLimits& limits) {
    std::string content = text;
    std::optional<std::string> position;

    if (limits.head) {
        const auto end = HeadOffset(content, *limits.head);
        if (end < content.size()) {
            content.resize(end);
            position = "head";
        }
    } else if (limits.tail) {
        const auto begin = TailOffset(content, *limits.tail);
        if (begin > 0) {
            content.erase(0, begin);
            position = "tail";
        }
    }

    if (limits.max_lines) {
        const auto end = HeadOffset(content, *limits.max_lines);
        if (end < content.size()) {
            content.resize(end);
            if (!position) {
                position = "head";
            }
        }
    }

    if (limits.max_bytes && content.size() > *limits.max_bytes) {
        const auto window = content.substr(0, *limits.max_bytes);
        const auto last_newline = window.rfind('\n');
        if (last_newline != std::string::npos) {
            content.resize(last_newline);
        } else {
            content.resize(Utf8PrefixLength(content, *limits.max_bytes));
        }
        if (!position) {
            position = "head";
        }
    }

    LimitedText result{};
    result.truncated = content.size() < text.size();
    if (result.truncated) {
        TruncationInfo info{};
        info.original_size = text.size();
        info.kept_size = content.size();
        info.original_lines = CountLines(text);
        info.kept_lines = CountLines(content);
        info.position = position;
        result.truncation_info = info;
    }
    result.content = std::move(content);
    return result;
}

Pagination Paginate(std::size_t total, const ArrayLimits& limits) {
    Pagination page{};
    page.total = total;
    page.offset = limits.offset.value_or(0);
    page.limit = limits.limit.value_or(total);
    page.begin = std::min(page.offset, total);
    page.end = page.begin + std::min(page.limit, total - page.begin);
    page.has_more = page.end < total;
    return page;
}

std::string SanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const auto length = SequenceLength(bytes, pos);
        if (length == 0) {
            out += kReplacementCharacter;
            ++pos;
            continue;
        }
        out.append(bytes, pos, length);
        pos += length;
    }
    return out;
}

}  // namespace chix::exec
