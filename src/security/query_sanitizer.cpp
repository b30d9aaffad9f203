#include "security/query_sanitizer.hpp"

#include <cstdint>

namespace sqlmcp {

namespace {

enum class ScanState {
    NORMAL,
    LINE_COMMENT,
    BLOCK_COMMENT,
    STRING_LITERAL,
    BRACKET_IDENTIFIER,
    QUOTED_IDENTIFIER
};

// Characters T-SQL allows inside a regular identifier
constexpr bool is_identifier_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '@' || c == '#' || c == '$';
}

} // anonymous namespace

std::string QuerySanitizer::sanitize(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    ScanState state = ScanState::NORMAL;
    const size_t n = text.size();
    size_t i = 0;
    size_t opened_at = 0;      // start of the construct being removed
    uint32_t comment_depth = 0;

    // Closing a delimited construct: swallow its closer, emit one space
    const auto close = [&](size_t closer_len) {
        out += ' ';
        state = ScanState::NORMAL;
        i += closer_len;
    };

    while (i < n) {
        const char c = text[i];
        const char next = (i + 1 < n) ? text[i + 1] : '\0';

        switch (state) {
            case ScanState::NORMAL:
                opened_at = i;
                if (c == '/' && next == '*') {
                    state = ScanState::BLOCK_COMMENT;
                    comment_depth = 1;
                    i += 2;
                } else if (c == '-' && next == '-') {
                    state = ScanState::LINE_COMMENT;
                    i += 2;
                } else if (c == '\'') {
                    state = ScanState::STRING_LITERAL;
                    ++i;
                } else if ((c == 'N' || c == 'n') && next == '\'' &&
                           (i == 0 || !is_identifier_char(text[i - 1]))) {
                    // N'...' wide literal: the marker goes with the literal
                    state = ScanState::STRING_LITERAL;
                    i += 2;
                } else if (c == '[') {
                    state = ScanState::BRACKET_IDENTIFIER;
                    ++i;
                } else if (c == '"') {
                    state = ScanState::QUOTED_IDENTIFIER;
                    ++i;
                } else {
                    out += c;
                    ++i;
                }
                break;

            case ScanState::LINE_COMMENT:
                if (c == '\n') {
                    // Newline itself is emitted by NORMAL on the next iteration
                    out += ' ';
                    state = ScanState::NORMAL;
                } else {
                    ++i;
                }
                break;

            case ScanState::BLOCK_COMMENT:
                if (c == '/' && next == '*') {
                    ++comment_depth;
                    i += 2;
                } else if (c == '*' && next == '/') {
                    if (--comment_depth == 0) {
                        close(2);
                    } else {
                        i += 2;
                    }
                } else {
                    ++i;
                }
                break;

            case ScanState::STRING_LITERAL:
                if (c == '\'' && next == '\'') {
                    i += 2;  // doubled quote stays inside the literal
                } else if (c == '\'') {
                    close(1);
                } else {
                    ++i;
                }
                break;

            case ScanState::BRACKET_IDENTIFIER:
                if (c == ']' && next == ']') {
                    i += 2;  // ]] is an escaped bracket
                } else if (c == ']') {
                    close(1);
                } else {
                    ++i;
                }
                break;

            case ScanState::QUOTED_IDENTIFIER:
                if (c == '"' && next == '"') {
                    i += 2;
                } else if (c == '"') {
                    close(1);
                } else {
                    ++i;
                }
                break;
        }
    }

    // A trailing line comment ends cleanly at end of input. Any other open
    // construct is left in place, opener included, so its tail is still scanned.
    if (state == ScanState::LINE_COMMENT) {
        out += ' ';
    } else if (state != ScanState::NORMAL) {
        out.append(text.substr(opened_at));
    }

    return out;
}

} // namespace sqlmcp
