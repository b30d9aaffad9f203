#include "security/readonly_validator.hpp"
#include "security/query_sanitizer.hpp"
#include "core/utils.hpp"

#include <format>
#include <string>
#include <unordered_set>

namespace sqlmcp {

namespace {

constexpr bool is_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// Regex \w
constexpr bool is_word_char(char c) noexcept {
    return is_alpha(c) || is_digit(c) || c == '_';
}

// Data/schema mutating or privilege-sensitive T-SQL keywords
const std::unordered_set<std::string>& denied_keywords() {
    static const std::unordered_set<std::string> keywords = {
        "add", "alter", "backup", "begin", "bulk", "commit", "create",
        "dbcc", "delete", "deny", "drop", "exec", "execute", "grant",
        "insert", "into", "merge", "openquery", "openrowset",
        "opendatasource", "reconfigure", "restore", "revoke", "rollback",
        "save", "set", "shutdown", "truncate", "update", "use",
    };
    return keywords;
}

// ^(with|select)\b, case-insensitive
bool starts_with_clause(std::string_view text, std::string_view clause) {
    if (!utils::istarts_with(text, clause)) return false;
    return text.size() == clause.size() || !is_word_char(text[clause.size()]);
}

} // anonymous namespace

size_t ReadonlyValidator::char_length(std::string_view text) {
    size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::vector<std::string_view> ReadonlyValidator::tokenize(std::string_view sanitized) {
    std::vector<std::string_view> tokens;
    const size_t n = sanitized.size();
    size_t i = 0;

    while (i < n) {
        if (!is_word_char(sanitized[i])) {
            ++i;
            continue;
        }
        // A run that starts with digits ("1update") still yields the
        // identifier part that follows them
        while (i < n && is_digit(sanitized[i])) ++i;
        const size_t start = i;
        while (i < n && is_word_char(sanitized[i])) ++i;
        if (i > start) {
            tokens.push_back(sanitized.substr(start, i - start));
        }
    }
    return tokens;
}

bool ReadonlyValidator::is_denied_keyword(std::string_view token) {
    return denied_keywords().contains(utils::to_lower(token));
}

bool ReadonlyValidator::is_procedure_call(std::string_view token) {
    return utils::istarts_with(token, "xp_") || utils::istarts_with(token, "sp_");
}

ValidationVerdict ReadonlyValidator::validate(std::string_view raw,
                                              const ExecutionPolicy& policy) {
    if (!policy.enforce_readonly) {
        return ValidationVerdict::admit();
    }

    // 1. Non-empty
    if (utils::trim_left(raw).empty()) {
        return ValidationVerdict::reject(RejectReason::EMPTY, "Query is empty");
    }

    // 2. Length bound, on the raw text
    const size_t length = char_length(raw);
    if (length > policy.max_query_chars) {
        return ValidationVerdict::reject(RejectReason::TOO_LONG,
            std::format("Query is {} characters; the limit is {}",
                        length, policy.max_query_chars));
    }

    const std::string sanitized = QuerySanitizer::sanitize(raw);

    // 3. Leading clause
    const std::string_view body = utils::trim_left(sanitized);
    if (!starts_with_clause(body, "select") && !starts_with_clause(body, "with")) {
        return ValidationVerdict::reject(RejectReason::WRONG_LEADING_CLAUSE,
            "Only SELECT statements (optionally prefixed by WITH) are allowed");
    }

    // 4. Single statement: one trailing semicolon is tolerated
    const std::string_view stmt = utils::trim_right(sanitized);
    const size_t semi = stmt.find(';');
    if (semi != std::string_view::npos && semi != stmt.size() - 1) {
        return ValidationVerdict::reject(RejectReason::MULTIPLE_STATEMENTS,
            "Multiple statements are not allowed");
    }

    const auto tokens = tokenize(sanitized);

    // 5. Keyword denylist
    for (const auto token : tokens) {
        if (is_denied_keyword(token)) {
            return ValidationVerdict::reject(RejectReason::DISALLOWED_KEYWORD,
                std::format("Keyword '{}' is not allowed in read-only queries", token),
                std::string(token));
        }
    }

    // 6. System / extended stored procedures, with or without EXEC
    for (const auto token : tokens) {
        if (is_procedure_call(token)) {
            return ValidationVerdict::reject(RejectReason::DISALLOWED_PROCEDURE_CALL,
                std::format("Stored procedure '{}' may not be called", token),
                std::string(token));
        }
    }

    return ValidationVerdict::admit();
}

} // namespace sqlmcp
