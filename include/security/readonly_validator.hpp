#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlmcp {

/**
 * @brief Read-only admission policy for caller-supplied T-SQL
 *
 * Pure and deterministic: no I/O, no state. Checks run in a fixed order and
 * stop at the first failure:
 *
 *   1. non-empty              -> EMPTY
 *   2. raw length bound       -> TOO_LONG
 *   3. leading SELECT / WITH  -> WRONG_LEADING_CLAUSE
 *   4. at most one trailing ; -> MULTIPLE_STATEMENTS
 *   5. keyword denylist       -> DISALLOWED_KEYWORD
 *   6. xp_ / sp_ prefixes     -> DISALLOWED_PROCEDURE_CALL
 *
 * Checks 3-6 run on QuerySanitizer output. This is a lexical denylist, not a
 * parser; it accepts false positives to avoid false negatives.
 */
class ReadonlyValidator {
public:
    [[nodiscard]] static ValidationVerdict validate(std::string_view raw,
                                                    const ExecutionPolicy& policy);

    /// Identifier-shaped tokens of already-sanitized text, in order
    [[nodiscard]] static std::vector<std::string_view> tokenize(std::string_view sanitized);

    [[nodiscard]] static bool is_denied_keyword(std::string_view token);
    [[nodiscard]] static bool is_procedure_call(std::string_view token);

    /// Length in code points (UTF-8 continuation bytes are not counted)
    [[nodiscard]] static size_t char_length(std::string_view text);
};

} // namespace sqlmcp
