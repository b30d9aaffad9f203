#pragma once

#include <string>
#include <string_view>

namespace sqlmcp {

/**
 * @brief Strips lexical noise from T-SQL text before keyword scanning
 *
 * Single left-to-right pass over the input. Whichever construct opens first
 * wins, so "--" inside a string literal is string content and a quote inside
 * a comment or quoted identifier is part of that construct.
 *
 * Removed constructs:
 * - block comments   slash-star ... star-slash, nested as the engine nests them
 * - line comments    -- ... up to, but not including, the newline
 * - string literals  'it''s' with an optional N wide-string marker
 * - bracket identifiers  [a]]b] (']]' is an escaped bracket)
 * - quoted identifiers   "a""b" ('""' is an escaped quote)
 *
 * Each removed span becomes exactly one space, so adjacent tokens are never
 * glued together. An unterminated construct other than a line comment is
 * kept verbatim from its opener to end of input.
 *
 * Total: never fails, runs in O(n).
 */
class QuerySanitizer {
public:
    [[nodiscard]] static std::string sanitize(std::string_view text);
};

} // namespace sqlmcp
