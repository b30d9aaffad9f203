#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sqlmcp {

// ============================================================================
// Execution Policy
// ============================================================================

/**
 * @brief Read-only execution policy
 *
 * Built once at startup from Settings and borrowed (by const reference) by the
 * validator, row limiter and executor. Never mutated after construction.
 */
struct ExecutionPolicy {
    bool enforce_readonly = true;
    uint32_t max_query_chars = 20000;
    uint32_t max_rows = 500;
    uint32_t query_timeout_seconds = 30;
};

// ============================================================================
// Validation
// ============================================================================

enum class RejectReason {
    EMPTY,
    TOO_LONG,
    WRONG_LEADING_CLAUSE,
    MULTIPLE_STATEMENTS,
    DISALLOWED_KEYWORD,
    DISALLOWED_PROCEDURE_CALL
};

inline const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::EMPTY: return "empty";
        case RejectReason::TOO_LONG: return "too-long";
        case RejectReason::WRONG_LEADING_CLAUSE: return "wrong-leading-clause";
        case RejectReason::MULTIPLE_STATEMENTS: return "multiple-statements";
        case RejectReason::DISALLOWED_KEYWORD: return "disallowed-keyword";
        case RejectReason::DISALLOWED_PROCEDURE_CALL: return "disallowed-procedure-call";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of read-only validation: Admitted, or Rejected(reason)
 *
 * `token` is set for keyword and procedure-call rejections.
 */
struct ValidationVerdict {
    bool admitted = true;
    RejectReason reason = RejectReason::EMPTY;
    std::string token;
    std::string message;

    static ValidationVerdict admit() { return {}; }

    static ValidationVerdict reject(RejectReason reason, std::string message,
                                    std::string token = {}) {
        ValidationVerdict v;
        v.admitted = false;
        v.reason = reason;
        v.token = std::move(token);
        v.message = std::move(message);
        return v;
    }
};

// ============================================================================
// Result Set
// ============================================================================

/// NULL, bit, integer, floating, text (decimals and dates travel as text)
using CellValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

/// One shaped row: column name -> value, in column order
using ShapedRow = std::vector<std::pair<std::string, CellValue>>;

/**
 * @brief Shaped query result
 *
 * `truncated` is true when row_count reached row_limit. It is an upper-bound
 * signal: the server-side cap was hit, so more rows may exist, but it does
 * not prove that they do.
 */
struct ResultSet {
    std::vector<ShapedRow> rows;
    uint32_t row_count = 0;
    uint32_t row_limit = 0;
    bool truncated = false;
};

/**
 * @brief Caller input for the bounded query operation
 */
struct QueryRequest {
    std::string database;
    std::string query;
    std::optional<int64_t> max_rows;   // absent = policy ceiling
};

} // namespace sqlmcp
