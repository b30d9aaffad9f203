#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace sqlmcp {

/**
 * @brief Resolves a caller's requested row cap against the policy ceiling
 *
 * Absent, non-positive or unparseable requests resolve to policy.max_rows;
 * anything else resolves to min(requested, policy.max_rows). Never fails and
 * always returns a positive value (given a positive ceiling).
 */
class RowLimiter {
public:
    [[nodiscard]] static uint32_t resolve(std::optional<int64_t> requested,
                                          const ExecutionPolicy& policy) noexcept;

    /// Text form (e.g. a string-typed tool argument)
    [[nodiscard]] static uint32_t resolve(std::string_view requested,
                                          const ExecutionPolicy& policy) noexcept;
};

} // namespace sqlmcp
