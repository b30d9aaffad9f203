#include "executor/row_limiter.hpp"
#include "core/utils.hpp"

namespace sqlmcp {

uint32_t RowLimiter::resolve(std::optional<int64_t> requested,
                             const ExecutionPolicy& policy) noexcept {
    const uint32_t ceiling = policy.max_rows > 0 ? policy.max_rows : 1;
    if (!requested || *requested <= 0) {
        return ceiling;
    }
    if (*requested >= static_cast<int64_t>(ceiling)) {
        return ceiling;
    }
    return static_cast<uint32_t>(*requested);
}

uint32_t RowLimiter::resolve(std::string_view requested,
                             const ExecutionPolicy& policy) noexcept {
    const std::string_view text = utils::trim_right(utils::trim_left(requested));
    return resolve(utils::try_parse_int<int64_t>(text), policy);
}

} // namespace sqlmcp
