#include "core/readonly_query_service.hpp"
#include "core/utils.hpp"
#include "executor/row_limiter.hpp"
#include "security/readonly_validator.hpp"

#include <format>

namespace sqlmcp {

ReadonlyQueryService::ReadonlyQueryService(std::shared_ptr<QueryExecutor> executor,
                                           const ExecutionPolicy& policy)
    : executor_(std::move(executor)), policy_(policy) {}

Result<ResultSet> ReadonlyQueryService::run(const QueryRequest& request) const {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (utils::trim_left(request.database).empty()) {
        return Result<ResultSet>::error(ErrorCategory::INVALID_REQUEST,
            "Missing required argument: database", "missing-database");
    }

    const auto verdict = ReadonlyValidator::validate(request.query, policy_);
    if (!verdict.admitted) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Rejected query [{}] on '{}': {} | {}",
            reject_reason_to_string(verdict.reason), request.database,
            verdict.message, utils::preview(request.query)));
        return Result<ResultSet>::error(ErrorCategory::VALIDATION_ERROR,
            verdict.message, reject_reason_to_string(verdict.reason));
    }

    const uint32_t limit = RowLimiter::resolve(request.max_rows, policy_);
    return executor_->execute(request.database, request.query, limit);
}

} // namespace sqlmcp
