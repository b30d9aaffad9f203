#include "executor/query_executor.hpp"
#include "executor/result_shaper.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlmcp {

QueryExecutor::QueryExecutor(std::shared_ptr<IConnectionFactory> factory,
                             const ExecutionPolicy& policy,
                             ScopedConnection::ReleaseFunc release_fn)
    : factory_(std::move(factory)),
      policy_(policy),
      release_fn_(std::move(release_fn)) {}

std::string QueryExecutor::build_guarded_batch(std::string_view query, uint32_t limit) {
    return std::format("SET NOCOUNT ON;\nSET ROWCOUNT {};\n{}", limit, query);
}

Result<ResultSet> QueryExecutor::execute(const std::string& database,
                                         const std::string& admitted_query,
                                         uint32_t limit) const {
    utils::Timer timer;

    auto opened = factory_->connect(database);
    if (opened.is_error()) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Connection to '{}' failed: {}",
            database, opened.error_message()));
        return Result<ResultSet>::from_error(opened);
    }

    ScopedConnection conn(std::move(opened.value()), release_fn_);

    try {
        if (!conn->set_query_timeout(policy_.query_timeout_seconds)) {
            conn.discard();
            failed_.fetch_add(1, std::memory_order_relaxed);
            return Result<ResultSet>::error(ErrorCategory::EXECUTION_ERROR,
                "Failed to apply statement timeout", "statement");
        }

        auto db_result = conn->execute(build_guarded_batch(admitted_query, limit), {});

        if (db_result.timed_out) {
            conn.discard();
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            failed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Query on '{}' timed out after {} ms",
                database, timer.elapsed_ms().count()));
            return Result<ResultSet>::error(ErrorCategory::EXECUTION_ERROR,
                std::format("Query exceeded the {} second timeout", policy_.query_timeout_seconds),
                "timeout");
        }

        if (!db_result.success) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Query on '{}' failed: {}",
                database, db_result.error_message));
            return Result<ResultSet>::error(ErrorCategory::EXECUTION_ERROR,
                db_result.error_message, "statement");
        }

        executed_.fetch_add(1, std::memory_order_relaxed);
        auto shaped = ResultShaper::shape(db_result.column_names, db_result.column_types,
                                          std::move(db_result.rows), limit);
        utils::log::info(std::format("Query on '{}' returned {} rows (limit {}) in {} ms",
            database, shaped.row_count, limit, timer.elapsed_ms().count()));
        return Result<ResultSet>::ok(std::move(shaped));

    } catch (const std::exception& e) {
        conn.discard();
        failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Query on '{}' raised: {}", database, e.what()));
        return Result<ResultSet>::error(ErrorCategory::EXECUTION_ERROR,
            std::format("Database error: {}", e.what()), "statement");
    }
}

QueryExecutor::Stats QueryExecutor::get_stats() const {
    return {
        executed_.load(std::memory_order_relaxed),
        failed_.load(std::memory_order_relaxed),
        timeouts_.load(std::memory_order_relaxed)
    };
}

} // namespace sqlmcp
