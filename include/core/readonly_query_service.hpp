#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "executor/query_executor.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace sqlmcp {

/**
 * @brief The bounded, read-only query operation
 *
 * Flow: validate -> resolve row limit -> execute -> shape.
 * A rejected query never reaches the executor, so the database is not
 * contacted. Borrows the process-wide policy; holds no per-request state.
 */
class ReadonlyQueryService {
public:
    ReadonlyQueryService(std::shared_ptr<QueryExecutor> executor,
                         const ExecutionPolicy& policy);

    [[nodiscard]] Result<ResultSet> run(const QueryRequest& request) const;

    [[nodiscard]] const ExecutionPolicy& policy() const { return policy_; }

    struct Stats {
        uint64_t total_requests;
        uint64_t rejected;
    };
    [[nodiscard]] Stats get_stats() const {
        return {
            total_requests_.load(std::memory_order_relaxed),
            rejected_.load(std::memory_order_relaxed)
        };
    }

private:
    std::shared_ptr<QueryExecutor> executor_;
    const ExecutionPolicy& policy_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> rejected_{0};
};

} // namespace sqlmcp
