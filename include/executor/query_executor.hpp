#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/iconnection_factory.hpp"
#include "db/scoped_connection.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sqlmcp {

/**
 * @brief Runs an admitted query on a fresh, scoped session
 *
 * Per call:
 * 1. open a session on the requested catalog (CONNECTION_ERROR on failure)
 * 2. apply the policy's statement timeout
 * 3. send one batch: SET NOCOUNT ON; SET ROWCOUNT <limit>; <query>
 * 4. materialize every returned row, then release the session
 *
 * A timeout fails with EXECUTION_ERROR / reason "timeout" and discards the
 * session. Engine errors fail with EXECUTION_ERROR / reason "statement".
 * No retries. Thread-safe: no state beyond the borrowed policy and counters.
 */
class QueryExecutor {
public:
    QueryExecutor(std::shared_ptr<IConnectionFactory> factory,
                  const ExecutionPolicy& policy,
                  ScopedConnection::ReleaseFunc release_fn = nullptr);

    [[nodiscard]] Result<ResultSet> execute(const std::string& database,
                                            const std::string& admitted_query,
                                            uint32_t limit) const;

    /// Guard prefix + verbatim query, in one execution unit
    [[nodiscard]] static std::string build_guarded_batch(std::string_view query, uint32_t limit);

    struct Stats {
        uint64_t executed;
        uint64_t failed;
        uint64_t timeouts;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    std::shared_ptr<IConnectionFactory> factory_;
    const ExecutionPolicy& policy_;
    ScopedConnection::ReleaseFunc release_fn_;

    mutable std::atomic<uint64_t> executed_{0};
    mutable std::atomic<uint64_t> failed_{0};
    mutable std::atomic<uint64_t> timeouts_{0};
};

} // namespace sqlmcp
