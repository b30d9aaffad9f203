#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlmcp {

/**
 * @brief RAII guard for a per-request database session
 *
 * The session is released on destruction, whatever path the caller leaves
 * by. A discarded session (e.g. after a statement timeout) is reported to
 * the release callback as not reusable; without a callback the session is
 * simply closed.
 * Move-only to prevent accidental copying.
 */
class ScopedConnection {
public:
    /// Receives the session and whether it may be reused
    using ReleaseFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    explicit ScopedConnection(std::unique_ptr<IDbConnection> conn,
                              ReleaseFunc release_fn = nullptr);

    ~ScopedConnection();

    ScopedConnection(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Mark the session unusable and release it now
     *
     * Server-side session state (an active ROWCOUNT, a half-read result)
     * must never leak into another call.
     */
    void discard();

    [[nodiscard]] bool discarded() const { return discarded_; }

private:
    void release() noexcept;

    std::unique_ptr<IDbConnection> conn_;
    ReleaseFunc release_fn_;
    bool discarded_ = false;
};

} // namespace sqlmcp
