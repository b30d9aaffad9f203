#include "db/scoped_connection.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlmcp {

ScopedConnection::ScopedConnection(std::unique_ptr<IDbConnection> conn, ReleaseFunc release_fn)
    : conn_(std::move(conn)), release_fn_(std::move(release_fn)) {}

ScopedConnection::~ScopedConnection() {
    release();
}

ScopedConnection::ScopedConnection(ScopedConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      release_fn_(std::move(other.release_fn_)),
      discarded_(other.discarded_) {}

ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        // Release current session before taking the new one
        release();
        conn_ = std::move(other.conn_);
        release_fn_ = std::move(other.release_fn_);
        discarded_ = other.discarded_;
    }
    return *this;
}

void ScopedConnection::discard() {
    discarded_ = true;
    release();
}

void ScopedConnection::release() noexcept {
    if (!conn_) {
        return;
    }
    try {
        if (discarded_) {
            // Close before handing over so nobody can pick it up live
            conn_->close();
        }
        if (release_fn_) {
            release_fn_(std::move(conn_), !discarded_);
        } else {
            conn_->close();
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to release database session: {}", e.what()));
    }
    conn_.reset();
}

} // namespace sqlmcp
