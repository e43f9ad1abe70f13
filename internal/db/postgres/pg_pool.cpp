#include "pg_pool.hpp"

#include <stdexcept>

#include "pg_statements.hpp"

namespace dispatch::db::postgres {

PgPool::PgPool(PgPoolOptions options) : options_(std::move(options)) {
  if (options_.max_connections == 0) {
    options_.max_connections = 1;
  }
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const bool available = returned_.wait_for(lock, options_.acquire_timeout,
                                            [this] { return !idle_.empty() || open_ < options_.max_connections; });
  if (!available) {
    throw std::runtime_error("postgres pool exhausted: " + std::to_string(options_.max_connections) + " connections in use");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.front());
    idle_.pop_front();
    return Lend(std::move(conn));
  }

  // Reserve the slot, then connect without holding the lock.
  ++open_;
  lock.unlock();
  try {
    return Lend(Open());
  } catch (const std::exception&) {
    std::lock_guard relock(mutex_);
    --open_;
    returned_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(options_.connection_uri);
  for (const auto& [name, sql] : kStatements) {
    conn->prepare(name, sql);
  }
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* lent) {
    if (auto self = pool.lock()) {
      self->Return(lent);
    } else {
      delete lent;
    }
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

} // namespace dispatch::db::postgres
