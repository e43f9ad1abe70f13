#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

namespace dispatch::db::postgres {

struct PgPoolOptions {
  std::string               connection_uri;
  std::size_t               max_connections = 16;
  std::chrono::milliseconds acquire_timeout{5000};
};

/*
  Bounded set of pqxx connections, each with the repository's prepared
  statements installed. A connection is lent to one transaction at a time
  and comes back when the last shared_ptr to it drops; a connection that
  closed while lent is discarded and frees its slot.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(PgPoolOptions options);

  // Blocks while every connection is lent. Throws std::runtime_error after acquire_timeout.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);

  PgPoolOptions options_;

  std::mutex                                    mutex_;
  std::condition_variable                       returned_;
  std::deque<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                   open_ = 0;
};

} // namespace dispatch::db::postgres
