#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace depgraph::db::postgres {

/*
  Bounded pool of libpqxx connections for the publication log.

  A PgTransaction checks one connection out for its whole lifetime and the
  deleter of the returned shared_ptr hands it back. Connections are never
  shared between threads. Every new connection prepares the log statements,
  so Bootstrap() has to create the tables before the first Acquire().
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Creates the log tables on a short-lived connection outside the pool.
  void Bootstrap();

  // Waits while every connection is checked out. Throws pqxx::broken_connection
  // when a new connection cannot be opened.
  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t MaxConnections() const { return max_connections_; }

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace depgraph::db::postgres
