#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"

namespace demonlist::db {

/*
  A checked-out pool connection.

  Repository calls made with a connection outside of a transaction run in
  autocommit mode. While a transaction returned by Begin() is open, every
  repository call made with this connection runs inside it.

  Connections are not thread-safe; a worker owns one for the duration of a
  single command. Destroying the connection returns it to the pool.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual bool IsHealthy() const = 0;

  // At most one open transaction per connection.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual bool InTransaction() const = 0;
};

} // namespace demonlist::db
