//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once
#include <duckdb.h>

namespace arcvault {
class ConnectionGuard {
 public:
  duckdb_connection _conn;
  // Open TransactionGuard scopes on this connection
  int               _tx_depth = 0;

  ConnectionGuard(duckdb_connection conn);
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard(const ConnectionGuard&)            = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ~ConnectionGuard();
};

/**
 * @brief Scoped DuckDB transaction. BEGIN on construction, ROLLBACK on destruction unless
 * Commit() was called. Nested guards on the same connection join the outer transaction.
 */
class TransactionGuard {
 private:
  ConnectionGuard& _guard;
  bool             _owner     = false;
  bool             _committed = false;

 public:
  explicit TransactionGuard(ConnectionGuard& guard);
  TransactionGuard(const TransactionGuard&)            = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;
  ~TransactionGuard();

  void Commit();
};
}  // namespace arcvault
