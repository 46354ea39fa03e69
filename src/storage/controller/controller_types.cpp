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

#include "storage/controller/controller_types.hpp"

#include <exception>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
ConnectionGuard::ConnectionGuard(duckdb_connection conn) : _conn(conn) {}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _conn(other._conn), _tx_depth(other._tx_depth) {
  other._conn = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (_conn) duckdb_disconnect(&_conn);
}

TransactionGuard::TransactionGuard(ConnectionGuard& guard) : _guard(guard) {
  if (_guard._tx_depth == 0) {
    duckorm::execute(_guard._conn, "BEGIN TRANSACTION;");
    _owner = true;
  }
  ++_guard._tx_depth;
}

TransactionGuard::~TransactionGuard() {
  --_guard._tx_depth;
  if (!_owner || _committed) return;
  try {
    duckorm::execute(_guard._conn, "ROLLBACK;");
  } catch (const std::exception& e) {
    Logger::Storage()->error("Rollback failed: {}", e.what());
  }
}

void TransactionGuard::Commit() {
  if (!_owner) {
    _committed = true;
    return;
  }
  duckorm::execute(_guard._conn, "COMMIT;");
  _committed = true;
}
}  // namespace arcvault
