#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace recon::dal {

class ConnectionPool;

/// RAII guard for checked-out database connections.
/// Returns the connection to the pool on destruction.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  ConnectionGuard(ConnectionPool& cpPool, std::shared_ptr<pqxx::connection> spConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

  /// Close the session, dropping any session-level state such as advisory
  /// locks. The closed connection goes back to the pool, whose next checkout
  /// reconnects it.
  void discard();

 private:
  ConnectionPool* _pPool;
  std::shared_ptr<pqxx::connection> _spConn;
};

/// Fixed-size pool of pqxx::connection objects shared by executor workers.
/// Blocks on exhaustion up to the checkout timeout, then throws StateStoreError.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                 std::chrono::milliseconds durCheckoutTimeout = std::chrono::seconds(30));
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /// Check out a connection. Blocks if all connections are in use.
  ConnectionGuard checkout();

  /// Return a connection to the pool. Called by ConnectionGuard destructor.
  void returnConnection(std::shared_ptr<pqxx::connection> spConn);

  int size() const { return _iPoolSize; }

  /// Connections currently idle in the pool.
  int available();

 private:
  /// Validate a connection with a lightweight query.
  bool validate(pqxx::connection& conn);

  std::shared_ptr<pqxx::connection> connect();

  std::vector<std::shared_ptr<pqxx::connection>> _vAvailable;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  int _iPoolSize;
  std::chrono::milliseconds _durCheckoutTimeout;
};

}  // namespace recon::dal
