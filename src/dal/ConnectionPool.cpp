#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

namespace recon::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

void ConnectionGuard::discard() {
  if (!_spConn) return;
  try {
    _spConn->close();
  } catch (const pqxx::failure& ex) {
    common::Logger::get()->warn("Closing state database connection failed: {}", ex.what());
  }
}

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::milliseconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw common::ValidationError("invalid_pool_size",
                                  "Connection pool size must be >= 1 (got " +
                                      std::to_string(_iPoolSize) + ")");
  }

  auto spLog = common::Logger::get();
  // Never log credentials: only the part after '@'
  const auto uAt = _sDbUrl.find('@');
  spLog->info("Initializing state connection pool: size={}, host={}", _iPoolSize,
              uAt == std::string::npos ? std::string("<local>") : _sDbUrl.substr(uAt + 1));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vAvailable.push_back(connect());
  }

  spLog->debug("State connection pool ready: {} connections established", _iPoolSize);
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::connect() {
  std::shared_ptr<pqxx::connection> spConn;
  try {
    spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  } catch (const pqxx::broken_connection& ex) {
    throw common::StateStoreError("db_unreachable",
                                  std::string("Cannot connect to state database: ") + ex.what());
  }
  if (!spConn->is_open()) {
    throw common::StateStoreError("db_unreachable", "State database connection is not open");
  }
  return spConn;
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const auto bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });

  if (!bAvailable) {
    throw common::StateStoreError(
        "pool_exhausted", "Connection pool exhausted: timeout waiting for available connection");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale state database connection detected, reconnecting");
    try {
      spConn = connect();
    } catch (const common::StateStoreError&) {
      // Keep the slot: hand the dead connection back so the pool does not shrink
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

int ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vAvailable.size());
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  if (!conn.is_open()) return false;
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const pqxx::failure&) {
    return false;
  }
}

}  // namespace recon::dal
