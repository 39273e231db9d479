#include "dal/StateRepository.hpp"

#include "common/Digest.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <pqxx/pqxx>

#include <algorithm>
#include <utility>

namespace recon::dal {

using common::ResourceId;
using common::StateRecord;

StateRepository::StateRepository(ConnectionPool& cpPool, std::string sWorkspace)
    : _cpPool(cpPool),
      _sWorkspace(std::move(sWorkspace)),
      _iLockKey(common::Digest::sha256Key("recon:" + _sWorkspace)) {}

StateRepository::~StateRepository() {
  try {
    unlock();
  } catch (const std::exception& ex) {
    common::Logger::get()->error("StateRepository: releasing lock on shutdown failed: {}",
                                 ex.what());
  }
}

void StateRepository::ensureSchema() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "CREATE TABLE IF NOT EXISTS resource_state ("
      "workspace TEXT NOT NULL, "
      "node_id TEXT NOT NULL, "
      "version BIGINT NOT NULL, "
      "record JSONB NOT NULL, "
      "updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(), "
      "PRIMARY KEY (workspace, node_id))");
  txn.exec(
      "CREATE TABLE IF NOT EXISTS run_locks ("
      "workspace TEXT PRIMARY KEY, "
      "owner TEXT NOT NULL, "
      "acquired_at TIMESTAMPTZ NOT NULL DEFAULT NOW())");
  txn.commit();
}

void StateRepository::open() {
  ensureSchema();
  common::Logger::get()->debug("State repository opened for workspace '{}'", _sWorkspace);
}

void StateRepository::close() {
  // Writes commit immediately; nothing to flush
}

StateRecord StateRepository::parseRecord(const std::string& sJson) {
  try {
    return nlohmann::json::parse(sJson).get<StateRecord>();
  } catch (const nlohmann::json::exception& ex) {
    throw common::StateStoreError("state_corrupt",
                                  std::string("Malformed state record in database: ") + ex.what());
  }
}

std::optional<StateRecord> StateRepository::get(const ResourceId& riId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT record::text FROM resource_state WHERE workspace = $1 AND node_id = $2",
      pqxx::params{_sWorkspace, riId.toString()});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return parseRecord(result[0][0].as<std::string>());
}

void StateRepository::put(const ResourceId& riId, const StateRecord& sr) {
  StateRecord srStored = sr;
  srStored.riId = riId;

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO resource_state (workspace, node_id, version, record) "
      "VALUES ($1, $2, $3, $4::jsonb) "
      "ON CONFLICT (workspace, node_id) DO UPDATE SET "
      "version = EXCLUDED.version, record = EXCLUDED.record, updated_at = NOW()",
      pqxx::params{_sWorkspace, riId.toString(), srStored.iVersion,
                   nlohmann::json(srStored).dump()});
  txn.commit();
}

void StateRepository::remove(const ResourceId& riId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("DELETE FROM resource_state WHERE workspace = $1 AND node_id = $2",
           pqxx::params{_sWorkspace, riId.toString()});
  txn.commit();
}

std::optional<StateRecord> StateRepository::update(const ResourceId& riId,
                                                   const Updater& fnUpdate) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);

  // Serialize writers of the same node; a missing row is covered by the
  // per-node ownership of the executor worker plus the upsert below.
  auto result = txn.exec(
      "SELECT record::text FROM resource_state "
      "WHERE workspace = $1 AND node_id = $2 FOR UPDATE",
      pqxx::params{_sWorkspace, riId.toString()});

  std::optional<StateRecord> oRecord;
  if (!result.empty()) {
    oRecord = parseRecord(result[0][0].as<std::string>());
  }

  fnUpdate(oRecord);

  if (oRecord.has_value()) {
    oRecord->riId = riId;
    txn.exec(
        "INSERT INTO resource_state (workspace, node_id, version, record) "
        "VALUES ($1, $2, $3, $4::jsonb) "
        "ON CONFLICT (workspace, node_id) DO UPDATE SET "
        "version = EXCLUDED.version, record = EXCLUDED.record, updated_at = NOW()",
        pqxx::params{_sWorkspace, riId.toString(), oRecord->iVersion,
                     nlohmann::json(*oRecord).dump()});
  } else {
    txn.exec("DELETE FROM resource_state WHERE workspace = $1 AND node_id = $2",
             pqxx::params{_sWorkspace, riId.toString()});
  }

  txn.commit();
  return oRecord;
}

std::vector<StateRecord> StateRepository::list() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT record::text FROM resource_state WHERE workspace = $1 ORDER BY node_id",
      pqxx::params{_sWorkspace});
  txn.commit();

  std::vector<StateRecord> vRecords;
  vRecords.reserve(result.size());
  for (const auto& row : result) {
    vRecords.push_back(parseRecord(row[0].as<std::string>()));
  }
  std::sort(vRecords.begin(), vRecords.end(),
            [](const StateRecord& a, const StateRecord& b) { return a.riId < b.riId; });
  return vRecords;
}

void StateRepository::lock(const std::string& sOwner) {
  std::lock_guard<std::mutex> lock(_mtxLock);
  if (_oLockConn.has_value()) {
    throw common::LockContentionError(sOwner, "Run lock for workspace '" + _sWorkspace +
                                                  "' is already held by this process");
  }

  // lock() may precede open()
  ensureSchema();

  auto cg = _cpPool.checkout();
  bool bAcquired = false;
  {
    pqxx::nontransaction ntx(*cg);
    bAcquired = ntx.exec("SELECT pg_try_advisory_lock($1)", pqxx::params{_iLockKey})
                    .one_row()[0]
                    .as<bool>();
  }

  if (!bAcquired) {
    std::string sHolder = "unknown";
    pqxx::work txn(*cg);
    auto result = txn.exec("SELECT owner FROM run_locks WHERE workspace = $1",
                           pqxx::params{_sWorkspace});
    txn.commit();
    if (!result.empty()) {
      sHolder = result[0][0].as<std::string>();
    }
    throw common::LockContentionError(
        sHolder, "Workspace '" + _sWorkspace + "' is locked by '" + sHolder +
                     "'; refusing to start '" + sOwner + "'");
  }

  try {
    pqxx::work txn(*cg);
    txn.exec(
        "INSERT INTO run_locks (workspace, owner) VALUES ($1, $2) "
        "ON CONFLICT (workspace) DO UPDATE SET owner = EXCLUDED.owner, acquired_at = NOW()",
        pqxx::params{_sWorkspace, sOwner});
    txn.commit();
  } catch (const pqxx::failure& ex) {
    // The advisory lock lives as long as the session
    cg.discard();
    throw common::StateStoreError("lock_failed", "Recording run lock owner for workspace '" +
                                                     _sWorkspace + "' failed: " + ex.what());
  }

  _oLockConn.emplace(std::move(cg));
  _sLockOwner = sOwner;
  common::Logger::get()->debug("Advisory lock {} acquired for workspace '{}' by '{}'",
                               _iLockKey, _sWorkspace, sOwner);
}

void StateRepository::unlock() {
  std::lock_guard<std::mutex> lock(_mtxLock);
  if (!_oLockConn.has_value()) return;

  ConnectionGuard cg = std::move(*_oLockConn);
  _oLockConn.reset();
  const std::string sOwner = std::exchange(_sLockOwner, std::string{});

  try {
    pqxx::nontransaction ntx(*cg);
    ntx.exec("SELECT pg_advisory_unlock($1)", pqxx::params{_iLockKey});
  } catch (const pqxx::failure& ex) {
    cg.discard();
    throw common::StateStoreError("unlock_failed", "Releasing run lock for workspace '" +
                                                       _sWorkspace + "' failed: " + ex.what());
  }

  // Another run may already hold the lock; only remove our own owner row
  try {
    pqxx::work txn(*cg);
    txn.exec("DELETE FROM run_locks WHERE workspace = $1 AND owner = $2",
             pqxx::params{_sWorkspace, sOwner});
    txn.commit();
  } catch (const pqxx::failure& ex) {
    common::Logger::get()->warn("Run lock for workspace '{}' released, but clearing owner '{}' "
                                "failed: {}",
                                _sWorkspace, sOwner, ex.what());
  }
}

}  // namespace recon::dal
