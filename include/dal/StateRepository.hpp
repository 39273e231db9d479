#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dal/ConnectionPool.hpp"
#include "state/IStateStore.hpp"

namespace recon::dal {

/// PostgreSQL-backed state store over the resource_state and run_locks tables.
/// Every write commits immediately. update() serializes per node with
/// SELECT ... FOR UPDATE; the run lock is a session-level advisory lock held
/// on a dedicated pooled connection until unlock().
/// Class abbreviation: srp
class StateRepository : public state::IStateStore {
 public:
  StateRepository(ConnectionPool& cpPool, std::string sWorkspace);
  ~StateRepository() override;

  /// Create tables if missing. Called by open().
  void ensureSchema();

  void open() override;
  void close() override;

  std::optional<common::StateRecord> get(const common::ResourceId& riId) override;
  void put(const common::ResourceId& riId, const common::StateRecord& sr) override;
  void remove(const common::ResourceId& riId) override;
  std::optional<common::StateRecord> update(const common::ResourceId& riId,
                                            const Updater& fnUpdate) override;
  std::vector<common::StateRecord> list() override;

  void lock(const std::string& sOwner) override;
  void unlock() override;

  /// Advisory lock key derived from the workspace name.
  int64_t lockKey() const { return _iLockKey; }

 private:
  static common::StateRecord parseRecord(const std::string& sJson);

  ConnectionPool& _cpPool;
  std::string _sWorkspace;
  int64_t _iLockKey;
  std::optional<ConnectionGuard> _oLockConn;
  std::string _sLockOwner;
  std::mutex _mtxLock;
};

}  // namespace recon::dal
