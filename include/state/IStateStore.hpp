#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace recon::state {

/// Durable record of last-known resource state, owned exclusively by the
/// store. Implementations must make update() atomic per node; cross-node
/// atomicity is not required.
class IStateStore {
 public:
  /// Read-modify-write callback. Receives the current record (or nullopt)
  /// and leaves the desired new value in place; nullopt deletes the record.
  using Updater = std::function<void(std::optional<common::StateRecord>&)>;

  virtual ~IStateStore() = default;

  /// Explicit lifecycle: open at run start, close (flush) at run end.
  virtual void open() = 0;
  virtual void close() = 0;

  virtual std::optional<common::StateRecord> get(const common::ResourceId& riId) = 0;
  virtual void put(const common::ResourceId& riId, const common::StateRecord& sr) = 0;
  virtual void remove(const common::ResourceId& riId) = 0;

  /// Atomic read-modify-write of one node's record. Returns the stored result.
  virtual std::optional<common::StateRecord> update(const common::ResourceId& riId,
                                                    const Updater& fnUpdate) = 0;

  /// Snapshot of every record, ordered by resource id.
  virtual std::vector<common::StateRecord> list() = 0;

  /// Advisory lock scoped to one apply run.
  /// Throws LockContentionError when another owner holds it.
  virtual void lock(const std::string& sOwner) = 0;
  virtual void unlock() = 0;
};

/// RAII guard for the run-level advisory lock.
/// Class abbreviation: rl
class RunLock {
 public:
  RunLock(IStateStore& ssStore, const std::string& sOwner);
  ~RunLock();

  RunLock(const RunLock&) = delete;
  RunLock& operator=(const RunLock&) = delete;

  /// Release early. Errors propagate, unlike in the destructor.
  void release();

 private:
  IStateStore* _pStore;
};

}  // namespace recon::state
