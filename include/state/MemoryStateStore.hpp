#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "state/IStateStore.hpp"

namespace recon::state {

/// In-process state store. Records live in a map guarded by one mutex;
/// update() additionally serializes per node so concurrent workers on
/// unrelated nodes never wait on each other's callbacks.
/// Class abbreviation: mss
class MemoryStateStore : public IStateStore {
 public:
  MemoryStateStore();
  ~MemoryStateStore() override;

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

  /// Current advisory lock holder, if any.
  std::optional<std::string> lockOwner();

 protected:
  /// Called with _mtx held after every mutation. Subclasses persist here.
  virtual void onMutated();

  /// Throws StateStoreError("store_closed") unless open() was called.
  void requireOpen() const;

  std::map<common::ResourceId, common::StateRecord> _mRecords;
  std::optional<std::string> _oLockOwner;
  bool _bOpen = false;
  std::mutex _mtx;

 private:
  std::shared_ptr<std::mutex> nodeMutex(const common::ResourceId& riId);

  std::map<common::ResourceId, std::shared_ptr<std::mutex>> _mNodeLocks;
};

}  // namespace recon::state
