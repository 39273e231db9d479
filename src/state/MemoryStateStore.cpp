#include "state/MemoryStateStore.hpp"

#include "common/Errors.hpp"

namespace recon::state {

using common::ResourceId;
using common::StateRecord;

MemoryStateStore::MemoryStateStore() = default;
MemoryStateStore::~MemoryStateStore() = default;

void MemoryStateStore::open() {
  std::lock_guard<std::mutex> lock(_mtx);
  _bOpen = true;
}

void MemoryStateStore::close() {
  std::lock_guard<std::mutex> lock(_mtx);
  _bOpen = false;
}

void MemoryStateStore::requireOpen() const {
  if (!_bOpen) {
    throw common::StateStoreError("store_closed", "State store is not open");
  }
}

void MemoryStateStore::onMutated() {}

std::optional<StateRecord> MemoryStateStore::get(const ResourceId& riId) {
  std::lock_guard<std::mutex> lock(_mtx);
  requireOpen();
  auto it = _mRecords.find(riId);
  if (it == _mRecords.end()) return std::nullopt;
  return it->second;
}

void MemoryStateStore::put(const ResourceId& riId, const StateRecord& sr) {
  std::lock_guard<std::mutex> lock(_mtx);
  requireOpen();
  StateRecord srStored = sr;
  srStored.riId = riId;
  _mRecords[riId] = std::move(srStored);
  onMutated();
}

void MemoryStateStore::remove(const ResourceId& riId) {
  std::lock_guard<std::mutex> lock(_mtx);
  requireOpen();
  if (_mRecords.erase(riId) > 0) {
    onMutated();
  }
}

std::shared_ptr<std::mutex> MemoryStateStore::nodeMutex(const ResourceId& riId) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto& spMtx = _mNodeLocks[riId];
  if (!spMtx) {
    spMtx = std::make_shared<std::mutex>();
  }
  return spMtx;
}

std::optional<StateRecord> MemoryStateStore::update(const ResourceId& riId,
                                                    const Updater& fnUpdate) {
  auto spNodeMtx = nodeMutex(riId);
  std::lock_guard<std::mutex> nodeLock(*spNodeMtx);

  std::optional<StateRecord> oRecord = get(riId);
  fnUpdate(oRecord);

  if (oRecord.has_value()) {
    put(riId, *oRecord);
    oRecord->riId = riId;
  } else {
    remove(riId);
  }
  return oRecord;
}

std::vector<StateRecord> MemoryStateStore::list() {
  std::lock_guard<std::mutex> lock(_mtx);
  requireOpen();
  std::vector<StateRecord> vRecords;
  vRecords.reserve(_mRecords.size());
  for (const auto& [riId, sr] : _mRecords) {
    vRecords.push_back(sr);
  }
  return vRecords;
}

void MemoryStateStore::lock(const std::string& sOwner) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_oLockOwner.has_value()) {
    throw common::LockContentionError(
        *_oLockOwner, "State is locked by '" + *_oLockOwner + "'; refusing to start '" + sOwner +
                          "'");
  }
  _oLockOwner = sOwner;
}

void MemoryStateStore::unlock() {
  std::lock_guard<std::mutex> lock(_mtx);
  _oLockOwner.reset();
}

std::optional<std::string> MemoryStateStore::lockOwner() {
  std::lock_guard<std::mutex> lock(_mtx);
  return _oLockOwner;
}

}  // namespace recon::state
