#include "state/IStateStore.hpp"

#include "common/Logger.hpp"

namespace recon::state {

RunLock::RunLock(IStateStore& ssStore, const std::string& sOwner) : _pStore(&ssStore) {
  _pStore->lock(sOwner);
}

RunLock::~RunLock() {
  if (!_pStore) return;
  try {
    _pStore->unlock();
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Failed to release run lock: {}", ex.what());
  }
}

void RunLock::release() {
  if (!_pStore) return;
  IStateStore* pStore = _pStore;
  _pStore = nullptr;
  pStore->unlock();
}

}  // namespace recon::state
