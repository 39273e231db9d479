#pragma once

#include <memory>

#include "common/Config.hpp"
#include "dal/ConnectionPool.hpp"
#include "state/IStateStore.hpp"

namespace recon::state {

/// A state store plus whatever it borrows from. Members are declared so the
/// store is destroyed before the pool it uses.
/// Class abbreviation: sb
struct StateBackend {
  std::unique_ptr<dal::ConnectionPool> upPool;  // postgres only
  std::unique_ptr<IStateStore> upStore;
};

/// Creates the configured IStateStore backend by RECON_STATE_BACKEND.
class StateStoreFactory {
 public:
  static StateBackend create(const common::Config& cfg);
};

}  // namespace recon::state
