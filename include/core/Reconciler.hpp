#pragma once

#include <stop_token>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/Executor.hpp"
#include "core/GraphBuilder.hpp"
#include "core/Planner.hpp"
#include "providers/ProviderRegistry.hpp"
#include "state/IStateStore.hpp"

namespace recon::core {

/// Per-run switches.
/// Class abbreviation: ro
struct RunOptions {
  std::string sOwner;      // run lock holder, e.g. "ci@build-42"
  bool bRefresh = false;   // read every recorded resource before planning
  bool bPlanOnly = false;  // stop after planning; the report lists planned ops
};

/// Drives one apply run: build the graph, take the run lock, optionally
/// refresh, plan, execute, and release.
/// Class abbreviation: rec
class Reconciler {
 public:
  Reconciler(const providers::ProviderRegistry& preg, state::IStateStore& ssStore,
             ApplyOptions ao);
  ~Reconciler();

  /// Throws CycleError, UnresolvedReferenceError, ValidationError,
  /// NotFoundError and LockContentionError before any provider call.
  /// Per-node failures are reported, not thrown.
  common::RunReport run(std::vector<common::ResourceNode> vDeclarations, const RunOptions& ro,
                        std::stop_token stToken = {});

  /// Plan against the current state without locking or touching providers.
  common::Plan preview(std::vector<common::ResourceNode> vDeclarations);

 private:
  /// Reconcile recorded state with what providers report.
  void refresh(Graph& gr);

  const providers::ProviderRegistry& _preg;
  state::IStateStore& _ssStore;
  ApplyOptions _ao;
  GraphBuilder _gb;
  Planner _pln;
  DiffEngine _de;
};

}  // namespace recon::core
