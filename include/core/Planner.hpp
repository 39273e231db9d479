#pragma once

#include <vector>

#include "common/Types.hpp"
#include "core/DiffEngine.hpp"
#include "core/GraphBuilder.hpp"
#include "core/ReferenceResolver.hpp"
#include "providers/ProviderRegistry.hpp"

namespace recon::core {

/// Diffs desired against recorded state and orders the resulting actions
/// into waves. Pure function of (graph, state snapshot, provider schemas).
/// Class abbreviation: pln
class Planner {
 public:
  explicit Planner(const providers::ProviderRegistry& preg);
  ~Planner();

  /// Build the plan. Throws NotFoundError("provider_not_found") when a
  /// declared or recorded resource type has no provider, and CycleError if
  /// the recorded state of orphans contradicts the declared graph.
  common::Plan plan(const Graph& gr, const std::vector<common::StateRecord>& vStates) const;

 private:
  const providers::ProviderRegistry& _preg;
  DiffEngine _de;
  ReferenceResolver _rres;
};

}  // namespace recon::core
