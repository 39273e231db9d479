#pragma once

#include <map>
#include <optional>
#include <vector>

#include "common/Types.hpp"

namespace recon::core {

/// Validated resource graph. Node order is declaration order and is the
/// tie-breaker for every deterministic ordering downstream.
/// Class abbreviation: gr
struct Graph {
  std::vector<common::ResourceNode> vNodes;
  std::vector<common::Edge> vEdges;
  std::map<common::ResourceId, size_t> mIndex;
  std::vector<std::vector<size_t>> vDependencies;  // producers of node i, ascending
  std::vector<std::vector<size_t>> vDependents;    // consumers of node i, ascending

  std::optional<size_t> indexOf(const common::ResourceId& riId) const;
  const common::ResourceNode& node(const common::ResourceId& riId) const;
};

/// Derives the dependency DAG from explicit depends-on declarations and
/// attribute references. Pure transformation; never mutates its input.
/// Class abbreviation: gb
class GraphBuilder {
 public:
  GraphBuilder();
  ~GraphBuilder();

  /// Throws:
  ///   ValidationError("duplicate_resource") for a repeated identity,
  ///   UnresolvedReferenceError for a missing node or undeclared output,
  ///   CycleError with the cycle path when the edges are not acyclic.
  Graph build(std::vector<common::ResourceNode> vNodes) const;

 private:
  /// Three-color DFS over producer → consumer edges. Throws CycleError.
  static void detectCycles(const Graph& gr);
};

}  // namespace recon::core
