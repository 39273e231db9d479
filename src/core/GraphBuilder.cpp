#include "core/GraphBuilder.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <utility>

namespace recon::core {

using common::Edge;
using common::EdgeKind;
using common::Reference;
using common::ResourceId;
using common::ResourceNode;

// ── Graph ──────────────────────────────────────────────────────────────────

std::optional<size_t> Graph::indexOf(const ResourceId& riId) const {
  auto it = mIndex.find(riId);
  if (it == mIndex.end()) return std::nullopt;
  return it->second;
}

const ResourceNode& Graph::node(const ResourceId& riId) const {
  auto oIdx = indexOf(riId);
  if (!oIdx) {
    throw common::NotFoundError("resource_not_found",
                                "Resource '" + riId.toString() + "' is not in the graph");
  }
  return vNodes[*oIdx];
}

// ── GraphBuilder ───────────────────────────────────────────────────────────

namespace {

enum class Color { Unvisited, InProgress, Done };

struct CycleSearch {
  const Graph& gr;
  std::vector<Color> vColor;
  std::vector<size_t> vStack;  // current DFS path

  explicit CycleSearch(const Graph& g) : gr(g), vColor(g.vNodes.size(), Color::Unvisited) {}

  /// Iterative DFS so deep dependency chains cannot exhaust the call stack.
  void visit(size_t uRoot) {
    // (node, index of the next dependent to examine)
    std::vector<std::pair<size_t, size_t>> vFrames;
    vColor[uRoot] = Color::InProgress;
    vStack.push_back(uRoot);
    vFrames.emplace_back(uRoot, 0);

    while (!vFrames.empty()) {
      auto& [uNode, uNextChild] = vFrames.back();
      const auto& vDependents = gr.vDependents[uNode];
      if (uNextChild == vDependents.size()) {
        vColor[uNode] = Color::Done;
        vStack.pop_back();
        vFrames.pop_back();
        continue;
      }

      const size_t uNext = vDependents[uNextChild++];
      if (vColor[uNext] == Color::InProgress) {
        // Back edge: the cycle is the path suffix starting at uNext
        auto it = std::find(vStack.begin(), vStack.end(), uNext);
        std::vector<std::string> vParticipants;
        for (; it != vStack.end(); ++it) {
          vParticipants.push_back(gr.vNodes[*it].riId.toString());
        }
        vParticipants.push_back(gr.vNodes[uNext].riId.toString());
        throw common::CycleError(std::move(vParticipants));
      }
      if (vColor[uNext] == Color::Unvisited) {
        vColor[uNext] = Color::InProgress;
        vStack.push_back(uNext);
        vFrames.emplace_back(uNext, 0);
      }
    }
  }
};

}  // namespace

GraphBuilder::GraphBuilder() = default;
GraphBuilder::~GraphBuilder() = default;

Graph GraphBuilder::build(std::vector<ResourceNode> vNodes) const {
  Graph gr;
  gr.vNodes = std::move(vNodes);
  gr.vDependencies.resize(gr.vNodes.size());
  gr.vDependents.resize(gr.vNodes.size());

  for (size_t i = 0; i < gr.vNodes.size(); ++i) {
    const auto& riId = gr.vNodes[i].riId;
    if (!gr.mIndex.emplace(riId, i).second) {
      throw common::ValidationError("duplicate_resource",
                                    "Resource '" + riId.toString() + "' is declared twice");
    }
  }

  // (producer, consumer) → position in vEdges, for deduplication
  std::map<std::pair<size_t, size_t>, size_t> mEdgeIndex;
  auto addEdge = [&](size_t uFrom, size_t uTo, EdgeKind kind) {
    auto [it, bInserted] = mEdgeIndex.emplace(std::make_pair(uFrom, uTo), gr.vEdges.size());
    if (!bInserted) {
      if (kind == EdgeKind::Reference) {
        gr.vEdges[it->second].kind = EdgeKind::Reference;
      }
      return;
    }
    gr.vEdges.push_back(Edge{gr.vNodes[uFrom].riId, gr.vNodes[uTo].riId, kind});
    gr.vDependencies[uTo].push_back(uFrom);
    gr.vDependents[uFrom].push_back(uTo);
  };

  for (size_t i = 0; i < gr.vNodes.size(); ++i) {
    const auto& rn = gr.vNodes[i];
    const std::string sNode = rn.riId.toString();

    for (const auto& riDep : rn.vDependsOn) {
      auto oDep = gr.indexOf(riDep);
      if (!oDep) {
        throw common::UnresolvedReferenceError(
            sNode, "depends_on",
            "Resource '" + sNode + "' depends on undeclared resource '" + riDep.toString() + "'");
      }
      addEdge(*oDep, i, EdgeKind::Explicit);
    }

    for (const auto& [sKey, avValue] : rn.mDesired) {
      const auto* pRef = std::get_if<Reference>(&avValue);
      if (!pRef) continue;

      auto oTarget = gr.indexOf(pRef->riTarget);
      if (!oTarget) {
        throw common::UnresolvedReferenceError(
            sNode, sKey,
            "Attribute '" + sKey + "' of '" + sNode + "' references undeclared resource '" +
                pRef->riTarget.toString() + "'");
      }
      const auto& vOutputs = gr.vNodes[*oTarget].vOutputs;
      if (std::find(vOutputs.begin(), vOutputs.end(), pRef->sOutputKey) == vOutputs.end()) {
        throw common::UnresolvedReferenceError(
            sNode, sKey,
            "Attribute '" + sKey + "' of '" + sNode + "' references output '" +
                pRef->sOutputKey + "' which '" + pRef->riTarget.toString() +
                "' does not declare");
      }
      addEdge(*oTarget, i, EdgeKind::Reference);
    }
  }

  for (auto& vDeps : gr.vDependencies) std::sort(vDeps.begin(), vDeps.end());
  for (auto& vDeps : gr.vDependents) std::sort(vDeps.begin(), vDeps.end());

  detectCycles(gr);

  common::Logger::get()->debug("Graph built: {} nodes, {} edges", gr.vNodes.size(),
                               gr.vEdges.size());
  return gr;
}

void GraphBuilder::detectCycles(const Graph& gr) {
  CycleSearch cs(gr);
  for (size_t i = 0; i < gr.vNodes.size(); ++i) {
    if (cs.vColor[i] == Color::Unvisited) {
      cs.visit(i);
    }
  }
}

}  // namespace recon::core
