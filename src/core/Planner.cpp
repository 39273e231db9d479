#include "core/Planner.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

namespace recon::core {

using common::Action;
using common::ActionOp;
using common::ActionTarget;
using common::Attributes;
using common::Plan;
using common::ResourceId;
using common::StateRecord;

namespace {

constexpr size_t kNone = std::numeric_limits<size_t>::max();

/// Actions plus their precedence edges while the plan is being assembled.
struct ActionGraph {
  std::vector<Action> vActions;
  std::vector<size_t> vOrderKey;  // node position used to break ties within a wave
  std::vector<std::set<size_t>> vSucc;
  std::vector<std::set<size_t>> vPred;

  size_t add(Action act, size_t uOrderKey) {
    vActions.push_back(std::move(act));
    vOrderKey.push_back(uOrderKey);
    vSucc.emplace_back();
    vPred.emplace_back();
    return vActions.size() - 1;
  }

  void link(size_t uFrom, size_t uTo) {
    if (uFrom == kNone || uTo == kNone || uFrom == uTo) return;
    vSucc[uFrom].insert(uTo);
    vPred[uTo].insert(uFrom);
  }
};

/// Kahn's algorithm over the node graph, smallest declaration index first.
std::vector<size_t> topoOrder(const Graph& gr) {
  std::vector<size_t> vInDegree(gr.vNodes.size());
  std::set<size_t> setReady;
  for (size_t i = 0; i < gr.vNodes.size(); ++i) {
    vInDegree[i] = gr.vDependencies[i].size();
    if (vInDegree[i] == 0) setReady.insert(i);
  }

  std::vector<size_t> vOrder;
  vOrder.reserve(gr.vNodes.size());
  while (!setReady.empty()) {
    const size_t uNode = *setReady.begin();
    setReady.erase(setReady.begin());
    vOrder.push_back(uNode);
    for (size_t uNext : gr.vDependents[uNode]) {
      if (--vInDegree[uNext] == 0) setReady.insert(uNext);
    }
  }
  return vOrder;
}

Action makeAction(const ResourceId& riNode, ActionOp op, ActionOp decision,
                  ActionTarget target, std::string sReason) {
  Action act;
  act.riNode = riNode;
  act.op = op;
  act.decision = decision;
  act.target = target;
  act.sReason = std::move(sReason);
  return act;
}

}  // namespace

Planner::Planner(const providers::ProviderRegistry& preg) : _preg(preg) {}
Planner::~Planner() = default;

Plan Planner::plan(const Graph& gr, const std::vector<StateRecord>& vStates) const {
  auto spLog = common::Logger::get();

  std::map<ResourceId, const StateRecord*> mStates;
  for (const auto& sr : vStates) {
    mStates[sr.riId] = &sr;
  }

  std::map<std::string, providers::ResourceSchema> mSchemas;
  auto schemaOf = [&](const std::string& sType) -> const providers::ResourceSchema& {
    auto it = mSchemas.find(sType);
    if (it == mSchemas.end()) {
      it = mSchemas.emplace(sType, _preg.get(sType).schema()).first;
    }
    return it->second;
  };

  auto recordOf = [&mStates](const ResourceId& riId) -> const StateRecord* {
    auto it = mStates.find(riId);
    return it == mStates.end() ? nullptr : it->second;
  };

  // ── Classify declared nodes, producers first ────────────────────────────
  const size_t uNodes = gr.vNodes.size();
  std::vector<ActionOp> vDecision(uNodes, ActionOp::NoOp);
  std::vector<std::string> vReason(uNodes);

  for (size_t i : topoOrder(gr)) {
    const auto& rn = gr.vNodes[i];
    const auto& rsSchema = schemaOf(rn.riId.sType);
    const StateRecord* pRecord = recordOf(rn.riId);

    if (!pRecord) {
      vDecision[i] = ActionOp::Create;
      vReason[i] = "not yet created";
      continue;
    }
    if (pRecord->bTainted) {
      vDecision[i] = ActionOp::Replace;
      vReason[i] = "tainted: previous apply did not converge";
      continue;
    }

    // Outputs of producers about to be (re)created are known only after apply.
    // Otherwise a freshly read value beats the one recorded at the last apply.
    auto fnLookup = [&](const ResourceId& riProducer) -> std::optional<Attributes> {
      auto oIdx = gr.indexOf(riProducer);
      if (oIdx && (vDecision[*oIdx] == ActionOp::Create ||
                   vDecision[*oIdx] == ActionOp::Replace)) {
        return std::nullopt;
      }
      if (oIdx && gr.vNodes[*oIdx].oObserved) {
        return gr.vNodes[*oIdx].oObserved;
      }
      const StateRecord* pProducer = recordOf(riProducer);
      if (!pProducer) return std::nullopt;
      return pProducer->mObserved;
    };

    auto res = _rres.resolve(rn, fnLookup);
    // An updated producer may report new outputs; immutable keys fed by it cannot wait for them
    for (const auto& [sKey, avValue] : rn.mDesired) {
      const auto* pRef = std::get_if<common::Reference>(&avValue);
      if (!pRef || !rsSchema.setImmutable.contains(sKey)) continue;
      auto oIdx = gr.indexOf(pRef->riTarget);
      if (oIdx && vDecision[*oIdx] == ActionOp::Update && res.mResolved.erase(sKey) > 0) {
        res.vUnknown.push_back(sKey);
      }
    }
    auto vDiffs = _de.diff(pRecord->mDesired, res.mResolved, res.vUnknown, rsSchema);
    vDecision[i] = DiffEngine::classify(vDiffs);
    vReason[i] = DiffEngine::describe(vDiffs);
  }

  std::vector<const StateRecord*> vOrphans;
  for (const auto& [riId, pRecord] : mStates) {
    if (!gr.indexOf(riId)) {
      schemaOf(riId.sType);  // a provider is needed to delete it
      vOrphans.push_back(pRecord);
    }
  }

  // ── Expand decisions into actions ───────────────────────────────────────
  ActionGraph ag;
  std::vector<size_t> vStart(uNodes, kNone);      // receives producer edges
  std::vector<size_t> vComplete(uNodes, kNone);   // node usable by consumers
  std::vector<size_t> vOldDelete(uNodes, kNone);  // delete of a deposed instance

  for (size_t i = 0; i < uNodes; ++i) {
    const auto& rn = gr.vNodes[i];
    const StateRecord* pRecord = recordOf(rn.riId);
    const bool bHasDeposed = pRecord && pRecord->oDeposed.has_value();

    if (vDecision[i] == ActionOp::Replace && rn.lpPolicy.bCreateBeforeDestroy) {
      size_t uLeftover = kNone;
      if (bHasDeposed) {
        // A record holds one deposed instance; clear the old one first
        uLeftover = ag.add(makeAction(rn.riId, ActionOp::Delete, ActionOp::Delete,
                                      ActionTarget::Deposed,
                                      "destroy deposed instance left by an earlier replacement"),
                           i);
      }
      const size_t uCreate =
          ag.add(makeAction(rn.riId, ActionOp::Create, ActionOp::Replace, ActionTarget::Current,
                            vReason[i] + " (create before destroy)"),
                 i);
      const size_t uDelete =
          ag.add(makeAction(rn.riId, ActionOp::Delete, ActionOp::Replace, ActionTarget::Deposed,
                            "destroy replaced instance"),
                 i);
      ag.link(uLeftover, uCreate);
      ag.link(uCreate, uDelete);
      vStart[i] = uCreate;
      vComplete[i] = uCreate;
      vOldDelete[i] = uDelete;
    } else if (vDecision[i] == ActionOp::Replace) {
      const size_t uDelete =
          ag.add(makeAction(rn.riId, ActionOp::Delete, ActionOp::Replace, ActionTarget::Current,
                            vReason[i] + " (destroy before create)"),
                 i);
      const size_t uCreate =
          ag.add(makeAction(rn.riId, ActionOp::Create, ActionOp::Replace, ActionTarget::Current,
                            "create replacement"),
                 i);
      if (bHasDeposed) {
        const size_t uLeftover = ag.add(
            makeAction(rn.riId, ActionOp::Delete, ActionOp::Delete, ActionTarget::Deposed,
                       "destroy deposed instance left by an earlier replacement"),
            i);
        ag.link(uLeftover, uDelete);
      }
      ag.link(uDelete, uCreate);
      vStart[i] = uDelete;
      vComplete[i] = uCreate;
    } else {
      const size_t uAction = ag.add(
          makeAction(rn.riId, vDecision[i], vDecision[i], ActionTarget::Current, vReason[i]), i);
      vStart[i] = uAction;
      vComplete[i] = uAction;
      if (bHasDeposed) {
        vOldDelete[i] = ag.add(
            makeAction(rn.riId, ActionOp::Delete, ActionOp::Delete, ActionTarget::Deposed,
                       "destroy deposed instance left by an earlier replacement"),
            i);
        ag.link(uAction, vOldDelete[i]);
      }
    }
  }

  auto isDestroyFirst = [&](size_t i) {
    return vDecision[i] == ActionOp::Replace && !gr.vNodes[i].lpPolicy.bCreateBeforeDestroy;
  };

  // Producer before consumer; consumers move off a deposed instance before it goes.
  // When both are destroyed first, deletes run consumer first and creates producer first.
  for (size_t i = 0; i < uNodes; ++i) {
    for (size_t uProducer : gr.vDependencies[i]) {
      if (isDestroyFirst(uProducer) && isDestroyFirst(i)) {
        ag.link(vStart[i], vStart[uProducer]);
        ag.link(vComplete[uProducer], vComplete[i]);
      } else {
        ag.link(vComplete[uProducer], vStart[i]);
      }
      ag.link(vComplete[i], vOldDelete[uProducer]);
    }
  }

  std::map<ResourceId, size_t> mOrphanDelete;
  for (size_t k = 0; k < vOrphans.size(); ++k) {
    const StateRecord* pRecord = vOrphans[k];
    const size_t uOrderKey = uNodes + k;
    size_t uDeposed = kNone;
    if (pRecord->oDeposed.has_value()) {
      uDeposed = ag.add(makeAction(pRecord->riId, ActionOp::Delete, ActionOp::Delete,
                                   ActionTarget::Deposed,
                                   "destroy deposed instance of a removed resource"),
                        uOrderKey);
    }
    const size_t uDelete = ag.add(makeAction(pRecord->riId, ActionOp::Delete, ActionOp::Delete,
                                             ActionTarget::Current, "no longer declared"),
                                  uOrderKey);
    ag.link(uDeposed, uDelete);
    mOrphanDelete.emplace(pRecord->riId, uDelete);
  }

  // Orphans are destroyed consumer first, using dependencies saved in state
  for (const StateRecord* pRecord : vOrphans) {
    const size_t uDelete = mOrphanDelete.at(pRecord->riId);
    for (const auto& riDep : pRecord->vDependencies) {
      if (auto it = mOrphanDelete.find(riDep); it != mOrphanDelete.end()) {
        ag.link(uDelete, it->second);
      } else if (auto oIdx = gr.indexOf(riDep)) {
        if (isDestroyFirst(*oIdx)) {
          ag.link(uDelete, vStart[*oIdx]);
        } else {
          ag.link(uDelete, vOldDelete[*oIdx]);
        }
      }
    }
  }
  // A declared node that stopped depending on an orphan is updated before the orphan goes
  for (size_t i = 0; i < uNodes; ++i) {
    const StateRecord* pRecord = recordOf(gr.vNodes[i].riId);
    if (!pRecord) continue;
    for (const auto& riDep : pRecord->vDependencies) {
      if (auto it = mOrphanDelete.find(riDep); it != mOrphanDelete.end()) {
        ag.link(vComplete[i], it->second);
      }
    }
  }

  // ── Kahn waves over the action graph ────────────────────────────────────
  const size_t uActions = ag.vActions.size();
  auto byOrder = [&ag](size_t a, size_t b) {
    return std::make_pair(ag.vOrderKey[a], a) < std::make_pair(ag.vOrderKey[b], b);
  };

  std::vector<size_t> vInDegree(uActions);
  std::vector<size_t> vCurrent;
  for (size_t a = 0; a < uActions; ++a) {
    vInDegree[a] = ag.vPred[a].size();
    if (vInDegree[a] == 0) vCurrent.push_back(a);
  }
  std::sort(vCurrent.begin(), vCurrent.end(), byOrder);

  Plan pl;
  size_t uPlaced = 0;
  while (!vCurrent.empty()) {
    std::vector<size_t> vNext;
    for (size_t a : vCurrent) {
      for (size_t uSucc : ag.vSucc[a]) {
        if (--vInDegree[uSucc] == 0) vNext.push_back(uSucc);
      }
    }
    uPlaced += vCurrent.size();
    pl.vWaves.push_back(std::move(vCurrent));
    std::sort(vNext.begin(), vNext.end(), byOrder);
    vCurrent = std::move(vNext);
  }

  if (uPlaced != uActions) {
    std::vector<std::string> vParticipants;
    for (size_t a = 0; a < uActions; ++a) {
      if (vInDegree[a] > 0) {
        vParticipants.push_back(common::toString(ag.vActions[a].op) + " " +
                                ag.vActions[a].riNode.toString());
      }
    }
    throw common::CycleError(std::move(vParticipants));
  }

  pl.vPredecessors.reserve(uActions);
  for (const auto& setPred : ag.vPred) {
    pl.vPredecessors.emplace_back(setPred.begin(), setPred.end());
  }
  pl.vActions = std::move(ag.vActions);

  auto mSummary = pl.summary();
  spLog->info("Plan: {} waves, {} create, {} update, {} delete, {} no-op ({} orphaned)",
              pl.vWaves.size(), mSummary[ActionOp::Create], mSummary[ActionOp::Update],
              mSummary[ActionOp::Delete], mSummary[ActionOp::NoOp], vOrphans.size());
  for (const auto& act : pl.vActions) {
    if (act.op != ActionOp::NoOp) {
      spLog->debug("  {} {}: {}", common::toString(act.op), act.riNode.toString(), act.sReason);
    }
  }
  return pl;
}

}  // namespace recon::core
