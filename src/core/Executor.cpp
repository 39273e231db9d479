#include "core/Executor.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ThreadPool.hpp"

#include <algorithm>
#include <future>
#include <map>
#include <thread>
#include <utility>

namespace recon::core {

using common::Action;
using common::ActionOp;
using common::ActionTarget;
using common::Attributes;
using common::NodeStatus;
using common::PushResult;
using common::ResourceId;
using common::StateRecord;

ApplyOptions ApplyOptions::fromConfig(const common::Config& cfg) {
  ApplyOptions ao;
  ao.iParallelism = cfg.iParallelism;
  ao.iMaxAttempts = cfg.iMaxAttempts;
  ao.durRetryBackoff = std::chrono::milliseconds(cfg.iRetryBackoffMs);
  ao.durWaitTimeout = std::chrono::seconds(cfg.iWaitTimeoutSeconds);
  ao.durWaitInitialBackoff = std::chrono::milliseconds(cfg.iWaitInitialBackoffMs);
  ao.durWaitMaxBackoff = std::chrono::milliseconds(cfg.iWaitMaxBackoffMs);
  return ao;
}

Executor::Executor(const providers::ProviderRegistry& preg, state::IStateStore& ssStore,
                   ApplyOptions ao)
    : _preg(preg), _ssStore(ssStore), _ao(ao) {}

Executor::~Executor() = default;

// ── Provider call helpers ──────────────────────────────────────────────────

template <typename Fn>
PushResult Executor::withRetry(const std::string& sOperation, const std::string& sNode,
                               Fn&& fnCall) {
  auto durBackoff = _ao.durRetryBackoff;
  for (int iAttempt = 1;; ++iAttempt) {
    PushResult prs = fnCall();
    if (prs.bSuccess) {
      return prs;
    }
    if (!prs.bRetryable || iAttempt >= _ao.iMaxAttempts) {
      throw common::ProviderError(
          "provider_error",
          sOperation + " " + sNode + " failed after " + std::to_string(iAttempt) +
              " attempt(s): " + prs.sErrorMessage,
          prs.bRetryable);
    }
    common::Logger::get()->warn("{} {}: retryable error (attempt {}/{}), retrying in {}ms: {}",
                                sOperation, sNode, iAttempt, _ao.iMaxAttempts,
                                durBackoff.count(), prs.sErrorMessage);
    std::this_thread::sleep_for(durBackoff);
    durBackoff *= 2;
  }
}

void Executor::awaitCondition(providers::IProvider& prov, const std::string& sNode,
                              const std::string& sProviderId, const common::WaitCondition& wc) {
  auto spLog = common::Logger::get();
  const auto durTimeout = wc.oTimeout.value_or(_ao.durWaitTimeout);
  const auto tpDeadline = std::chrono::steady_clock::now() + durTimeout;
  auto durBackoff = _ao.durWaitInitialBackoff;
  int iPoll = 0;

  spLog->info("{}: waiting for '{}' (timeout {}s)", sNode, wc.sName, durTimeout.count());

  while (true) {
    ++iPoll;
    common::WaitResult wr = prov.wait(sProviderId, wc);
    if (wr.bSuccess && wr.bSatisfied) {
      spLog->info("{}: '{}' satisfied after {} poll(s)", sNode, wc.sName, iPoll);
      return;
    }
    if (!wr.bSuccess && !wr.bRetryable) {
      throw common::ProviderError("wait_failed", "Evaluating '" + wc.sName + "' for " + sNode +
                                                     " failed: " + wr.sErrorMessage);
    }
    spLog->debug("{}: '{}' not satisfied yet (poll {}){}", sNode, wc.sName, iPoll,
                 wr.bSuccess ? "" : ": " + wr.sErrorMessage);

    const auto tpNow = std::chrono::steady_clock::now();
    if (tpNow >= tpDeadline) {
      throw common::WaitTimeoutError(
          wc.sName, "Timed out after " + std::to_string(durTimeout.count()) + "s waiting for '" +
                        wc.sName + "' on " + sNode + " (" + std::to_string(iPoll) + " polls)");
    }
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(durBackoff, tpDeadline - tpNow));
    durBackoff = std::min(durBackoff * 2, _ao.durWaitMaxBackoff);
  }
}

ReferenceResolver::OutputLookup Executor::stateLookup() {
  return [this](const ResourceId& riProducer) -> std::optional<Attributes> {
    auto oRecord = _ssStore.get(riProducer);
    if (!oRecord) return std::nullopt;
    return std::move(oRecord->mObserved);
  };
}

// ── Per-action execution ───────────────────────────────────────────────────

Executor::ActionResult Executor::applyCurrent(const Graph& gr, const Action& act,
                                              providers::IProvider& prov) {
  auto spLog = common::Logger::get();
  const std::string sNode = act.riNode.toString();
  const auto oIdx = gr.indexOf(act.riNode);
  if (!oIdx) {
    throw common::NotFoundError("resource_not_found",
                                "Resource '" + sNode + "' is planned but not declared");
  }
  const auto& rn = gr.vNodes[*oIdx];

  // Producers are terminal by now; their fresh outputs replace plan-time values
  auto oRecord = _ssStore.get(act.riNode);
  const Attributes mDesired = _rres.resolveAll(rn, stateLookup());

  ActionOp op = act.op;
  if (op == ActionOp::NoOp) {
    if (!oRecord) {
      throw common::StateStoreError("state_missing",
                                    "State record for " + sNode + " disappeared since planning");
    }
    if (oRecord->mDesired == mDesired) {
      return ActionResult{Outcome::Unchanged, {}, {}};
    }
    spLog->info("{}: upstream output changed during this run, updating", sNode);
    op = ActionOp::Update;
  }

  if (op == ActionOp::Update && oRecord) {
    // An immutable attribute cannot change in place, whatever the plan said
    const auto vDiffs = _de.diff(oRecord->mDesired, mDesired, {}, prov.schema());
    if (DiffEngine::classify(vDiffs) == ActionOp::Replace) {
      throw common::ValidationError(
          "replacement_required",
          "Cannot update " + sNode + " in place (" + DiffEngine::describe(vDiffs) +
              "); the next plan will replace it");
    }
  }

  PushResult prs;
  if (op == ActionOp::Create) {
    spLog->info("{}: creating", sNode);
    prs = withRetry("create", sNode, [&]() { return prov.create(mDesired); });
  } else {
    if (!oRecord) {
      throw common::StateStoreError("state_missing",
                                    "Cannot update " + sNode + ": no state record");
    }
    spLog->info("{}: updating {}", sNode, oRecord->sProviderId);
    prs = withRetry("update", sNode, [&]() {
      return prov.update(oRecord->sProviderId, mDesired, oRecord->mDesired);
    });
    if (prs.sProviderId.empty()) {
      prs.sProviderId = oRecord->sProviderId;
    }
  }

  // The provider operation completed; convergence only decides taint
  ActionResult ar{Outcome::Succeeded, {}, {}};
  if (rn.oWait.has_value()) {
    try {
      awaitCondition(prov, sNode, prs.sProviderId, *rn.oWait);
    } catch (const common::AppError& ex) {
      ar = ActionResult{Outcome::Failed, ex._sErrorCode, ex.what()};
    } catch (const std::exception& ex) {
      ar = ActionResult{Outcome::Failed, "provider_exception", ex.what()};
    }
  }

  std::vector<ResourceId> vDeps;
  for (size_t uProducer : gr.vDependencies[*oIdx]) {
    vDeps.push_back(gr.vNodes[uProducer].riId);
  }
  const bool bTainted = ar.outcome == Outcome::Failed;

  auto oStored = _ssStore.update(act.riNode, [&](std::optional<StateRecord>& oCurrent) {
    StateRecord sr;
    sr.riId = act.riNode;
    sr.sProviderId = prs.sProviderId;
    sr.mDesired = mDesired;
    sr.mObserved = prs.mObserved;
    sr.vDependencies = vDeps;
    sr.bTainted = bTainted;
    sr.iVersion = oCurrent ? oCurrent->iVersion + 1 : 1;
    if (oCurrent) {
      if (op == ActionOp::Create && !oCurrent->sProviderId.empty() &&
          oCurrent->sProviderId != prs.sProviderId) {
        sr.oDeposed = common::DeposedInstance{oCurrent->sProviderId, oCurrent->mObserved};
      } else {
        sr.oDeposed = oCurrent->oDeposed;
      }
      if (op == ActionOp::Update) {
        // Providers may report only what changed
        Attributes mMerged = oCurrent->mObserved;
        for (const auto& [sKey, jValue] : prs.mObserved) {
          mMerged[sKey] = jValue;
        }
        sr.mObserved = std::move(mMerged);
      }
    }
    oCurrent = std::move(sr);
  });

  if (bTainted) {
    spLog->error("{}: {} (recorded as tainted, version {})", sNode, ar.sError,
                 oStored ? oStored->iVersion : 0);
  } else {
    spLog->info("{}: {} complete ({}, version {})", sNode, common::toString(op),
                prs.sProviderId, oStored ? oStored->iVersion : 0);
  }
  return ar;
}

Executor::ActionResult Executor::deleteCurrent(const Action& act, providers::IProvider& prov) {
  auto spLog = common::Logger::get();
  const std::string sNode = act.riNode.toString();

  auto oRecord = _ssStore.get(act.riNode);
  if (!oRecord) {
    spLog->debug("{}: already absent from state, nothing to delete", sNode);
    return ActionResult{Outcome::Succeeded, {}, {}};
  }

  spLog->info("{}: deleting {}", sNode, oRecord->sProviderId);
  withRetry("delete", sNode, [&]() { return prov.remove(oRecord->sProviderId); });

  _ssStore.update(act.riNode, [](std::optional<StateRecord>& oCurrent) { oCurrent.reset(); });
  spLog->info("{}: delete complete", sNode);
  return ActionResult{Outcome::Succeeded, {}, {}};
}

Executor::ActionResult Executor::deleteDeposed(const Action& act, providers::IProvider& prov) {
  auto spLog = common::Logger::get();
  const std::string sNode = act.riNode.toString();

  auto oRecord = _ssStore.get(act.riNode);
  if (!oRecord || !oRecord->oDeposed.has_value()) {
    spLog->debug("{}: no deposed instance to delete", sNode);
    return ActionResult{Outcome::Succeeded, {}, {}};
  }

  const std::string sDeposedId = oRecord->oDeposed->sProviderId;
  spLog->info("{}: deleting deposed instance {}", sNode, sDeposedId);
  withRetry("delete deposed", sNode, [&]() { return prov.remove(sDeposedId); });

  _ssStore.update(act.riNode, [](std::optional<StateRecord>& oCurrent) {
    if (!oCurrent) return;
    oCurrent->oDeposed.reset();
    ++oCurrent->iVersion;
  });
  spLog->info("{}: deposed instance {} deleted", sNode, sDeposedId);
  return ActionResult{Outcome::Succeeded, {}, {}};
}

Executor::ActionResult Executor::runAction(const Graph& gr, const Action& act) {
  auto spLog = common::Logger::get();
  try {
    auto& prov = _preg.get(act.riNode.sType);
    if (act.op == ActionOp::Delete) {
      return act.target == ActionTarget::Deposed ? deleteDeposed(act, prov)
                                                 : deleteCurrent(act, prov);
    }
    return applyCurrent(gr, act, prov);
  } catch (const common::AppError& ex) {
    spLog->error("{} {} failed: {}", common::toString(act.op), act.riNode.toString(), ex.what());
    return ActionResult{Outcome::Failed, ex._sErrorCode, ex.what()};
  } catch (const std::exception& ex) {
    spLog->error("{} {} failed: {}", common::toString(act.op), act.riNode.toString(), ex.what());
    return ActionResult{Outcome::Failed, "provider_exception", ex.what()};
  } catch (...) {
    spLog->error("{} {} failed with unknown error", common::toString(act.op),
                 act.riNode.toString());
    return ActionResult{Outcome::Failed, "unknown_error", "unknown error"};
  }
}

// ── Wave loop ──────────────────────────────────────────────────────────────

common::RunReport Executor::apply(const Graph& gr, const common::Plan& pl,
                                  std::stop_token stToken) {
  auto spLog = common::Logger::get();
  common::RunReport rpt;
  rpt.tpStarted = std::chrono::system_clock::now();

  const size_t uActions = pl.vActions.size();
  std::vector<ActionResult> vResults(uActions);
  auto isTerminalFailure = [&vResults](size_t a) {
    return vResults[a].outcome == Outcome::Failed || vResults[a].outcome == Outcome::Blocked;
  };

  ThreadPool tp(_ao.iParallelism);

  for (size_t w = 0; w < pl.vWaves.size(); ++w) {
    const auto& vWave = pl.vWaves[w];
    spLog->info("Wave {}/{}: {} action(s)", w + 1, pl.vWaves.size(), vWave.size());

    std::vector<std::pair<size_t, std::future<ActionResult>>> vInFlight;
    for (size_t a : vWave) {
      const Action& act = pl.vActions[a];

      if (stToken.stop_requested()) {
        rpt.bCancelled = true;
        vResults[a] = ActionResult{Outcome::Blocked, "cancelled", "apply cancelled before dispatch"};
        continue;
      }

      const auto& vPred = pl.vPredecessors[a];
      auto itFailed = std::find_if(vPred.begin(), vPred.end(), isTerminalFailure);
      if (itFailed != vPred.end()) {
        const std::string sBlocker = pl.vActions[*itFailed].riNode.toString();
        spLog->warn("{} {}: blocked by {}", common::toString(act.op), act.riNode.toString(),
                    sBlocker);
        vResults[a] = ActionResult{Outcome::Blocked, "dependency_failed",
                                   "blocked by failed dependency " + sBlocker};
        continue;
      }

      vInFlight.emplace_back(a, tp.submit([this, &gr, &act]() { return runAction(gr, act); }));
    }

    // Wave barrier
    for (auto& [a, fut] : vInFlight) {
      vResults[a] = fut.get();
    }
    spLog->debug("Wave {}/{} finished ({} dispatched)", w + 1, pl.vWaves.size(),
                 vInFlight.size());
  }
  tp.shutdown();

  if (rpt.bCancelled) {
    spLog->warn("Apply cancelled: remaining actions were not dispatched");
  }

  // ── One report entry per node, in plan order ─────────────────────────────
  auto rank = [](NodeStatus status) {
    switch (status) {
      case NodeStatus::NoOp: return 0;
      case NodeStatus::Applied: return 1;
      case NodeStatus::Blocked: return 2;
      case NodeStatus::Failed: return 3;
    }
    return 0;
  };
  auto toStatus = [](Outcome outcome) {
    switch (outcome) {
      case Outcome::Succeeded: return NodeStatus::Applied;
      case Outcome::Failed: return NodeStatus::Failed;
      case Outcome::Blocked: return NodeStatus::Blocked;
      case Outcome::Unchanged:
      case Outcome::Pending: break;
    }
    return NodeStatus::NoOp;
  };

  std::map<ResourceId, size_t> mEntry;
  std::vector<bool> vOpFromCurrent;
  for (size_t a = 0; a < uActions; ++a) {
    const Action& act = pl.vActions[a];
    auto [it, bNew] = mEntry.emplace(act.riNode, rpt.vEntries.size());
    if (bNew) {
      common::ReportEntry re;
      re.riNode = act.riNode;
      re.op = act.decision;
      re.status = NodeStatus::NoOp;
      rpt.vEntries.push_back(std::move(re));
      vOpFromCurrent.push_back(act.target == ActionTarget::Current);
    }

    auto& re = rpt.vEntries[it->second];
    if (act.target == ActionTarget::Current && !vOpFromCurrent[it->second]) {
      re.op = act.decision;
      vOpFromCurrent[it->second] = true;
    }
    const NodeStatus status = toStatus(vResults[a].outcome);
    if (rank(status) > rank(re.status)) {
      re.status = status;
      re.sErrorCode = vResults[a].sErrorCode;
      re.sError = vResults[a].sError;
    }
  }

  int iApplied = 0, iNoOp = 0, iFailed = 0, iBlocked = 0;
  for (const auto& re : rpt.vEntries) {
    switch (re.status) {
      case NodeStatus::Applied: ++iApplied; break;
      case NodeStatus::NoOp: ++iNoOp; break;
      case NodeStatus::Failed: ++iFailed; break;
      case NodeStatus::Blocked: ++iBlocked; break;
    }
  }
  rpt.bSuccess = iFailed == 0 && iBlocked == 0;
  rpt.tpFinished = std::chrono::system_clock::now();

  spLog->info("Apply finished: {} applied, {} unchanged, {} failed, {} blocked", iApplied, iNoOp,
              iFailed, iBlocked);
  return rpt;
}

}  // namespace recon::core
