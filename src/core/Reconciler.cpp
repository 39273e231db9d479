#include "core/Reconciler.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <thread>
#include <utility>

namespace recon::core {

using common::ActionOp;
using common::StateRecord;

namespace {

/// Keeps the store open for the lifetime of one run.
class StoreSession {
 public:
  explicit StoreSession(state::IStateStore& ssStore) : _ssStore(ssStore) { _ssStore.open(); }

  ~StoreSession() {
    try {
      _ssStore.close();
    } catch (const std::exception& ex) {
      common::Logger::get()->error("Failed to close state store: {}", ex.what());
    }
  }

  StoreSession(const StoreSession&) = delete;
  StoreSession& operator=(const StoreSession&) = delete;

 private:
  state::IStateStore& _ssStore;
};

/// Report listing the planned operation for each node, nothing applied.
common::RunReport planOnlyReport(const common::Plan& pl) {
  common::RunReport rpt;
  rpt.tpStarted = std::chrono::system_clock::now();
  for (const auto& act : pl.vActions) {
    bool bSeen = false;
    for (auto& re : rpt.vEntries) {
      if (re.riNode == act.riNode) {
        if (act.target == common::ActionTarget::Current) re.op = act.decision;
        bSeen = true;
        break;
      }
    }
    if (!bSeen) {
      common::ReportEntry re;
      re.riNode = act.riNode;
      re.op = act.decision;
      re.status = common::NodeStatus::NoOp;
      rpt.vEntries.push_back(std::move(re));
    }
  }
  rpt.bSuccess = true;
  rpt.tpFinished = rpt.tpStarted;
  return rpt;
}

}  // namespace

Reconciler::Reconciler(const providers::ProviderRegistry& preg, state::IStateStore& ssStore,
                       ApplyOptions ao)
    : _preg(preg), _ssStore(ssStore), _ao(ao), _pln(preg) {}

Reconciler::~Reconciler() = default;

common::Plan Reconciler::preview(std::vector<common::ResourceNode> vDeclarations) {
  Graph gr = _gb.build(std::move(vDeclarations));
  StoreSession ss(_ssStore);
  return _pln.plan(gr, _ssStore.list());
}

common::RunReport Reconciler::run(std::vector<common::ResourceNode> vDeclarations,
                                  const RunOptions& ro, std::stop_token stToken) {
  auto spLog = common::Logger::get();

  Graph gr = _gb.build(std::move(vDeclarations));
  spLog->info("Graph: {} resource(s), {} edge(s)", gr.vNodes.size(), gr.vEdges.size());

  state::RunLock rl(_ssStore, ro.sOwner);
  spLog->info("Run lock acquired by {}", ro.sOwner);

  common::RunReport rpt;
  {
    StoreSession ss(_ssStore);

    if (ro.bRefresh) {
      refresh(gr);
    }

    const common::Plan pl = _pln.plan(gr, _ssStore.list());
    if (ro.bPlanOnly) {
      spLog->info("Plan-only run: {} action(s) in {} wave(s), nothing applied",
                  pl.vActions.size(), pl.vWaves.size());
      rpt = planOnlyReport(pl);
    } else {
      Executor ex(_preg, _ssStore, _ao);
      rpt = ex.apply(gr, pl, stToken);
    }
  }

  rl.release();
  spLog->info("Run lock released by {}", ro.sOwner);
  return rpt;
}

void Reconciler::refresh(Graph& gr) {
  auto spLog = common::Logger::get();
  const auto vRecords = _ssStore.list();
  spLog->info("Refreshing {} recorded resource(s)", vRecords.size());

  for (const auto& sr : vRecords) {
    const std::string sNode = sr.riId.toString();
    auto& prov = _preg.get(sr.riId.sType);

    common::ReadResult rr = prov.read(sr.sProviderId);
    for (int iAttempt = 1; !rr.bSuccess && rr.bRetryable && iAttempt < _ao.iMaxAttempts;
         ++iAttempt) {
      spLog->warn("refresh {}: retryable error (attempt {}/{}): {}", sNode, iAttempt,
                  _ao.iMaxAttempts, rr.sErrorMessage);
      std::this_thread::sleep_for(_ao.durRetryBackoff);
      rr = prov.read(sr.sProviderId);
    }
    if (!rr.bSuccess) {
      throw common::ProviderError("refresh_failed",
                                  "Reading " + sNode + " failed: " + rr.sErrorMessage,
                                  rr.bRetryable);
    }

    if (!rr.bFound) {
      spLog->warn("refresh {}: {} no longer exists, dropping its record", sNode,
                  sr.sProviderId);
      if (sr.oDeposed.has_value()) {
        spLog->warn("refresh {}: deposed instance {} is no longer tracked", sNode,
                    sr.oDeposed->sProviderId);
      }
      _ssStore.remove(sr.riId);
      continue;
    }

    const auto vDrift = _de.drift(sr.mDesired, rr.mObserved);
    for (const auto& ad : vDrift) {
      spLog->warn("refresh {}: drift on '{}': recorded {}, observed {}", sNode, ad.sKey,
                  ad.jPrior.dump(), ad.jDesired.dump());
    }
    _ssStore.update(sr.riId, [&](std::optional<StateRecord>& oCurrent) {
      if (!oCurrent) return;
      for (const auto& ad : vDrift) {
        oCurrent->mDesired[ad.sKey] = ad.jDesired;
      }
      oCurrent->mObserved = rr.mObserved;
      ++oCurrent->iVersion;
    });

    if (auto oIdx = gr.indexOf(sr.riId)) {
      gr.vNodes[*oIdx].oObserved = rr.mObserved;
    }
  }
}

}  // namespace recon::core
