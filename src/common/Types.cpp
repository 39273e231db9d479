#include "common/Types.hpp"

#include "common/Errors.hpp"

#include <algorithm>

namespace recon::common {

ResourceId ResourceId::parse(const std::string& sId) {
  const auto uDot = sId.find('.');
  if (uDot == std::string::npos || uDot == 0 || uDot + 1 == sId.size()) {
    throw ValidationError("invalid_resource_id",
                          "Resource id must have the form type.name: '" + sId + "'");
  }
  return ResourceId{sId.substr(0, uDot), sId.substr(uDot + 1)};
}

std::string toString(ActionOp op) {
  switch (op) {
    case ActionOp::Create: return "create";
    case ActionOp::Update: return "update";
    case ActionOp::Delete: return "delete";
    case ActionOp::Replace: return "replace";
    case ActionOp::NoOp: return "no-op";
  }
  return "unknown";
}

std::string toString(NodeStatus status) {
  switch (status) {
    case NodeStatus::Applied: return "applied";
    case NodeStatus::NoOp: return "no-op";
    case NodeStatus::Failed: return "failed";
    case NodeStatus::Blocked: return "blocked";
  }
  return "unknown";
}

// ── Plan ───────────────────────────────────────────────────────────────────

size_t Plan::waveOf(size_t uAction) const {
  for (size_t w = 0; w < vWaves.size(); ++w) {
    if (std::find(vWaves[w].begin(), vWaves[w].end(), uAction) != vWaves[w].end()) {
      return w;
    }
  }
  throw std::out_of_range("Action index " + std::to_string(uAction) + " is not scheduled");
}

std::vector<size_t> Plan::actionsFor(const ResourceId& riNode) const {
  std::vector<size_t> vResult;
  for (const auto& vWave : vWaves) {
    for (size_t uIdx : vWave) {
      if (vActions[uIdx].riNode == riNode) {
        vResult.push_back(uIdx);
      }
    }
  }
  return vResult;
}

bool Plan::isNoOp() const {
  return std::all_of(vActions.begin(), vActions.end(),
                     [](const Action& act) { return act.op == ActionOp::NoOp; });
}

std::map<ActionOp, int> Plan::summary() const {
  std::map<ActionOp, int> mCounts;
  for (const auto& act : vActions) {
    ++mCounts[act.op];
  }
  return mCounts;
}

nlohmann::json Plan::toJson() const {
  nlohmann::json jWaves = nlohmann::json::array();
  for (const auto& vWave : vWaves) {
    nlohmann::json jWave = nlohmann::json::array();
    for (size_t uIdx : vWave) {
      const auto& act = vActions[uIdx];
      jWave.push_back({
          {"node", act.riNode.toString()},
          {"op", toString(act.op)},
          {"decision", toString(act.decision)},
          {"target", act.target == ActionTarget::Deposed ? "deposed" : "current"},
          {"reason", act.sReason},
      });
    }
    jWaves.push_back(std::move(jWave));
  }
  return nlohmann::json{{"waves", std::move(jWaves)}};
}

// ── RunReport ──────────────────────────────────────────────────────────────

const ReportEntry* RunReport::find(const ResourceId& riNode) const {
  for (const auto& re : vEntries) {
    if (re.riNode == riNode) return &re;
  }
  return nullptr;
}

nlohmann::json RunReport::toJson() const {
  nlohmann::json jEntries = nlohmann::json::array();
  for (const auto& re : vEntries) {
    nlohmann::json jEntry = {
        {"node", re.riNode.toString()},
        {"op", toString(re.op)},
        {"status", toString(re.status)},
    };
    if (!re.sError.empty()) {
      jEntry["error_code"] = re.sErrorCode;
      jEntry["error"] = re.sError;
    }
    jEntries.push_back(std::move(jEntry));
  }

  const auto iDurationMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(tpFinished - tpStarted).count();
  return nlohmann::json{
      {"success", bSuccess},
      {"cancelled", bCancelled},
      {"duration_ms", iDurationMs},
      {"resources", std::move(jEntries)},
  };
}

// ── JSON conversions ───────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const ResourceId& ri) { j = ri.toString(); }

void from_json(const nlohmann::json& j, ResourceId& ri) {
  ri = ResourceId::parse(j.get<std::string>());
}

void to_json(nlohmann::json& j, const DeposedInstance& di) {
  j = nlohmann::json{{"provider_id", di.sProviderId}, {"observed", di.mObserved}};
}

void from_json(const nlohmann::json& j, DeposedInstance& di) {
  j.at("provider_id").get_to(di.sProviderId);
  di.mObserved = j.value("observed", Attributes{});
}

void to_json(nlohmann::json& j, const StateRecord& sr) {
  j = nlohmann::json{
      {"id", sr.riId},
      {"provider_id", sr.sProviderId},
      {"desired", sr.mDesired},
      {"observed", sr.mObserved},
      {"dependencies", sr.vDependencies},
      {"tainted", sr.bTainted},
      {"version", sr.iVersion},
  };
  if (sr.oDeposed.has_value()) {
    j["deposed"] = *sr.oDeposed;
  }
}

void from_json(const nlohmann::json& j, StateRecord& sr) {
  j.at("id").get_to(sr.riId);
  j.at("provider_id").get_to(sr.sProviderId);
  sr.mDesired = j.value("desired", Attributes{});
  sr.mObserved = j.value("observed", Attributes{});
  sr.vDependencies = j.value("dependencies", std::vector<ResourceId>{});
  sr.bTainted = j.value("tainted", false);
  j.at("version").get_to(sr.iVersion);
  if (j.contains("deposed") && !j.at("deposed").is_null()) {
    sr.oDeposed = j.at("deposed").get<DeposedInstance>();
  } else {
    sr.oDeposed.reset();
  }
}

}  // namespace recon::common
