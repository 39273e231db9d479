#include "core/DiffEngine.hpp"

#include <algorithm>

namespace recon::core {

using common::ActionOp;
using common::Attributes;

DiffEngine::DiffEngine() = default;
DiffEngine::~DiffEngine() = default;

std::vector<AttributeDiff> DiffEngine::diff(const Attributes& mPrior, const Attributes& mDesired,
                                            const std::vector<std::string>& vUnknown,
                                            const providers::ResourceSchema& rsSchema) const {
  std::vector<AttributeDiff> vDiffs;
  auto isImmutable = [&rsSchema](const std::string& sKey) {
    return rsSchema.setImmutable.contains(sKey);
  };

  for (const auto& [sKey, jDesired] : mDesired) {
    auto it = mPrior.find(sKey);
    if (it == mPrior.end()) {
      vDiffs.push_back(AttributeDiff{DiffKind::Added, sKey, nullptr, jDesired, isImmutable(sKey)});
    } else if (it->second != jDesired) {
      vDiffs.push_back(
          AttributeDiff{DiffKind::Changed, sKey, it->second, jDesired, isImmutable(sKey)});
    }
  }

  for (const auto& sKey : vUnknown) {
    auto it = mPrior.find(sKey);
    vDiffs.push_back(AttributeDiff{DiffKind::Unknown, sKey,
                                   it == mPrior.end() ? nlohmann::json() : it->second, nullptr,
                                   isImmutable(sKey)});
  }

  for (const auto& [sKey, jPrior] : mPrior) {
    const bool bUnknown = std::find(vUnknown.begin(), vUnknown.end(), sKey) != vUnknown.end();
    if (!mDesired.contains(sKey) && !bUnknown) {
      vDiffs.push_back(AttributeDiff{DiffKind::Removed, sKey, jPrior, nullptr, isImmutable(sKey)});
    }
  }

  std::sort(vDiffs.begin(), vDiffs.end(),
            [](const AttributeDiff& a, const AttributeDiff& b) { return a.sKey < b.sKey; });
  return vDiffs;
}

ActionOp DiffEngine::classify(const std::vector<AttributeDiff>& vDiffs) {
  if (vDiffs.empty()) return ActionOp::NoOp;
  const bool bReplace = std::any_of(vDiffs.begin(), vDiffs.end(),
                                    [](const AttributeDiff& ad) { return ad.bForcesReplacement; });
  return bReplace ? ActionOp::Replace : ActionOp::Update;
}

std::string DiffEngine::describe(const std::vector<AttributeDiff>& vDiffs) {
  if (vDiffs.empty()) return "up to date";

  std::string sChanged;
  std::string sForced;
  bool bUnknown = false;
  for (const auto& ad : vDiffs) {
    std::string& sTarget = ad.bForcesReplacement ? sForced : sChanged;
    if (!sTarget.empty()) sTarget += ", ";
    sTarget += ad.sKey;
    bUnknown = bUnknown || ad.kind == DiffKind::Unknown;
  }

  std::string sReason;
  if (!sChanged.empty()) sReason = "changed: " + sChanged;
  if (!sForced.empty()) {
    if (!sReason.empty()) sReason += "; ";
    sReason += "replacement forced by: " + sForced;
  }
  if (bUnknown) sReason += " (depends on value known after apply)";
  return sReason;
}

std::vector<AttributeDiff> DiffEngine::drift(const Attributes& mLastApplied,
                                             const Attributes& mObserved) const {
  std::vector<AttributeDiff> vDrift;
  for (const auto& [sKey, jApplied] : mLastApplied) {
    auto it = mObserved.find(sKey);
    if (it != mObserved.end() && it->second != jApplied) {
      vDrift.push_back(AttributeDiff{DiffKind::Changed, sKey, jApplied, it->second, false});
    }
  }
  return vDrift;
}

}  // namespace recon::core
