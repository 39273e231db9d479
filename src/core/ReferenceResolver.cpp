#include "core/ReferenceResolver.hpp"

#include "common/Errors.hpp"

#include <algorithm>

namespace recon::core {

using common::Attributes;
using common::Reference;
using common::ResourceId;
using common::ResourceNode;

ReferenceResolver::ReferenceResolver() = default;
ReferenceResolver::~ReferenceResolver() = default;

ReferenceResolver::Resolution ReferenceResolver::resolve(const ResourceNode& rnNode,
                                                         const OutputLookup& fnLookup) const {
  Resolution res;
  for (const auto& [sKey, avValue] : rnNode.mDesired) {
    if (const auto* pLiteral = std::get_if<nlohmann::json>(&avValue)) {
      res.mResolved.emplace(sKey, *pLiteral);
      continue;
    }

    const auto& ref = std::get<Reference>(avValue);
    auto oOutputs = fnLookup(ref.riTarget);
    if (!oOutputs) {
      res.vUnknown.push_back(sKey);
      continue;
    }
    auto it = oOutputs->find(ref.sOutputKey);
    if (it == oOutputs->end()) {
      res.vUnknown.push_back(sKey);
      continue;
    }
    res.mResolved.emplace(sKey, it->second);
  }
  return res;
}

Attributes ReferenceResolver::resolveAll(const ResourceNode& rnNode,
                                         const OutputLookup& fnLookup) const {
  auto res = resolve(rnNode, fnLookup);
  if (!res.vUnknown.empty()) {
    const std::string& sKey = res.vUnknown.front();
    const auto& ref = std::get<Reference>(rnNode.mDesired.at(sKey));
    throw common::UnresolvedReferenceError(
        rnNode.riId.toString(), sKey,
        "Output '" + ref.sOutputKey + "' of '" + ref.riTarget.toString() +
            "' is not available for attribute '" + sKey + "' of '" + rnNode.riId.toString() +
            "'");
  }
  return std::move(res.mResolved);
}

std::vector<ResourceId> ReferenceResolver::listDependencies(const ResourceNode& rnNode) const {
  std::vector<ResourceId> vDeps;
  for (const auto& [sKey, avValue] : rnNode.mDesired) {
    if (const auto* pRef = std::get_if<Reference>(&avValue)) {
      if (std::find(vDeps.begin(), vDeps.end(), pRef->riTarget) == vDeps.end()) {
        vDeps.push_back(pRef->riTarget);
      }
    }
  }
  return vDeps;
}

}  // namespace recon::core
