#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"
#include "providers/IProvider.hpp"

namespace recon::core {

/// Kind of change for a single attribute.
enum class DiffKind { Added, Changed, Removed, Unknown };

/// A single attribute difference between the recorded and desired state.
/// Class abbreviation: ad
struct AttributeDiff {
  DiffKind kind = DiffKind::Changed;
  std::string sKey;
  nlohmann::json jPrior;
  nlohmann::json jDesired;
  bool bForcesReplacement = false;
};

/// Deep attribute comparison between last-applied and desired values.
/// Class abbreviation: de
class DiffEngine {
 public:
  DiffEngine();
  ~DiffEngine();

  /// Compare the recorded desired snapshot against the freshly resolved one.
  /// Keys in vUnknown have a value known only after apply and always differ.
  std::vector<AttributeDiff> diff(const common::Attributes& mPrior,
                                  const common::Attributes& mDesired,
                                  const std::vector<std::string>& vUnknown,
                                  const providers::ResourceSchema& rsSchema) const;

  /// NoOp for no differences, Replace if any difference touches an
  /// immutable attribute, Update otherwise.
  static common::ActionOp classify(const std::vector<AttributeDiff>& vDiffs);

  /// Human-readable reason, e.g. "update: acl, tags; replace forced by: bucket".
  static std::string describe(const std::vector<AttributeDiff>& vDiffs);

  /// Keys whose observed value no longer matches the last-applied value.
  /// Only keys the provider reports are compared.
  std::vector<AttributeDiff> drift(const common::Attributes& mLastApplied,
                                   const common::Attributes& mObserved) const;
};

}  // namespace recon::core
