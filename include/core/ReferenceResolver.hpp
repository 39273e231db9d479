#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace recon::core {

/// Substitutes Reference values in a node's desired attributes with the
/// producers' computed outputs.
/// Class abbreviation: rres
class ReferenceResolver {
 public:
  /// Returns a producer's current outputs, or nullopt when they are not
  /// known yet (producer not applied, or about to be recreated).
  using OutputLookup =
      std::function<std::optional<common::Attributes>(const common::ResourceId&)>;

  /// Outcome of a lenient resolution.
  /// Class abbreviation: res
  struct Resolution {
    common::Attributes mResolved;       // literals and known references
    std::vector<std::string> vUnknown;  // attribute keys whose value is not known yet
  };

  ReferenceResolver();
  ~ReferenceResolver();

  /// Resolve what can be resolved; unknown references are listed, not thrown.
  Resolution resolve(const common::ResourceNode& rnNode, const OutputLookup& fnLookup) const;

  /// Resolve every attribute. Throws UnresolvedReferenceError naming the
  /// first attribute whose producer output is unavailable.
  common::Attributes resolveAll(const common::ResourceNode& rnNode,
                                const OutputLookup& fnLookup) const;

  /// Producers referenced by attribute values, deduplicated, in attribute-key order.
  std::vector<common::ResourceId> listDependencies(const common::ResourceNode& rnNode) const;
};

}  // namespace recon::core
