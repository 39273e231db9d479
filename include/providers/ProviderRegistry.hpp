#pragma once

#include <map>
#include <memory>
#include <string>

#include "providers/IProvider.hpp"

namespace recon::providers {

/// Maps resource types to the provider that manages them.
/// Populated before a run; read-only (and therefore thread-safe) during it.
/// Class abbreviation: preg
class ProviderRegistry {
 public:
  ProviderRegistry();
  ~ProviderRegistry();

  /// Register a provider under its type(). Throws ValidationError on duplicates.
  void add(std::shared_ptr<IProvider> spProvider);

  /// Provider for a type. Throws NotFoundError("provider_not_found").
  IProvider& get(const std::string& sType) const;

 private:
  std::map<std::string, std::shared_ptr<IProvider>> _mProviders;
};

}  // namespace recon::providers
