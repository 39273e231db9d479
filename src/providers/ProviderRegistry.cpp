#include "providers/ProviderRegistry.hpp"

#include "common/Errors.hpp"

namespace recon::providers {

ProviderRegistry::ProviderRegistry() = default;
ProviderRegistry::~ProviderRegistry() = default;

void ProviderRegistry::add(std::shared_ptr<IProvider> spProvider) {
  if (!spProvider) {
    throw common::ValidationError("invalid_provider", "Cannot register a null provider");
  }
  const std::string sType = spProvider->type();
  if (_mProviders.contains(sType)) {
    throw common::ValidationError("duplicate_provider",
                                  "Provider already registered for type '" + sType + "'");
  }
  _mProviders.emplace(sType, std::move(spProvider));
}

IProvider& ProviderRegistry::get(const std::string& sType) const {
  auto it = _mProviders.find(sType);
  if (it == _mProviders.end()) {
    throw common::NotFoundError("provider_not_found",
                                "No provider registered for resource type '" + sType + "'");
  }
  return *it->second;
}

}  // namespace recon::providers
