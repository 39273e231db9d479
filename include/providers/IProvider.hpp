#pragma once

#include <set>
#include <string>

#include "common/Types.hpp"

namespace recon::providers {

/// Static facts a provider declares about its resource type.
/// Class abbreviation: rs
struct ResourceSchema {
  /// Attributes that cannot change in place; a change forces replacement.
  std::set<std::string> setImmutable;
};

/// Pure abstract interface implemented once per resource type
/// (bucket, policy, certificate, DNS record, CDN distribution, ...).
/// Implementations must be safe to call from several executor workers at once.
class IProvider {
 public:
  virtual ~IProvider() = default;

  /// Resource type handled, e.g. "aws_s3_bucket".
  virtual std::string type() const = 0;
  virtual ResourceSchema schema() const = 0;

  virtual common::PushResult create(const common::Attributes& mDesired) = 0;
  virtual common::ReadResult read(const std::string& sProviderId) = 0;
  virtual common::PushResult update(const std::string& sProviderId,
                                    const common::Attributes& mDesired,
                                    const common::Attributes& mPrior) = 0;
  virtual common::PushResult remove(const std::string& sProviderId) = 0;

  /// Evaluate a WaitCondition once. Providers without asynchronous
  /// convergence keep the default, which reports satisfied immediately.
  virtual common::WaitResult wait(const std::string& /*sProviderId*/,
                                  const common::WaitCondition& /*wcCondition*/) {
    common::WaitResult wr;
    wr.bSuccess = true;
    wr.bSatisfied = true;
    return wr;
  }
};

}  // namespace recon::providers
