#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace recon::common {

/// Base error for all engine-level exceptions.
/// Carries a machine-readable error code slug.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;

  explicit AppError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Malformed declarations or configuration (e.g., duplicate resource id).
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// Requested entity does not exist (e.g., no provider for a resource type).
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// Graph contains a cycle. Fatal, raised before any side effect.
/// _vParticipants lists the cycle path, first node repeated at the end.
struct CycleError : AppError {
  std::vector<std::string> _vParticipants;

  explicit CycleError(std::vector<std::string> vParticipants)
      : AppError("cycle_detected", describe(vParticipants)),
        _vParticipants(std::move(vParticipants)) {}

 private:
  static std::string describe(const std::vector<std::string>& vParticipants) {
    std::string sMsg = "Dependency cycle detected: ";
    for (size_t i = 0; i < vParticipants.size(); ++i) {
      if (i > 0) sMsg += " -> ";
      sMsg += vParticipants[i];
    }
    return sMsg;
  }
};

/// Attribute reference or explicit dependency names a missing node or output.
/// Fatal, raised before any side effect.
struct UnresolvedReferenceError : AppError {
  std::string _sNode;
  std::string _sAttribute;

  explicit UnresolvedReferenceError(std::string sNode, std::string sAttribute,
                                    std::string sMsg)
      : AppError("unresolved_reference", std::move(sMsg)),
        _sNode(std::move(sNode)),
        _sAttribute(std::move(sAttribute)) {}
};

/// Upstream provider call failed. Isolated to the node being applied.
struct ProviderError : AppError {
  bool _bRetryable;

  explicit ProviderError(std::string sCode, std::string sMsg, bool bRetryable = false)
      : AppError(std::move(sCode), std::move(sMsg)), _bRetryable(bRetryable) {}
};

/// A WaitCondition did not become true before its deadline.
struct WaitTimeoutError : AppError {
  std::string _sCondition;

  explicit WaitTimeoutError(std::string sCondition, std::string sMsg)
      : AppError("wait_timeout", std::move(sMsg)), _sCondition(std::move(sCondition)) {}
};

/// Another apply run holds the advisory lock. Fatal for this run, non-destructive.
struct LockContentionError : AppError {
  std::string _sHolder;

  explicit LockContentionError(std::string sHolder, std::string sMsg)
      : AppError("lock_contention", std::move(sMsg)), _sHolder(std::move(sHolder)) {}
};

/// State medium is unreadable, corrupt, or rejected a write.
struct StateStoreError : AppError {
  explicit StateStoreError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

}  // namespace recon::common
