#pragma once

#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/Types.hpp"
#include "core/DiffEngine.hpp"
#include "core/GraphBuilder.hpp"
#include "core/ReferenceResolver.hpp"
#include "providers/ProviderRegistry.hpp"
#include "state/IStateStore.hpp"

namespace recon::core {

/// Tunables for one apply run.
/// Class abbreviation: ao
struct ApplyOptions {
  int iParallelism = 10;
  int iMaxAttempts = 3;
  std::chrono::milliseconds durRetryBackoff{1000};
  std::chrono::seconds durWaitTimeout{1800};
  std::chrono::milliseconds durWaitInitialBackoff{500};
  std::chrono::milliseconds durWaitMaxBackoff{30000};

  static ApplyOptions fromConfig(const common::Config& cfg);
};

/// Walks a plan wave by wave against the providers and records results in
/// the state store.
///
/// Wave N+1 starts only once every action of wave N is terminal. Actions in
/// a wave run on a ThreadPool of iParallelism workers. An action whose
/// predecessor failed or was blocked is reported blocked and never reaches
/// a provider. After a stop request no new action is dispatched; actions
/// already running are left to finish.
/// Class abbreviation: ex
class Executor {
 public:
  Executor(const providers::ProviderRegistry& preg, state::IStateStore& ssStore,
           ApplyOptions ao);
  ~Executor();

  common::RunReport apply(const Graph& gr, const common::Plan& pl,
                          std::stop_token stToken = {});

 private:
  enum class Outcome { Pending, Succeeded, Unchanged, Failed, Blocked };

  struct ActionResult {
    Outcome outcome = Outcome::Pending;
    std::string sErrorCode;
    std::string sError;
  };

  /// Execute one action. Never throws: every failure becomes Outcome::Failed.
  ActionResult runAction(const Graph& gr, const common::Action& act);

  ActionResult applyCurrent(const Graph& gr, const common::Action& act,
                            providers::IProvider& prov);
  ActionResult deleteCurrent(const common::Action& act, providers::IProvider& prov);
  ActionResult deleteDeposed(const common::Action& act, providers::IProvider& prov);

  /// Call fnCall until success, a non-retryable failure, or iMaxAttempts.
  /// Throws ProviderError on final failure.
  template <typename Fn>
  common::PushResult withRetry(const std::string& sOperation, const std::string& sNode,
                               Fn&& fnCall);

  /// Poll a WaitCondition with exponential backoff.
  /// Throws WaitTimeoutError past the deadline, ProviderError on a
  /// non-retryable evaluation failure.
  void awaitCondition(providers::IProvider& prov, const std::string& sNode,
                      const std::string& sProviderId, const common::WaitCondition& wc);

  /// Current outputs of a producer from the state store.
  ReferenceResolver::OutputLookup stateLookup();

  const providers::ProviderRegistry& _preg;
  state::IStateStore& _ssStore;
  ApplyOptions _ao;
  ReferenceResolver _rres;
  DiffEngine _de;
};

}  // namespace recon::core
