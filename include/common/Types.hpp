#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace recon::common {

/// Resolved attribute set: key → literal JSON value.
using Attributes = std::map<std::string, nlohmann::json>;

/// Identity of a managed resource: type + logical name ("aws_s3_bucket.site").
/// Class abbreviation: ri
struct ResourceId {
  std::string sType;
  std::string sName;

  std::string toString() const { return sType + "." + sName; }

  /// Split "type.name" at the first dot. Throws ValidationError when malformed.
  static ResourceId parse(const std::string& sId);

  auto operator<=>(const ResourceId&) const = default;
};

/// Value standing for another node's computed output attribute.
/// Class abbreviation: ref
struct Reference {
  ResourceId riTarget;
  std::string sOutputKey;

  bool operator==(const Reference&) const = default;
};

/// Desired attribute value: a literal or a Reference to be resolved.
using AttributeValue = std::variant<nlohmann::json, Reference>;

/// Lifecycle flags declared on a node.
/// Class abbreviation: lp
struct LifecyclePolicy {
  bool bCreateBeforeDestroy = false;
};

/// Post-apply predicate a node must satisfy before dependents may proceed,
/// e.g. attribute "status" == "ISSUED" for a DNS-validated certificate.
/// Class abbreviation: wc
struct WaitCondition {
  std::string sName;
  std::string sAttribute;
  nlohmann::json jExpected;
  std::optional<std::chrono::seconds> oTimeout;  // overrides the executor default
};

/// Declared resource as produced by the configuration front end.
/// Class abbreviation: rn
struct ResourceNode {
  ResourceId riId;
  std::map<std::string, AttributeValue> mDesired;
  std::vector<std::string> vOutputs;  // output keys other nodes may reference
  LifecyclePolicy lpPolicy;
  std::vector<ResourceId> vDependsOn;
  std::optional<WaitCondition> oWait;
  std::optional<Attributes> oObserved;  // null until first read
};

enum class EdgeKind { Explicit, Reference };

/// Directed dependency edge: riFrom (producer) must converge before riTo (consumer).
/// Class abbreviation: ed
struct Edge {
  ResourceId riFrom;
  ResourceId riTo;
  EdgeKind kind = EdgeKind::Explicit;
};

/// Old instance of a node replaced with create_before_destroy, pending delete.
/// Class abbreviation: di
struct DeposedInstance {
  std::string sProviderId;
  Attributes mObserved;
};

/// Last-known state of one resource as owned by the state store.
/// Class abbreviation: sr
struct StateRecord {
  ResourceId riId;
  std::string sProviderId;
  Attributes mDesired;    // last-applied resolved desired attributes
  Attributes mObserved;   // provider-reported attributes and outputs
  std::vector<ResourceId> vDependencies;
  bool bTainted = false;  // exists remotely but never converged
  std::optional<DeposedInstance> oDeposed;
  int64_t iVersion = 0;
};

// ── Provider results ────────────────────────────────────────────────────

/// Result of a provider create/update/delete call.
/// Class abbreviation: prs
struct PushResult {
  bool bSuccess = false;
  bool bRetryable = false;
  std::string sProviderId;
  Attributes mObserved;
  std::string sErrorMessage;
};

/// Result of a provider read call. bFound is false when the resource is gone.
/// Class abbreviation: rr
struct ReadResult {
  bool bSuccess = false;
  bool bRetryable = false;
  bool bFound = false;
  Attributes mObserved;
  std::string sErrorMessage;
};

/// Result of one WaitCondition evaluation.
/// Class abbreviation: wr
struct WaitResult {
  bool bSuccess = false;
  bool bRetryable = false;
  bool bSatisfied = false;
  std::string sErrorMessage;
};

// ── Plan ────────────────────────────────────────────────────────────────

enum class ActionOp { Create, Update, Delete, Replace, NoOp };

/// Which instance of a node an action operates on.
enum class ActionTarget { Current, Deposed };

/// One unit of work in a plan.
/// op is the operation executed (never Replace); decision is the node-level
/// classification, so both halves of a replace carry decision = Replace.
/// Class abbreviation: act
struct Action {
  ResourceId riNode;
  ActionOp op = ActionOp::NoOp;
  ActionOp decision = ActionOp::NoOp;
  ActionTarget target = ActionTarget::Current;
  std::string sReason;
};

/// Ordered batch-list of actions.
/// vWaves holds indices into vActions; vPredecessors[i] lists the actions
/// that must be terminal-success before vActions[i] may be dispatched.
/// Class abbreviation: pl
struct Plan {
  std::vector<Action> vActions;
  std::vector<std::vector<size_t>> vWaves;
  std::vector<std::vector<size_t>> vPredecessors;

  /// Wave index of an action.
  size_t waveOf(size_t uAction) const;

  /// Indices of all actions for a node, in execution order.
  std::vector<size_t> actionsFor(const ResourceId& riNode) const;

  /// True when every action is a no-op.
  bool isNoOp() const;

  /// Count of actions per executed op.
  std::map<ActionOp, int> summary() const;

  nlohmann::json toJson() const;
};

// ── Run report ──────────────────────────────────────────────────────────

enum class NodeStatus { Applied, NoOp, Failed, Blocked };

/// Final outcome for one node.
/// Class abbreviation: re
struct ReportEntry {
  ResourceId riNode;
  ActionOp op = ActionOp::NoOp;
  NodeStatus status = NodeStatus::NoOp;
  std::string sErrorCode;
  std::string sError;
};

/// Structured result of an apply run.
/// Class abbreviation: rpt
struct RunReport {
  std::vector<ReportEntry> vEntries;
  bool bSuccess = false;
  bool bCancelled = false;
  std::chrono::system_clock::time_point tpStarted;
  std::chrono::system_clock::time_point tpFinished;

  /// Entry for a node, or nullptr.
  const ReportEntry* find(const ResourceId& riNode) const;

  nlohmann::json toJson() const;
};

std::string toString(ActionOp op);
std::string toString(NodeStatus status);

// ── JSON conversions (nlohmann ADL) ─────────────────────────────────────

void to_json(nlohmann::json& j, const ResourceId& ri);
void from_json(const nlohmann::json& j, ResourceId& ri);
void to_json(nlohmann::json& j, const DeposedInstance& di);
void from_json(const nlohmann::json& j, DeposedInstance& di);
void to_json(nlohmann::json& j, const StateRecord& sr);
void from_json(const nlohmann::json& j, StateRecord& sr);

}  // namespace recon::common
