#include "core/Executor.hpp"

#include "core/GraphBuilder.hpp"
#include "core/Planner.hpp"
#include "state/MemoryStateStore.hpp"
#include "../support/Declarations.hpp"
#include "../support/FakeProvider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stop_token>

using namespace recon;
using namespace std::chrono_literals;
using common::ActionOp;
using common::NodeStatus;
using recon::core::ApplyOptions;
using recon::core::Executor;
using recon::test::FakeProvider;
using recon::test::node;
using recon::test::ref;
using recon::test::rid;

namespace {

common::WaitCondition readyCondition() {
  common::WaitCondition wc;
  wc.sName = "ready";
  wc.sAttribute = "status";
  wc.jExpected = "ready";
  return wc;
}

}  // namespace

class ExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _spSvc = std::make_shared<FakeProvider>("svc", std::set<std::string>{"region"});
    _preg.add(_spSvc);
    _mss.open();

    _ao.iParallelism = 4;
    _ao.iMaxAttempts = 3;
    _ao.durRetryBackoff = 1ms;
    _ao.durWaitInitialBackoff = 1ms;
    _ao.durWaitMaxBackoff = 4ms;
  }

  common::RunReport apply(std::vector<common::ResourceNode> vNodes,
                          std::stop_token stToken = {}) {
    auto gr = core::GraphBuilder().build(std::move(vNodes));
    auto pl = core::Planner(_preg).plan(gr, _mss.list());
    return Executor(_preg, _mss, _ao).apply(gr, pl, stToken);
  }

  /// a <- b <- c, and an unrelated d
  std::vector<common::ResourceNode> chain() {
    auto rnA = node("svc", "a");
    auto rnB = node("svc", "b");
    rnB.mDesired["upstream"] = ref("svc", "a", "id");
    auto rnC = node("svc", "c");
    rnC.mDesired["upstream"] = ref("svc", "b", "id");
    return {rnA, rnB, rnC, node("svc", "d")};
  }

  std::shared_ptr<FakeProvider> _spSvc;
  providers::ProviderRegistry _preg;
  state::MemoryStateStore _mss;
  ApplyOptions _ao;
};

TEST_F(ExecutorTest, CreatesAllAndRecordsResolvedReferences) {
  auto rpt = apply(chain());
  ASSERT_TRUE(rpt.bSuccess);
  ASSERT_EQ(rpt.vEntries.size(), 4u);
  for (const auto& re : rpt.vEntries) {
    EXPECT_EQ(re.status, NodeStatus::Applied);
    EXPECT_EQ(re.op, ActionOp::Create);
  }

  auto oA = _mss.get(rid("svc", "a"));
  auto oB = _mss.get(rid("svc", "b"));
  ASSERT_TRUE(oA && oB);
  EXPECT_EQ(oB->mDesired.at("upstream"), oA->sProviderId);
  EXPECT_EQ(oB->vDependencies, std::vector<common::ResourceId>{rid("svc", "a")});
  EXPECT_EQ(oB->iVersion, 1);
  EXPECT_FALSE(oB->bTainted);
}

TEST_F(ExecutorTest, FailureBlocksOnlyTransitiveDependents) {
  _spSvc->failFor("create", "b");
  auto rpt = apply(chain());

  EXPECT_FALSE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "a"))->status, NodeStatus::Applied);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->status, NodeStatus::Failed);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->sErrorCode, "provider_error");
  EXPECT_EQ(rpt.find(rid("svc", "c"))->status, NodeStatus::Blocked);
  EXPECT_EQ(rpt.find(rid("svc", "c"))->sErrorCode, "dependency_failed");
  EXPECT_EQ(rpt.find(rid("svc", "d"))->status, NodeStatus::Applied);

  // c never reached the provider: a, b (once, permanent) and d
  EXPECT_EQ(_spSvc->count("create"), 3);
  EXPECT_FALSE(_mss.get(rid("svc", "b")).has_value());
  EXPECT_FALSE(_mss.get(rid("svc", "c")).has_value());
}

TEST_F(ExecutorTest, RetryableFailureIsRetried) {
  _spSvc->failFor("create", "a", 2, true);
  auto rpt = apply({node("svc", "a")});
  EXPECT_TRUE(rpt.bSuccess);
  EXPECT_EQ(_spSvc->count("create"), 3);
}

TEST_F(ExecutorTest, RetriesStopAtMaxAttempts) {
  _spSvc->failFor("create", "a", -1, true);
  auto rpt = apply({node("svc", "a")});
  EXPECT_FALSE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "a"))->status, NodeStatus::Failed);
  EXPECT_EQ(_spSvc->count("create"), _ao.iMaxAttempts);
}

TEST_F(ExecutorTest, WaitConditionGatesDependents) {
  _spSvc->setPollsToConverge(3);
  auto rnCert = node("svc", "cert");
  rnCert.oWait = readyCondition();
  auto rnCdn = node("svc", "cdn");
  rnCdn.mDesired["cert"] = ref("svc", "cert", "arn");

  auto rpt = apply({rnCert, rnCdn});
  ASSERT_TRUE(rpt.bSuccess);

  auto vCalls = _spSvc->calls();
  ASSERT_EQ(vCalls.size(), 5u);
  EXPECT_EQ(vCalls[0].sOp, "create");
  EXPECT_EQ(vCalls[1].sOp, "wait");
  EXPECT_EQ(vCalls[2].sOp, "wait");
  EXPECT_EQ(vCalls[3].sOp, "wait");
  EXPECT_EQ(vCalls[4].sOp, "create");
}

TEST_F(ExecutorTest, WaitTimeoutTaintsNodeAndBlocksDependents) {
  _spSvc->setNeverConverge(true);
  auto rnCert = node("svc", "cert");
  rnCert.oWait = readyCondition();
  rnCert.oWait->oTimeout = 0s;
  auto rnCdn = node("svc", "cdn");
  rnCdn.mDesired["cert"] = ref("svc", "cert", "arn");

  auto rpt = apply({rnCert, rnCdn});
  EXPECT_FALSE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "cert"))->status, NodeStatus::Failed);
  EXPECT_EQ(rpt.find(rid("svc", "cert"))->sErrorCode, "wait_timeout");
  EXPECT_EQ(rpt.find(rid("svc", "cdn"))->status, NodeStatus::Blocked);

  // The resource exists remotely, so it is recorded, but as tainted
  auto oCert = _mss.get(rid("svc", "cert"));
  ASSERT_TRUE(oCert.has_value());
  EXPECT_TRUE(oCert->bTainted);
  EXPECT_TRUE(_spSvc->exists(oCert->sProviderId));

  // The next plan replaces it
  auto gr = core::GraphBuilder().build({rnCert, rnCdn});
  auto pl = core::Planner(_preg).plan(gr, _mss.list());
  auto vCert = pl.actionsFor(rid("svc", "cert"));
  ASSERT_FALSE(vCert.empty());
  EXPECT_EQ(pl.vActions[vCert.front()].decision, ActionOp::Replace);
}

TEST_F(ExecutorTest, CancelledRunDispatchesNothing) {
  std::stop_source ss;
  ss.request_stop();
  auto rpt = apply(chain(), ss.get_token());

  EXPECT_TRUE(rpt.bCancelled);
  EXPECT_FALSE(rpt.bSuccess);
  for (const auto& re : rpt.vEntries) {
    EXPECT_EQ(re.status, NodeStatus::Blocked);
    EXPECT_EQ(re.sErrorCode, "cancelled");
  }
  EXPECT_TRUE(_spSvc->calls().empty());
}

TEST_F(ExecutorTest, ParallelismBoundsConcurrentProviderCalls) {
  _ao.iParallelism = 2;
  _spSvc->setCallDelay(20ms);
  std::vector<common::ResourceNode> vNodes;
  for (int i = 0; i < 6; ++i) {
    vNodes.push_back(node("svc", "n" + std::to_string(i)));
  }

  auto rpt = apply(vNodes);
  EXPECT_TRUE(rpt.bSuccess);
  EXPECT_LE(_spSvc->maxConcurrent(), 2);
  EXPECT_EQ(_spSvc->count("create"), 6);
}

TEST_F(ExecutorTest, CreateBeforeDestroyRemovesOldInstanceLast) {
  auto vNodes = chain();
  vNodes[0].mDesired["region"] = test::lit("us-east-1");
  vNodes[0].lpPolicy.bCreateBeforeDestroy = true;
  ASSERT_TRUE(apply(vNodes).bSuccess);
  const std::string sOldId = _mss.get(rid("svc", "a"))->sProviderId;
  _spSvc->resetCalls();

  vNodes[0].mDesired["region"] = test::lit("eu-west-1");
  auto rpt = apply(vNodes);
  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "a"))->op, ActionOp::Replace);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->op, ActionOp::Update);

  auto oA = _mss.get(rid("svc", "a"));
  ASSERT_TRUE(oA.has_value());
  EXPECT_NE(oA->sProviderId, sOldId);
  EXPECT_FALSE(oA->oDeposed.has_value());
  EXPECT_FALSE(_spSvc->exists(sOldId));
  EXPECT_EQ(_mss.get(rid("svc", "b"))->mDesired.at("upstream"), oA->sProviderId);

  // create a, update b, then delete the old a
  auto vCalls = _spSvc->calls();
  ASSERT_EQ(vCalls.size(), 3u);
  EXPECT_EQ(vCalls[0].sOp, "create");
  EXPECT_EQ(vCalls[1].sOp, "update");
  EXPECT_EQ(vCalls[2].sOp, "delete");
  EXPECT_EQ(vCalls[2].sProviderId, sOldId);
}

TEST_F(ExecutorTest, FailedDeposedDeleteKeepsRecordForNextRun) {
  auto rnA = node("svc", "a");
  rnA.mDesired["region"] = test::lit("us-east-1");
  rnA.lpPolicy.bCreateBeforeDestroy = true;
  ASSERT_TRUE(apply({rnA}).bSuccess);
  const std::string sOldId = _mss.get(rid("svc", "a"))->sProviderId;

  _spSvc->failFor("delete", "a", 1);
  rnA.mDesired["region"] = test::lit("eu-west-1");
  auto rpt = apply({rnA});
  EXPECT_FALSE(rpt.bSuccess);

  auto oA = _mss.get(rid("svc", "a"));
  ASSERT_TRUE(oA.has_value() && oA->oDeposed.has_value());
  EXPECT_EQ(oA->oDeposed->sProviderId, sOldId);

  // The leftover delete runs on the next apply
  rpt = apply({rnA});
  EXPECT_TRUE(rpt.bSuccess);
  EXPECT_FALSE(_mss.get(rid("svc", "a"))->oDeposed.has_value());
  EXPECT_FALSE(_spSvc->exists(sOldId));
}

TEST_F(ExecutorTest, OrphanIsDeletedAndForgotten) {
  ASSERT_TRUE(apply(chain()).bSuccess);
  const std::string sDId = _mss.get(rid("svc", "d"))->sProviderId;

  auto vNodes = chain();
  vNodes.pop_back();
  auto rpt = apply(vNodes);
  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "d"))->op, ActionOp::Delete);
  EXPECT_FALSE(_mss.get(rid("svc", "d")).has_value());
  EXPECT_FALSE(_spSvc->exists(sDId));
}

TEST_F(ExecutorTest, NoOpConsumerIsUpdatedWhenUpstreamOutputChanges) {
  auto rnA = node("svc", "a", {"id", "size"});
  rnA.mDesired["size"] = test::lit(1);
  auto rnB = node("svc", "b");
  rnB.mDesired["capacity"] = ref("svc", "a", "size");
  ASSERT_TRUE(apply({rnA, rnB}).bSuccess);
  _spSvc->resetCalls();

  // b looks unchanged at plan time; a's update reports the new size
  rnA.mDesired["size"] = test::lit(2);
  auto rpt = apply({rnA, rnB});
  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->op, ActionOp::NoOp);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->status, NodeStatus::Applied);
  EXPECT_EQ(_spSvc->count("update"), 2);
  EXPECT_EQ(_mss.get(rid("svc", "b"))->mDesired.at("capacity"), 2);
}

TEST_F(ExecutorTest, ImmutableKeyFedByUpdatedProducerIsReplaced) {
  auto rnA = node("svc", "a", {"id", "size"});
  rnA.mDesired["size"] = test::lit(1);
  auto rnB = node("svc", "b");
  rnB.mDesired["region"] = ref("svc", "a", "size");
  ASSERT_TRUE(apply({rnA, rnB}).bSuccess);
  const std::string sOldB = _mss.get(rid("svc", "b"))->sProviderId;
  _spSvc->resetCalls();

  rnA.mDesired["size"] = test::lit(2);
  auto rpt = apply({rnA, rnB});
  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "a"))->op, ActionOp::Update);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->op, ActionOp::Replace);

  // Only a is updated in place; b is destroyed and recreated
  EXPECT_EQ(_spSvc->count("update"), 1);
  EXPECT_EQ(_spSvc->count("delete"), 1);
  EXPECT_EQ(_spSvc->count("create"), 1);
  EXPECT_FALSE(_spSvc->exists(sOldB));
  EXPECT_EQ(_mss.get(rid("svc", "b"))->mDesired.at("region"), 2);
}

TEST_F(ExecutorTest, PromotionNeverUpdatesImmutableAttributeInPlace) {
  auto rnA = node("svc", "a", {"id", "size"});
  rnA.mDesired["size"] = test::lit(1);
  auto rnB = node("svc", "b");
  rnB.mDesired["region"] = ref("svc", "a", "size");
  ASSERT_TRUE(apply({rnA, rnB}).bSuccess);
  _spSvc->resetCalls();

  auto gr = core::GraphBuilder().build({rnA, rnB});
  auto pl = core::Planner(_preg).plan(gr, _mss.list());
  ASSERT_TRUE(pl.isNoOp());

  // a's recorded output moves after planning
  _mss.update(rid("svc", "a"), [](std::optional<common::StateRecord>& oRecord) {
    oRecord->mObserved["size"] = 2;
  });
  auto rpt = Executor(_preg, _mss, _ao).apply(gr, pl);

  EXPECT_FALSE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->status, NodeStatus::Failed);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->sErrorCode, "replacement_required");
  EXPECT_EQ(_spSvc->mutations(), 0);
  EXPECT_EQ(_mss.get(rid("svc", "b"))->mDesired.at("region"), 1);
}

TEST_F(ExecutorTest, DestroyFirstReplacementsDeleteConsumerBeforeProducer) {
  auto rnA = node("svc", "a", {"id", "region"});
  rnA.mDesired["region"] = test::lit("us-east-1");
  auto rnB = node("svc", "b");
  rnB.mDesired["region"] = ref("svc", "a", "region");
  ASSERT_TRUE(apply({rnA, rnB}).bSuccess);
  const std::string sOldA = _mss.get(rid("svc", "a"))->sProviderId;
  const std::string sOldB = _mss.get(rid("svc", "b"))->sProviderId;
  _spSvc->resetCalls();

  rnA.mDesired["region"] = test::lit("eu-west-1");
  auto rpt = apply({rnA, rnB});
  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("svc", "a"))->op, ActionOp::Replace);
  EXPECT_EQ(rpt.find(rid("svc", "b"))->op, ActionOp::Replace);

  // delete b, delete a, create a, create b
  auto vCalls = _spSvc->calls();
  ASSERT_EQ(vCalls.size(), 4u);
  EXPECT_EQ(vCalls[0].sOp, "delete");
  EXPECT_EQ(vCalls[0].sProviderId, sOldB);
  EXPECT_EQ(vCalls[1].sOp, "delete");
  EXPECT_EQ(vCalls[1].sProviderId, sOldA);
  EXPECT_EQ(vCalls[2].sOp, "create");
  EXPECT_EQ(vCalls[3].sOp, "create");
  EXPECT_EQ(_mss.get(rid("svc", "b"))->mDesired.at("region"), "eu-west-1");
}
