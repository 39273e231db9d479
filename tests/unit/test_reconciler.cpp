#include "core/Reconciler.hpp"

#include "common/Errors.hpp"
#include "state/JsonFileStateStore.hpp"
#include "state/MemoryStateStore.hpp"
#include "../support/Declarations.hpp"
#include "../support/FakeProvider.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <memory>

using namespace recon;
using namespace std::chrono_literals;
using common::ActionOp;
using common::NodeStatus;
using recon::core::Reconciler;
using recon::core::RunOptions;
using recon::test::FakeProvider;
using recon::test::node;
using recon::test::ref;
using recon::test::rid;

class ReconcilerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* pType : {"bucket", "policy", "cert", "cdn", "dns"}) {
      auto spProvider = std::make_shared<FakeProvider>(
          pType, std::string(pType) == "cert" ? std::set<std::string>{"domain"}
                                              : std::set<std::string>{});
      _mProviders[pType] = spProvider;
      _preg.add(spProvider);
    }
    _mProviders["cert"]->setPollsToConverge(2);

    _ao.iParallelism = 4;
    _ao.durRetryBackoff = 1ms;
    _ao.durWaitInitialBackoff = 1ms;
    _ao.durWaitMaxBackoff = 2ms;
    _ro.sOwner = "test@unit";
  }

  /// Static website: bucket + policy, certificate awaiting issuance,
  /// CDN in front of the bucket, DNS record pointing at the CDN.
  std::vector<common::ResourceNode> website() {
    auto rnBucket = node("bucket", "site");
    rnBucket.mDesired["acl"] = test::lit("private");

    auto rnPolicy = node("policy", "site");
    rnPolicy.mDesired["bucket_arn"] = ref("bucket", "site", "arn");
    rnPolicy.mDesired["effect"] = test::lit("Allow");

    auto rnCert = node("cert", "site");
    rnCert.mDesired["domain"] = test::lit("www.example.com");
    common::WaitCondition wc;
    wc.sName = "certificate_issued";
    wc.sAttribute = "status";
    wc.jExpected = "ISSUED";
    rnCert.oWait = wc;

    auto rnCdn = node("cdn", "site");
    rnCdn.mDesired["origin"] = ref("bucket", "site", "id");
    rnCdn.mDesired["certificate_arn"] = ref("cert", "site", "arn");
    rnCdn.vDependsOn.push_back(rid("policy", "site"));

    auto rnDns = node("dns", "www");
    rnDns.mDesired["target"] = ref("cdn", "site", "id");
    return {rnBucket, rnPolicy, rnCert, rnCdn, rnDns};
  }

  int totalCalls() const {
    int iTotal = 0;
    for (const auto& [sType, spProvider] : _mProviders) {
      iTotal += static_cast<int>(spProvider->calls().size());
    }
    return iTotal;
  }

  void resetCalls() {
    for (auto& [sType, spProvider] : _mProviders) spProvider->resetCalls();
  }

  std::map<std::string, std::shared_ptr<FakeProvider>> _mProviders;
  providers::ProviderRegistry _preg;
  state::MemoryStateStore _mss;
  core::ApplyOptions _ao;
  RunOptions _ro;
};

TEST_F(ReconcilerTest, FirstRunCreatesWebsite) {
  Reconciler rec(_preg, _mss, _ao);
  auto rpt = rec.run(website(), _ro);

  ASSERT_TRUE(rpt.bSuccess);
  ASSERT_EQ(rpt.vEntries.size(), 5u);
  for (const auto& re : rpt.vEntries) {
    EXPECT_EQ(re.status, NodeStatus::Applied) << re.riNode.toString();
  }
  EXPECT_EQ(_mProviders["cert"]->count("wait"), 2);

  // The lock is released and the store closed
  EXPECT_FALSE(_mss.lockOwner().has_value());
  EXPECT_THROW(_mss.list(), common::StateStoreError);
}

TEST_F(ReconcilerTest, SecondRunIsNoOpWithoutProviderCalls) {
  Reconciler rec(_preg, _mss, _ao);
  ASSERT_TRUE(rec.run(website(), _ro).bSuccess);
  resetCalls();

  auto rpt = rec.run(website(), _ro);
  ASSERT_TRUE(rpt.bSuccess);
  for (const auto& re : rpt.vEntries) {
    EXPECT_EQ(re.status, NodeStatus::NoOp) << re.riNode.toString();
    EXPECT_EQ(re.op, ActionOp::NoOp);
  }
  EXPECT_EQ(totalCalls(), 0);
}

TEST_F(ReconcilerTest, CertificateDomainChangeReplacesDownstream) {
  Reconciler rec(_preg, _mss, _ao);
  ASSERT_TRUE(rec.run(website(), _ro).bSuccess);
  resetCalls();

  auto vNodes = website();
  vNodes[2].mDesired["domain"] = test::lit("static.example.com");
  auto rpt = rec.run(vNodes, _ro);

  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("cert", "site"))->op, ActionOp::Replace);
  EXPECT_EQ(rpt.find(rid("cdn", "site"))->op, ActionOp::Update);
  EXPECT_EQ(rpt.find(rid("bucket", "site"))->op, ActionOp::NoOp);
  EXPECT_EQ(rpt.find(rid("dns", "www"))->op, ActionOp::NoOp);
  EXPECT_EQ(_mProviders["bucket"]->mutations(), 0);
  EXPECT_EQ(_mProviders["cert"]->count("delete"), 1);
  EXPECT_EQ(_mProviders["cert"]->count("create"), 1);
}

TEST_F(ReconcilerTest, LockContentionAbortsWithoutSideEffects) {
  _mss.lock("ci@build-7");
  Reconciler rec(_preg, _mss, _ao);
  try {
    rec.run(website(), _ro);
    FAIL() << "expected LockContentionError";
  } catch (const common::LockContentionError& ex) {
    EXPECT_EQ(ex._sHolder, "ci@build-7");
  }
  EXPECT_EQ(_mss.lockOwner(), "ci@build-7");
  EXPECT_EQ(totalCalls(), 0);
}

TEST_F(ReconcilerTest, CycleAbortsBeforeLocking) {
  auto vNodes = website();
  vNodes[0].vDependsOn.push_back(rid("dns", "www"));
  Reconciler rec(_preg, _mss, _ao);
  EXPECT_THROW(rec.run(vNodes, _ro), common::CycleError);
  EXPECT_FALSE(_mss.lockOwner().has_value());
  EXPECT_EQ(totalCalls(), 0);
}

TEST_F(ReconcilerTest, PlanOnlyRunTouchesNothing) {
  _ro.bPlanOnly = true;
  Reconciler rec(_preg, _mss, _ao);
  auto rpt = rec.run(website(), _ro);

  ASSERT_EQ(rpt.vEntries.size(), 5u);
  EXPECT_EQ(rpt.vEntries[0].op, ActionOp::Create);
  EXPECT_EQ(totalCalls(), 0);

  _mss.open();
  EXPECT_TRUE(_mss.list().empty());
}

TEST_F(ReconcilerTest, PreviewMatchesWhatRunWouldDo) {
  Reconciler rec(_preg, _mss, _ao);
  auto pl = rec.preview(website());
  EXPECT_EQ(pl.summary()[ActionOp::Create], 5);
  EXPECT_EQ(pl.vWaves.size(), 4u);
  EXPECT_EQ(totalCalls(), 0);
}

TEST_F(ReconcilerTest, RefreshRepairsDrift) {
  Reconciler rec(_preg, _mss, _ao);
  ASSERT_TRUE(rec.run(website(), _ro).bSuccess);

  _mss.open();
  const std::string sBucketId = _mss.get(rid("bucket", "site"))->sProviderId;
  _mss.close();
  _mProviders["bucket"]->drift(sBucketId, "acl", "public-read");
  resetCalls();

  // Without refresh the drift goes unnoticed
  EXPECT_EQ(rec.run(website(), _ro).find(rid("bucket", "site"))->op, ActionOp::NoOp);

  _ro.bRefresh = true;
  auto rpt = rec.run(website(), _ro);
  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("bucket", "site"))->op, ActionOp::Update);
  EXPECT_EQ(_mProviders["bucket"]->count("update"), 1);
  EXPECT_EQ(_mProviders["bucket"]->count("read"), 1);
}

TEST_F(ReconcilerTest, RefreshRecreatesVanishedResource) {
  Reconciler rec(_preg, _mss, _ao);
  ASSERT_TRUE(rec.run(website(), _ro).bSuccess);

  _mss.open();
  const std::string sDnsId = _mss.get(rid("dns", "www"))->sProviderId;
  _mss.close();
  _mProviders["dns"]->vanish(sDnsId);

  _ro.bRefresh = true;
  auto rpt = rec.run(website(), _ro);
  ASSERT_TRUE(rpt.bSuccess);
  EXPECT_EQ(rpt.find(rid("dns", "www"))->op, ActionOp::Create);
  EXPECT_EQ(_mProviders["dns"]->remoteCount(), 1u);
}

TEST_F(ReconcilerTest, FileBackedStateSurvivesAcrossRuns) {
  const auto pDir = std::filesystem::temp_directory_path() /
                    ("recon_reconciler_test_" + std::to_string(::getpid()));
  std::filesystem::create_directories(pDir);
  const std::string sPath = (pDir / "recon.state.json").string();

  {
    state::JsonFileStateStore jfs(sPath);
    Reconciler rec(_preg, jfs, _ao);
    ASSERT_TRUE(rec.run(website(), _ro).bSuccess);
  }
  resetCalls();
  {
    state::JsonFileStateStore jfs(sPath);
    Reconciler rec(_preg, jfs, _ao);
    auto rpt = rec.run(website(), _ro);
    ASSERT_TRUE(rpt.bSuccess);
    for (const auto& re : rpt.vEntries) {
      EXPECT_EQ(re.status, NodeStatus::NoOp);
    }
  }
  EXPECT_EQ(totalCalls(), 0);
  EXPECT_FALSE(std::filesystem::exists(sPath + ".lock"));

  std::error_code ec;
  std::filesystem::remove_all(pDir, ec);
}

TEST_F(ReconcilerTest, ReportSerializesToJson) {
  _mProviders["policy"]->failFor("create", "site");
  Reconciler rec(_preg, _mss, _ao);
  auto rpt = rec.run(website(), _ro);
  EXPECT_FALSE(rpt.bSuccess);

  auto j = rpt.toJson();
  bool bSawFailure = false;
  for (const auto& jEntry : j["resources"]) {
    if (jEntry["node"] == "policy.site") {
      EXPECT_EQ(jEntry["status"], "failed");
      EXPECT_EQ(jEntry["error_code"], "provider_error");
      bSawFailure = true;
    }
    if (jEntry["node"] == "dns.www") {
      EXPECT_EQ(jEntry["status"], "blocked");
    }
  }
  EXPECT_TRUE(bSawFailure);
}
