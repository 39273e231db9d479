#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using recon::dal::ConnectionGuard;
using recon::dal::ConnectionPool;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("RECON_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

}  // namespace

class ConnectionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "RECON_DB_URL not set, skipping integration test";
    }
    recon::common::Logger::init("warn");
  }

  std::string _sDbUrl;
};

TEST_F(ConnectionPoolTest, CreatesPoolOfRequestedSize) {
  const int iPoolSize = 3;
  ConnectionPool cpPool(_sDbUrl, iPoolSize);
  EXPECT_EQ(cpPool.size(), iPoolSize);
  EXPECT_EQ(cpPool.available(), iPoolSize);
}

TEST_F(ConnectionPoolTest, ConnectionGuardRaiiReturnsOnScopeExit) {
  ConnectionPool cpPool(_sDbUrl, 2);

  {
    auto cg1 = cpPool.checkout();
    auto cg2 = cpPool.checkout();
    EXPECT_EQ(cpPool.available(), 0);

    pqxx::nontransaction ntx(*cg1);
    auto result = ntx.exec("SELECT 1 AS val");
    EXPECT_EQ(result.one_row()[0].as<int>(), 1);
  }
  EXPECT_EQ(cpPool.available(), 2);
}

TEST_F(ConnectionPoolTest, ExhaustedPoolTimesOut) {
  ConnectionPool cpPool(_sDbUrl, 1, std::chrono::milliseconds(50));
  auto cg = cpPool.checkout();
  try {
    cpPool.checkout();
    FAIL() << "expected StateStoreError";
  } catch (const recon::common::StateStoreError& ex) {
    EXPECT_EQ(ex._sErrorCode, "pool_exhausted");
  }
}

TEST_F(ConnectionPoolTest, ConcurrentCheckoutsFromMultipleThreads) {
  const int iPoolSize = 4;
  const int iThreadCount = 8;
  ConnectionPool cpPool(_sDbUrl, iPoolSize);

  std::vector<std::thread> vThreads;
  std::atomic<int> iSuccessCount{0};

  for (int i = 0; i < iThreadCount; ++i) {
    vThreads.emplace_back([&cpPool, &iSuccessCount]() {
      try {
        auto cgConn = cpPool.checkout();
        pqxx::nontransaction ntx(*cgConn);
        auto result = ntx.exec("SELECT 1 AS val");
        if (result.one_row()[0].as<int>() == 1) {
          iSuccessCount.fetch_add(1);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } catch (const std::exception& ex) {
        ADD_FAILURE() << "checkout failed: " << ex.what();
      }
    });
  }

  for (auto& t : vThreads) {
    t.join();
  }

  EXPECT_EQ(iSuccessCount.load(), iThreadCount);
}

TEST_F(ConnectionPoolTest, RejectsNonPositiveSize) {
  EXPECT_THROW(ConnectionPool(_sDbUrl, 0), recon::common::ValidationError);
}

TEST_F(ConnectionPoolTest, DiscardedConnectionDropsSessionLocks) {
  ConnectionPool cpPool(_sDbUrl, 1);
  const int64_t iKey = 7351001;
  {
    auto cg = cpPool.checkout();
    {
      pqxx::nontransaction ntx(*cg);
      ASSERT_TRUE(ntx.exec("SELECT pg_try_advisory_lock($1)", pqxx::params{iKey})
                      .one_row()[0]
                      .as<bool>());
    }
    cg.discard();
  }
  EXPECT_EQ(cpPool.available(), 1);

  // The slot reconnects on checkout and the lock went with the old session
  ConnectionPool cpOther(_sDbUrl, 1);
  auto cgOther = cpOther.checkout();
  pqxx::nontransaction ntxOther(*cgOther);
  EXPECT_TRUE(ntxOther.exec("SELECT pg_try_advisory_lock($1)", pqxx::params{iKey})
                  .one_row()[0]
                  .as<bool>());
  ntxOther.exec("SELECT pg_advisory_unlock($1)", pqxx::params{iKey});

  auto cg = cpPool.checkout();
  EXPECT_TRUE(cg->is_open());
}
