#include "state/StateStoreFactory.hpp"

#include "common/Errors.hpp"
#include "state/JsonFileStateStore.hpp"
#include "state/MemoryStateStore.hpp"

#include <gtest/gtest.h>

using namespace recon;
using recon::state::StateStoreFactory;

TEST(StateStoreFactoryTest, MemoryBackend) {
  common::Config cfg;
  cfg.sStateBackend = "memory";
  auto sb = StateStoreFactory::create(cfg);
  EXPECT_EQ(sb.upPool.get(), nullptr);
  EXPECT_NE(dynamic_cast<state::MemoryStateStore*>(sb.upStore.get()), nullptr);
}

TEST(StateStoreFactoryTest, FileBackendUsesConfiguredPath) {
  common::Config cfg;
  cfg.sStateBackend = "file";
  cfg.sStatePath = "/tmp/recon-factory-test.json";
  auto sb = StateStoreFactory::create(cfg);
  auto* pFile = dynamic_cast<state::JsonFileStateStore*>(sb.upStore.get());
  ASSERT_NE(pFile, nullptr);
  EXPECT_EQ(pFile->path(), "/tmp/recon-factory-test.json");
}

TEST(StateStoreFactoryTest, PostgresWithoutUrlIsRejected) {
  common::Config cfg;
  cfg.sStateBackend = "postgres";
  EXPECT_THROW(StateStoreFactory::create(cfg), common::ValidationError);
}

TEST(StateStoreFactoryTest, UnknownBackendIsRejected) {
  common::Config cfg;
  cfg.sStateBackend = "etcd";
  try {
    StateStoreFactory::create(cfg);
    FAIL() << "expected ValidationError";
  } catch (const common::ValidationError& ex) {
    EXPECT_EQ(ex._sErrorCode, "unsupported_backend");
  }
}
