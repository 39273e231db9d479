#include "state/StateStoreFactory.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/StateRepository.hpp"
#include "state/JsonFileStateStore.hpp"
#include "state/MemoryStateStore.hpp"

namespace recon::state {

StateBackend StateStoreFactory::create(const common::Config& cfg) {
  auto spLog = common::Logger::get();
  StateBackend sb;

  if (cfg.sStateBackend == "memory") {
    sb.upStore = std::make_unique<MemoryStateStore>();
  } else if (cfg.sStateBackend == "file") {
    sb.upStore = std::make_unique<JsonFileStateStore>(cfg.sStatePath);
  } else if (cfg.sStateBackend == "postgres") {
    if (!cfg.oDbUrl.has_value()) {
      throw common::ValidationError("missing_db_url",
                                    "RECON_DB_URL is required for the postgres state backend");
    }
    sb.upPool = std::make_unique<dal::ConnectionPool>(*cfg.oDbUrl, cfg.iDbPoolSize);
    sb.upStore = std::make_unique<dal::StateRepository>(*sb.upPool, cfg.sWorkspace);
  } else {
    throw common::ValidationError("unsupported_backend",
                                  "Unsupported state backend '" + cfg.sStateBackend + "'");
  }

  spLog->info("State backend: {} (workspace '{}')", cfg.sStateBackend, cfg.sWorkspace);
  return sb;
}

}  // namespace recon::state
