#include "common/Config.hpp"

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace recon::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t uPos = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &uPos);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (uPos != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::optional<std::string> Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Logging ────────────────────────────────────────────────────────────
  const std::string sLogLevel = getEnv("RECON_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Executor ───────────────────────────────────────────────────────────
  cfg.iParallelism = getEnvInt("RECON_PARALLELISM", 10);
  cfg.iMaxAttempts = getEnvInt("RECON_MAX_ATTEMPTS", 3);
  cfg.iRetryBackoffMs = getEnvInt("RECON_RETRY_BACKOFF_MS", 1000);

  // ── WaitCondition polling ──────────────────────────────────────────────
  cfg.iWaitTimeoutSeconds = getEnvInt("RECON_WAIT_TIMEOUT_SECONDS", 1800);
  cfg.iWaitInitialBackoffMs = getEnvInt("RECON_WAIT_INITIAL_BACKOFF_MS", 500);
  cfg.iWaitMaxBackoffMs = getEnvInt("RECON_WAIT_MAX_BACKOFF_MS", 30000);

  // ── State store ────────────────────────────────────────────────────────
  const std::string sBackend = getEnv("RECON_STATE_BACKEND");
  if (!sBackend.empty()) {
    cfg.sStateBackend = sBackend;
  }
  const std::string sStatePath = getEnv("RECON_STATE_PATH");
  if (!sStatePath.empty()) {
    cfg.sStatePath = sStatePath;
  }
  cfg.oDbUrl = loadSecret("RECON_DB_URL");
  cfg.iDbPoolSize = getEnvInt("RECON_DB_POOL_SIZE", 4);
  const std::string sWorkspace = getEnv("RECON_WORKSPACE");
  if (!sWorkspace.empty()) {
    cfg.sWorkspace = sWorkspace;
  }
  cfg.sLockOwner = getEnv("RECON_LOCK_OWNER");
  if (cfg.sLockOwner.empty()) {
    cfg.sLockOwner = "recon@" + std::to_string(::getpid());
  }

  // ── Run ────────────────────────────────────────────────────────────────
  cfg.bRefresh = getEnvBool("RECON_REFRESH", false);

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iParallelism < 1) {
    throw std::runtime_error(
        "RECON_PARALLELISM must be >= 1 (got " + std::to_string(cfg.iParallelism) + ")");
  }

  if (cfg.iMaxAttempts < 1) {
    throw std::runtime_error(
        "RECON_MAX_ATTEMPTS must be >= 1 (got " + std::to_string(cfg.iMaxAttempts) + ")");
  }

  if (cfg.iRetryBackoffMs < 0 || cfg.iWaitInitialBackoffMs < 0 || cfg.iWaitTimeoutSeconds < 0) {
    throw std::runtime_error("Backoff and timeout settings must not be negative");
  }

  // RECON_WAIT_MAX_BACKOFF_MS >= RECON_WAIT_INITIAL_BACKOFF_MS
  if (cfg.iWaitMaxBackoffMs < cfg.iWaitInitialBackoffMs) {
    throw std::runtime_error(
        "RECON_WAIT_MAX_BACKOFF_MS (" + std::to_string(cfg.iWaitMaxBackoffMs) +
        ") must be >= RECON_WAIT_INITIAL_BACKOFF_MS (" +
        std::to_string(cfg.iWaitInitialBackoffMs) + ")");
  }

  if (cfg.sStateBackend != "memory" && cfg.sStateBackend != "file" &&
      cfg.sStateBackend != "postgres") {
    throw std::runtime_error("Unsupported RECON_STATE_BACKEND: " + cfg.sStateBackend +
                             " (expected memory, file or postgres)");
  }

  if (cfg.sStateBackend == "postgres") {
    if (!cfg.oDbUrl.has_value()) {
      throw std::runtime_error(
          "RECON_DB_URL (or RECON_DB_URL_FILE) is required when RECON_STATE_BACKEND=postgres");
    }
    if (cfg.iDbPoolSize < 2) {
      // One connection is pinned by the advisory lock for the whole run
      throw std::runtime_error(
          "RECON_DB_POOL_SIZE must be >= 2 (got " + std::to_string(cfg.iDbPoolSize) + ")");
    }
  }

  return cfg;
}

}  // namespace recon::common
