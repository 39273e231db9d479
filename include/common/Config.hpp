#pragma once

#include <optional>
#include <string>

namespace recon::common {

/// Environment variable loader for engine settings.
/// Loads all RECON_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Executor ──────────────────────────────────────────────────────────
  int iParallelism = 10;
  int iMaxAttempts = 3;
  int iRetryBackoffMs = 1000;

  // ── WaitCondition polling ─────────────────────────────────────────────
  int iWaitTimeoutSeconds = 1800;
  int iWaitInitialBackoffMs = 500;
  int iWaitMaxBackoffMs = 30000;

  // ── State store ───────────────────────────────────────────────────────
  std::string sStateBackend = "file";  // memory | file | postgres
  std::string sStatePath = "recon.state.json";
  std::optional<std::string> oDbUrl;   // required when backend = postgres
  int iDbPoolSize = 4;
  std::string sWorkspace = "default";
  std::string sLockOwner;              // defaults to recon@<pid>

  // ── Run ───────────────────────────────────────────────────────────────
  bool bRefresh = false;

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for RECON_DB_URL.
  /// Throws on invalid values or missing backend-specific settings.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// Returns nullopt when neither varName nor varName_FILE is set.
  static std::optional<std::string> loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0/yes), default when unset.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace recon::common
