#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "state/MemoryStateStore.hpp"

namespace recon::state {

/// Local-file state store.
/// The whole record set is kept in memory and rewritten atomically
/// (temp file + rename) after every mutation. The document carries a
/// SHA-256 checksum of its resources array, verified on open().
/// The advisory lock is a sibling "<path>.lock" file created exclusively.
/// Class abbreviation: jfs
class JsonFileStateStore : public MemoryStateStore {
 public:
  static constexpr int kFormatVersion = 1;

  explicit JsonFileStateStore(std::string sPath);
  ~JsonFileStateStore() override;

  /// Load the state file if it exists. Throws StateStoreError on a bad
  /// format version or checksum mismatch.
  void open() override;
  void close() override;

  void lock(const std::string& sOwner) override;
  void unlock() override;

 protected:
  void onMutated() override;

 private:
  nlohmann::json serialize() const;
  void writeFile(const nlohmann::json& jDoc) const;

  std::string _sPath;
  std::string _sLockPath;
  bool _bHoldsLock = false;
  int64_t _iSerial = 0;
};

}  // namespace recon::state
