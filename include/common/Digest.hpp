#pragma once

#include <cstdint>
#include <string>

namespace recon::common {

/// SHA-256 helpers backed by OpenSSL EVP.
/// Class abbreviation: N/A (static interface)
class Digest {
 public:
  /// SHA-256 hash → 64-char lowercase hex string.
  static std::string sha256Hex(const std::string& sInput);

  /// First 8 bytes of SHA-256(sInput) as a signed 64-bit integer (big-endian).
  /// Used as the PostgreSQL advisory lock key for a workspace.
  static int64_t sha256Key(const std::string& sInput);

 private:
  static std::string sha256Raw(const std::string& sInput);
};

}  // namespace recon::common
