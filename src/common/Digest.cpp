#include "common/Digest.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace recon::common {

std::string Digest::sha256Raw(const std::string& sInput) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sInput.data(), sInput.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);
  return std::string(reinterpret_cast<const char*>(vHash), uHashLen);
}

std::string Digest::sha256Hex(const std::string& sInput) {
  const std::string sRaw = sha256Raw(sInput);

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char c : sRaw) {
    oss << std::setw(2) << static_cast<int>(c);
  }
  return oss.str();
}

int64_t Digest::sha256Key(const std::string& sInput) {
  const std::string sRaw = sha256Raw(sInput);

  uint64_t uKey = 0;
  for (size_t i = 0; i < 8; ++i) {
    uKey = (uKey << 8) | static_cast<unsigned char>(sRaw[i]);
  }
  return static_cast<int64_t>(uKey);
}

}  // namespace recon::common
