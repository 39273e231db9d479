#include "state/JsonFileStateStore.hpp"

#include "common/Digest.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace recon::state {

using common::StateRecord;

namespace fs = std::filesystem;

JsonFileStateStore::JsonFileStateStore(std::string sPath)
    : _sPath(std::move(sPath)), _sLockPath(_sPath + ".lock") {}

JsonFileStateStore::~JsonFileStateStore() {
  if (_bHoldsLock) {
    std::error_code ec;
    fs::remove(_sLockPath, ec);
  }
}

void JsonFileStateStore::open() {
  std::lock_guard<std::mutex> lock(_mtx);
  _mRecords.clear();
  _iSerial = 0;

  if (fs::exists(_sPath)) {
    std::ifstream ifs(_sPath);
    if (!ifs.is_open()) {
      throw common::StateStoreError("state_unreadable", "Cannot open state file: " + _sPath);
    }

    nlohmann::json jDoc;
    try {
      jDoc = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& ex) {
      throw common::StateStoreError("state_corrupt",
                                    "State file " + _sPath + " is not valid JSON: " + ex.what());
    }

    if (!jDoc.is_object()) {
      throw common::StateStoreError("state_corrupt",
                                    "State file " + _sPath + " is not a JSON object");
    }

    try {
      const int iFormat = jDoc.value("format_version", 0);
      if (iFormat != kFormatVersion) {
        throw common::StateStoreError(
            "state_format", "Unsupported state format version " + std::to_string(iFormat) +
                                " in " + _sPath);
      }

      const auto& jResources = jDoc.at("resources");
      const std::string sChecksum = common::Digest::sha256Hex(jResources.dump());
      if (sChecksum != jDoc.value("checksum", "")) {
        throw common::StateStoreError("state_corrupt",
                                      "State file " + _sPath + " failed checksum verification");
      }

      for (const auto& jRecord : jResources) {
        auto sr = jRecord.get<StateRecord>();
        _mRecords[sr.riId] = std::move(sr);
      }
      _iSerial = jDoc.value("serial", int64_t{0});
    } catch (const nlohmann::json::exception& ex) {
      throw common::StateStoreError("state_corrupt",
                                    "State file " + _sPath + " is malformed: " +
                                        ex.what());
    }
  }

  _bOpen = true;
  common::Logger::get()->debug("State file {} opened ({} records, serial {})", _sPath,
                               _mRecords.size(), _iSerial);
}

void JsonFileStateStore::close() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_bOpen) return;
  writeFile(serialize());
  _bOpen = false;
}

void JsonFileStateStore::onMutated() {
  ++_iSerial;
  writeFile(serialize());
}

nlohmann::json JsonFileStateStore::serialize() const {
  nlohmann::json jResources = nlohmann::json::array();
  for (const auto& [riId, sr] : _mRecords) {
    jResources.push_back(nlohmann::json(sr));
  }
  const std::string sChecksum = common::Digest::sha256Hex(jResources.dump());
  return nlohmann::json{
      {"format_version", kFormatVersion},
      {"serial", _iSerial},
      {"checksum", sChecksum},
      {"resources", std::move(jResources)},
  };
}

void JsonFileStateStore::writeFile(const nlohmann::json& jDoc) const {
  const std::string sTmpPath = _sPath + ".tmp";
  {
    std::ofstream ofs(sTmpPath, std::ios::trunc);
    if (!ofs.is_open()) {
      throw common::StateStoreError("state_write_failed",
                                    "Cannot write state file: " + sTmpPath);
    }
    ofs << jDoc.dump(2) << '\n';
    ofs.flush();
    if (!ofs) {
      throw common::StateStoreError("state_write_failed",
                                    "Short write to state file: " + sTmpPath);
    }
  }

  std::error_code ec;
  fs::rename(sTmpPath, _sPath, ec);
  if (ec) {
    throw common::StateStoreError("state_write_failed",
                                  "Cannot replace state file " + _sPath + ": " + ec.message());
  }
}

void JsonFileStateStore::lock(const std::string& sOwner) {
  std::lock_guard<std::mutex> lock(_mtx);

  const int iFd = ::open(_sLockPath.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
  if (iFd < 0) {
    if (errno != EEXIST) {
      throw common::StateStoreError("lock_failed", "Cannot create lock file " + _sLockPath +
                                                       ": " + std::strerror(errno));
    }

    std::string sHolder = "unknown";
    std::ifstream ifs(_sLockPath);
    if (ifs.is_open()) {
      try {
        sHolder = nlohmann::json::parse(ifs).value("owner", sHolder);
      } catch (const nlohmann::json::exception&) {
        // Half-written lock file; the holder stays unknown
      }
    }
    throw common::LockContentionError(
        sHolder, "State " + _sPath + " is locked by '" + sHolder + "'; refusing to start '" +
                     sOwner + "'");
  }

  const auto iNow = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
  const std::string sBody =
      nlohmann::json{{"owner", sOwner}, {"pid", ::getpid()}, {"acquired_at", iNow}}.dump();
  const ssize_t iWritten = ::write(iFd, sBody.data(), sBody.size());
  ::close(iFd);
  if (iWritten != static_cast<ssize_t>(sBody.size())) {
    std::error_code ec;
    fs::remove(_sLockPath, ec);
    throw common::StateStoreError("lock_failed", "Cannot write lock file " + _sLockPath);
  }

  _bHoldsLock = true;
  _oLockOwner = sOwner;
}

void JsonFileStateStore::unlock() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_bHoldsLock) return;

  std::error_code ec;
  fs::remove(_sLockPath, ec);
  _bHoldsLock = false;
  _oLockOwner.reset();
  if (ec) {
    throw common::StateStoreError("unlock_failed",
                                  "Cannot remove lock file " + _sLockPath + ": " + ec.message());
  }
}

}  // namespace recon::state
