#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace recon::common {

namespace {
std::mutex gMtxInit;
}  // namespace

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  std::lock_guard<std::mutex> lock(gMtxInit);
  auto level = spdlog::level::from_str(sLevel);

  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(level);
    spdlog::default_logger()->set_level(level);
    return;
  }

  auto spLogger = spdlog::get("recon");
  if (!spLogger) {
    spLogger = spdlog::stdout_color_mt("recon");
  }
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace recon::common
