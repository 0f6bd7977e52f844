#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <algorithm>
#include <iostream>

// HybridLink 레벨을 LogLib 레벨로 변환
static LogLib::LogLevel MapToLogLibLevel(HybridLink::Enums::LogLevel level) {
  switch (level) {
  case HybridLink::Enums::LogLevel::TRACE:
    return LogLib::LogLevel::TRACE;
  case HybridLink::Enums::LogLevel::DEBUG:
    return LogLib::LogLevel::DEBUG;
  case HybridLink::Enums::LogLevel::INFO:
    return LogLib::LogLevel::INFO;
  case HybridLink::Enums::LogLevel::WARN:
    return LogLib::LogLevel::WARN;
  case HybridLink::Enums::LogLevel::LOG_ERROR:
    return LogLib::LogLevel::LOG_ERROR;
  case HybridLink::Enums::LogLevel::LOG_FATAL:
    return LogLib::LogLevel::LOG_FATAL;
  case HybridLink::Enums::LogLevel::OFF:
    return LogLib::LogLevel::OFF;
  default:
    return LogLib::LogLevel::INFO;
  }
}

LogManager::LogManager() : initialized_(false) {}

void LogManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire))
    return;

  static thread_local bool in_log_init = false;
  if (in_log_init)
    return; // 재진입 방지 (ConfigManager 초기화 중 로그)

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed))
    return;

  in_log_init = true;
  doInitialize();
  in_log_init = false;

  initialized_.store(true, std::memory_order_release);
}

bool LogManager::doInitialize() {
  loadLogSettingsFromConfig();
  return true;
}

void LogManager::loadLogSettingsFromConfig() {
  auto &config = ConfigManager::getInstance();
  auto &engine = LogLib::LoggerEngine::getInstance();

  // LoggerEngine 이 키별로 값을 검증하고 잘못된 값은 무시한다
  static const char *kKeys[] = {"LOG_LEVEL",       "LOG_FILE_PATH",
                                "LOG_TO_CONSOLE",  "LOG_TO_FILE",
                                "LOG_MAX_SIZE_MB", "LOG_MAX_FILES"};
  for (const char *key : kKeys) {
    std::string value = config.get(key);
    if (!value.empty()) {
      engine.applyConfig(key, value);
    }
  }
}

void LogManager::Info(const std::string &message) {
  log("", LogLevel::INFO, message);
}
void LogManager::Warn(const std::string &message) {
  log("", LogLevel::WARN, message);
}
void LogManager::Error(const std::string &message) {
  log("", LogLevel::LOG_ERROR, message);
}
void LogManager::Fatal(const std::string &message) {
  log("", LogLevel::LOG_FATAL, message);
}
void LogManager::Debug(const std::string &message) {
  log("", LogLevel::DEBUG, message);
}
void LogManager::Trace(const std::string &message) {
  log("", LogLevel::TRACE, message);
}

void LogManager::log(const std::string &category, LogLevel level,
                     const std::string &message) {
  LogLib::LoggerEngine::getInstance().log(category, MapToLogLibLevel(level),
                                          message);
}

void LogManager::log(LogCategory category, LogLevel level,
                     const std::string &message) {
  log(HybridLink::Enums::LogCategoryToString(category), level, message);
}

void LogManager::logDataQuality(const std::string &device_id,
                                const std::string &capability,
                                DataQuality quality,
                                const std::string &reason) {
  if (quality == DataQuality::GOOD)
    return;
  std::ostringstream oss;
  oss << "DATA QUALITY ISSUE - Device: " << device_id
      << ", Capability: " << capability
      << ", Quality: " << HybridLink::Enums::DataQualityToString(quality)
      << ", Reason: " << reason;
  log(LogCategory::DATA_QUALITY,
      (quality == DataQuality::QUARANTINED ? LogLevel::LOG_ERROR
                                           : LogLevel::WARN),
      oss.str());
}

void LogManager::logFrame(const std::string &device_id,
                          const HybridLink::BasicTypes::ByteBuffer &frame,
                          const std::string &decoded) {
  LogLib::LoggerEngine::getInstance().logFrame(
      device_id, HybridLink::BasicTypes::BytesToHex(frame), decoded);
}

void LogManager::setLogLevel(LogLevel level) {
  LogLib::LoggerEngine::getInstance().setLogLevel(MapToLogLibLevel(level));
}
LogLevel LogManager::getLogLevel() const {
  // 두 열거형의 값이 동일하다
  return static_cast<LogLevel>(
      LogLib::LoggerEngine::getInstance().getLogLevel());
}

void LogManager::setCategoryLogLevel(LogCategory category, LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  categoryLevels_[category] = level;
}

LogLevel LogManager::getCategoryLogLevel(LogCategory category) const {
  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  auto it = categoryLevels_.find(category);
  return (it != categoryLevels_.end()) ? it->second : LogLevel::TRACE;
}

bool LogManager::isCategoryEnabled(LogCategory category,
                                   LogLevel level) const {
  LogLevel catLevel = getCategoryLogLevel(category);
  if (catLevel == LogLevel::OFF)
    return false;
  if (static_cast<int>(level) < static_cast<int>(catLevel))
    return false;
  return LogLib::LoggerEngine::getInstance().isEnabled(
      MapToLogLibLevel(level));
}

void LogManager::reloadSettings() { loadLogSettingsFromConfig(); }
void LogManager::setConsoleOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setConsoleOutput(enabled);
}
void LogManager::setFileOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setFileOutput(enabled);
}
void LogManager::setLogBasePath(const std::string &path) {
  LogLib::LoggerEngine::getInstance().setLogBasePath(path);
}

LogLib::LogStatistics LogManager::getStatistics() const {
  return LogLib::LoggerEngine::getInstance().getStatistics();
}

void LogManager::resetStatistics() {
  LogLib::LoggerEngine::getInstance().resetStatistics();
}
void LogManager::flushAll() { LogLib::LoggerEngine::getInstance().flushAll(); }
