#ifndef HYBRIDLINK_LOG_MANAGER_H
#define HYBRIDLINK_LOG_MANAGER_H

/**
 * @file LogManager.h
 * @brief HybridLink 통합 로그 관리자 - LogLib 기반 Delegation Wrapper
 * @details
 * 실제 로깅 로직(파일 관리, 로테이션 등)은 독립 라이브러리인
 * LogLib::LoggerEngine 이 수행한다. 이 클래스는 HybridLink 타입(카테고리,
 * 데이터 품질)을 LoggerEngine 호출로 옮겨 주는 역할만 한다.
 */

#include "Common/BasicTypes.h"
#include "Common/Enums.h"

// LogLib (독립 라이브러리)
#include "LoggerEngine.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

// 전역 네임스페이스 타입 별칭
using LogLevel = HybridLink::Enums::LogLevel;
using LogCategory = HybridLink::Enums::LogCategory;
using DataQuality = HybridLink::Enums::DataQuality;

/**
 * @brief HybridLink 전용 로그 관리자 (Wrapper)
 */
class LogManager {
public:
  static LogManager &getInstance() {
    static LogManager instance;
    instance.ensureInitialized();
    return instance;
  }

  bool isInitialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  // =============================================================================
  // 기본 로그 메소드들
  // =============================================================================
  void Info(const std::string &message);
  void Warn(const std::string &message);
  void Error(const std::string &message);
  void Fatal(const std::string &message);
  void Debug(const std::string &message);
  void Trace(const std::string &message);

  // 포맷 문자열 지원 템플릿 ("{}" 치환)
  template <typename... Args>
  void Info(const std::string &format, Args &&...args) {
    Info(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Warn(const std::string &format, Args &&...args) {
    Warn(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Error(const std::string &format, Args &&...args) {
    Error(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Fatal(const std::string &format, Args &&...args) {
    Fatal(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Debug(const std::string &format, Args &&...args) {
    Debug(formatString(format, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void Trace(const std::string &format, Args &&...args) {
    Trace(formatString(format, std::forward<Args>(args)...));
  }

  // 확장 로그 메소드들
  void log(const std::string &category, LogLevel level,
           const std::string &message);
  void log(LogCategory category, LogLevel level, const std::string &message);

  /**
   * @brief 카테고리별 레벨 필터를 거친 모듈 로그
   */
  template <typename... Args>
  void logModule(LogCategory category, LogLevel level,
                 const std::string &format, Args &&...args) {
    if (!isCategoryEnabled(category, level))
      return;
    log(category, level, formatString(format, std::forward<Args>(args)...));
  }

  void logDataQuality(const std::string &device_id,
                      const std::string &capability, DataQuality quality,
                      const std::string &reason = "");
  void logFrame(const std::string &device_id,
                const HybridLink::BasicTypes::ByteBuffer &frame,
                const std::string &decoded);

  // 설정 및 제어 (LoggerEngine으로 위임)
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void setCategoryLogLevel(LogCategory category, LogLevel level);
  LogLevel getCategoryLogLevel(LogCategory category) const;
  bool isCategoryEnabled(LogCategory category, LogLevel level) const;

  void reloadSettings();
  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  void setLogBasePath(const std::string &path);

  LogLib::LogStatistics getStatistics() const;
  void resetStatistics();
  void flushAll();

private:
  LogManager();
  ~LogManager() = default;

  void ensureInitialized();
  bool doInitialize();
  void loadLogSettingsFromConfig();

  // 포맷팅 지원
  template <typename... Args>
  std::string formatString(const std::string &format, Args &&...args) {
    std::stringstream ss;
    size_t pos = 0;
    formatRecursive(ss, format, pos, std::forward<Args>(args)...);
    return ss.str();
  }

  template <typename T>
  void formatHelper(std::stringstream &ss, const std::string &format,
                    size_t &pos, const T &value) {
    size_t placeholder = format.find("{}", pos);
    if (placeholder != std::string::npos) {
      ss << format.substr(pos, placeholder - pos) << value;
      pos = placeholder + 2;
    } else {
      ss << format.substr(pos);
      pos = format.size();
    }
  }
  void formatRecursive(std::stringstream &ss, const std::string &format,
                       size_t &pos) {
    if (pos < format.size())
      ss << format.substr(pos);
  }
  template <typename T, typename... Args>
  void formatRecursive(std::stringstream &ss, const std::string &format,
                       size_t &pos, const T &value, Args &&...args) {
    formatHelper(ss, format, pos, value);
    formatRecursive(ss, format, pos, std::forward<Args>(args)...);
  }

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;
  std::map<LogCategory, LogLevel> categoryLevels_;
};

// 전역 편의 함수들
inline LogManager &Logger() { return LogManager::getInstance(); }
inline void ReloadLogSettings() { LogManager::getInstance().reloadSettings(); }

#endif // HYBRIDLINK_LOG_MANAGER_H
