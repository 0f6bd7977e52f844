#pragma once

/**
 * @file ConfigManager.h
 * @brief HybridLink 설정 관리자
 *
 * - key=value 형식의 .env 파일 로드 (주석, 따옴표 지원)
 * - 파일에 없는 키는 환경변수에서 조회
 * - 설정 디렉토리 자동 탐색 (HYBRIDLINK_CONFIG → ./config → ../config)
 */

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @class ConfigManager
 * @brief 전역 설정 싱글톤
 */
class ConfigManager {
public:
  // ==========================================================================
  // 전역 싱글톤 패턴
  // ==========================================================================

  static ConfigManager &getInstance() {
    static ConfigManager instance;
    instance.ensureInitialized();
    return instance;
  }

  bool isInitialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  // ==========================================================================
  // 읽기 인터페이스
  // ==========================================================================

  void reload();
  bool load(const std::string &filepath) { return loadConfigFile(filepath); }
  std::string get(const std::string &key) const;
  std::string getOrDefault(const std::string &key,
                           const std::string &defaultValue) const;
  void set(const std::string &key, const std::string &value);
  bool hasKey(const std::string &key) const;
  std::map<std::string, std::string> listAll() const;
  void clear();

  // 경로 관련
  std::string getConfigDirectory() const { return configDir_; }
  std::vector<std::string> getLoadedFiles() const;
  std::vector<std::string> getSearchLog() const;

  // 편의 기능들
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;

private:
  ConfigManager();
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  void ensureInitialized();
  bool doInitialize();
  std::string findConfigDirectory();
  bool loadConfigFile(const std::string &filepath);
  void parseLine(const std::string &line);

  std::map<std::string, std::string> configMap;
  mutable std::mutex configMutex;
  std::string configDir_;
  std::vector<std::string> loadedFiles_;
  std::vector<std::string> searchLog_;

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;
};
