#include "Utils/ConfigManager.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {
const char *kMainConfigFile = "hybridlink.env";
}

ConfigManager::ConfigManager() : initialized_(false) {}

// =============================================================================
// 초기화 관련
// =============================================================================

void ConfigManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }

  static thread_local bool in_config_init = false;
  if (in_config_init) {
    return; // 현재 스레드에서 이미 초기화 중이면 재진입 방지
  }

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }

  in_config_init = true;
  doInitialize();
  in_config_init = false;

  initialized_.store(true, std::memory_order_release);
}

bool ConfigManager::doInitialize() {
  configDir_ = findConfigDirectory();
  if (configDir_.empty()) {
    // 설정 디렉토리 없음 - 환경변수만 사용
    return false;
  }

  fs::path main_env = fs::path(configDir_) / kMainConfigFile;
  std::error_code ec;
  if (fs::exists(main_env, ec)) {
    loadConfigFile(main_env.string());
  } else {
    searchLog_.push_back(std::string("메인 설정 파일 없음: ") +
                         kMainConfigFile);
  }
  return true;
}

void ConfigManager::reload() {
  {
    std::lock_guard<std::mutex> lock(configMutex);
    configMap.clear();
    loadedFiles_.clear();
    searchLog_.clear();
  }

  initialized_.store(false);
  doInitialize();
  initialized_.store(true);

  LogManager::getInstance().log("config", LogLevel::INFO,
                                "ConfigManager 재로딩 완료 (" +
                                    std::to_string(listAll().size()) +
                                    "개 설정)");
}

std::string ConfigManager::findConfigDirectory() {
  searchLog_.clear();
  std::error_code ec;

  const char *env_config = std::getenv("HYBRIDLINK_CONFIG");
  if (env_config && fs::is_directory(env_config, ec)) {
    searchLog_.push_back("환경변수: " + std::string(env_config));
    return std::string(env_config);
  }

  const std::vector<std::string> search_paths = {"./config", "../config",
                                                 "../../config"};
  for (const auto &path : search_paths) {
    if (fs::is_directory(path, ec)) {
      fs::path absolute = fs::absolute(path, ec);
      std::string found = ec ? path : absolute.lexically_normal().string();
      searchLog_.push_back("발견: " + path + " -> " + found);
      return found;
    }
    searchLog_.push_back("없음: " + path);
  }

  searchLog_.push_back("설정 디렉토리를 찾을 수 없음");
  return "";
}

bool ConfigManager::loadConfigFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    searchLog_.push_back("파일 열기 실패: " + filepath);
    return false;
  }

  std::string line;
  int line_count = 0;
  {
    std::lock_guard<std::mutex> lock(configMutex);
    while (std::getline(file, line)) {
      line_count++;
      parseLine(line);
    }
    loadedFiles_.push_back(filepath);
  }

  searchLog_.push_back(fs::path(filepath).filename().string() + " - " +
                       std::to_string(line_count) + " 라인 읽음");
  return true;
}

void ConfigManager::parseLine(const std::string &raw) {
  std::string line = raw;
  line.erase(0, line.find_first_not_of(" \t\r\n"));
  if (line.empty() || line[0] == '#') {
    return;
  }

  size_t pos = line.find('=');
  if (pos == std::string::npos) {
    return;
  }

  std::string key = line.substr(0, pos);
  std::string value = line.substr(pos + 1);

  key.erase(key.find_last_not_of(" \t\r\n") + 1);
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  value.erase(value.find_last_not_of(" \t\r\n") + 1);

  if (value.length() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.length() - 2);
  } else {
    // 따옴표 밖의 행 끝 주석 제거
    size_t hash = value.find(" #");
    if (hash != std::string::npos) {
      value.erase(hash);
      value.erase(value.find_last_not_of(" \t") + 1);
    }
  }

  if (!key.empty()) {
    configMap[key] = value;
  }
}

// =============================================================================
// 읽기 인터페이스
// =============================================================================

std::string ConfigManager::get(const std::string &key) const {
  // 1. 메모리 설정 확인 (파일 로드 또는 set)
  {
    std::lock_guard<std::mutex> lock(configMutex);
    auto it = configMap.find(key);
    if (it != configMap.end() && !it->second.empty()) {
      return it->second;
    }
  }

  // 2. 환경변수 확인
  const char *env_val = std::getenv(key.c_str());
  if (env_val) {
    return std::string(env_val);
  }

  return "";
}

std::string ConfigManager::getOrDefault(const std::string &key,
                                        const std::string &defaultValue) const {
  std::string value = get(key);
  if (!value.empty()) {
    return value;
  }
  return defaultValue;
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap[key] = value;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap.find(key) != configMap.end();
}

std::map<std::string, std::string> ConfigManager::listAll() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap;
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap.clear();
  loadedFiles_.clear();
}

std::vector<std::string> ConfigManager::getLoadedFiles() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return loadedFiles_;
}

std::vector<std::string> ConfigManager::getSearchLog() const {
  return searchLog_;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stoi(value);
  } catch (const std::exception &e) {
    LogManager::getInstance().log("config", LogLevel::WARN,
                                  "정수 설정 파싱 실패: " + key + "=" + value +
                                      " (" + e.what() + ")");
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;

  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return (value == "true" || value == "yes" || value == "1" || value == "on");
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stod(value);
  } catch (const std::exception &e) {
    LogManager::getInstance().log("config", LogLevel::WARN,
                                  "실수 설정 파싱 실패: " + key + "=" + value +
                                      " (" + e.what() + ")");
    return defaultValue;
  }
}
