#include "LoggerEngine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace LogLib {

namespace fs = std::filesystem;

LoggerEngine::LoggerEngine()
    : minLevel_(LogLevel::INFO), log_base_path_("./logs/"),
      console_output_enabled_(true), file_output_enabled_(false),
      max_log_size_mb_(10), max_log_files_(5) {}

LoggerEngine::~LoggerEngine() { flushAll(); }

LoggerEngine &LoggerEngine::getInstance() {
  static LoggerEngine instance;
  return instance;
}

void LoggerEngine::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  minLevel_ = level;
}

LogLevel LoggerEngine::getLogLevel() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return minLevel_;
}

bool LoggerEngine::isEnabled(LogLevel level) const {
  LogLevel current = getLogLevel();
  if (current == LogLevel::OFF)
    return false;
  return static_cast<int>(level) >= static_cast<int>(current);
}

void LoggerEngine::setLogBasePath(const std::string &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  // 열린 파일은 이전 경로 기준이므로 모두 닫는다
  flushAll();
  log_base_path_ = path;
  if (!log_base_path_.empty() && log_base_path_.back() != '/' &&
      log_base_path_.back() != '\\') {
    log_base_path_ += fs::path::preferred_separator;
  }
}

std::string LoggerEngine::getLogBasePath() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return log_base_path_;
}

void LoggerEngine::setConsoleOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  console_output_enabled_ = enabled;
}

void LoggerEngine::setFileOutput(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  file_output_enabled_ = enabled;
  if (!enabled)
    flushAll();
}

bool LoggerEngine::isFileOutputEnabled() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return file_output_enabled_;
}

void LoggerEngine::setMaxLogSizeMB(size_t size_mb) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_size_mb_ = size_mb == 0 ? 1 : size_mb;
}

void LoggerEngine::setMaxLogFiles(int count) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  max_log_files_ = count < 1 ? 1 : count;
}

void LoggerEngine::log(const std::string &category, LogLevel level,
                       const std::string &message) {
  if (!isEnabled(level))
    return;

  updateStatistics(level);

  std::ostringstream oss;
  oss << "[" << currentTimestamp() << "]"
      << "[" << LogLevelToString(level) << "]";
  if (!category.empty()) {
    oss << "[" << category << "]";
  }
  oss << " " << message;

  emit(category.empty() ? std::string("general") : category, oss.str());
}

void LoggerEngine::logFrame(const std::string &device,
                            const std::string &hexDump,
                            const std::string &decoded) {
  if (!isEnabled(LogLevel::DEBUG))
    return;

  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    statistics_.frame_dump_count++;
  }

  std::ostringstream oss;
  oss << "[" << currentTimestamp() << "][FRAME][" << device << "]\n"
      << "  [RAW] " << hexDump << "\n"
      << "  [DECODED] " << decoded;

  emit("frame_" + device, oss.str());
}

void LoggerEngine::emit(const std::string &category,
                        const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (console_output_enabled_) {
    std::cout << message << std::endl;
  }

  if (file_output_enabled_) {
    try {
      fs::path path = buildLogFilePath(category);
      fs::create_directories(path.parent_path());
      writeToFile(path, message);
    } catch (const fs::filesystem_error &e) {
      if (console_output_enabled_) {
        std::cerr << "[LoggerEngine] file sink error: " << e.what()
                  << std::endl;
      }
    }
  }
}

void LoggerEngine::flushAll() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (auto &kv : logFiles_) {
    if (kv.second.is_open()) {
      kv.second.flush();
      kv.second.close();
    }
  }
  logFiles_.clear();
}

void LoggerEngine::rotateLogs() { flushAll(); }

LogStatistics LoggerEngine::getStatistics() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return statistics_;
}

void LoggerEngine::resetStatistics() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  statistics_ = LogStatistics{};
}

bool LoggerEngine::loadFromConfigFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    return false;

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    size_t sep = line.find('=');
    if (sep != std::string::npos) {
      applyConfig(trim(line.substr(0, sep)), trim(line.substr(sep + 1)));
    }
  }
  return true;
}

void LoggerEngine::applyConfig(const std::string &key,
                               const std::string &value) {
  try {
    if (key == "LOG_LEVEL") {
      setLogLevel(stringToLogLevel(value));
    } else if (key == "LOG_FILE_PATH") {
      setLogBasePath(value);
    } else if (key == "LOG_TO_CONSOLE") {
      setConsoleOutput(value == "true" || value == "1");
    } else if (key == "LOG_TO_FILE") {
      setFileOutput(value == "true" || value == "1");
    } else if (key == "LOG_MAX_SIZE_MB") {
      setMaxLogSizeMB(static_cast<size_t>(std::stoul(value)));
    } else if (key == "LOG_MAX_FILES") {
      setMaxLogFiles(std::stoi(value));
    }
  } catch (const std::exception &e) {
    std::cerr << "[LoggerEngine] invalid value for " << key << ": " << value
              << " (" << e.what() << ")" << std::endl;
  }
}

LogLevel LoggerEngine::stringToLogLevel(const std::string &level) {
  std::string s = level;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (s == "TRACE")
    return LogLevel::TRACE;
  if (s == "DEBUG")
    return LogLevel::DEBUG;
  if (s == "INFO")
    return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING")
    return LogLevel::WARN;
  if (s == "ERROR")
    return LogLevel::LOG_ERROR;
  if (s == "FATAL")
    return LogLevel::LOG_FATAL;
  if (s == "OFF")
    return LogLevel::OFF;
  return LogLevel::INFO;
}

fs::path LoggerEngine::buildLogFilePath(const std::string &category) const {
  fs::path base(log_base_path_);
  std::string date = currentDate();

  if (category.rfind("frame_", 0) == 0) {
    std::string name = category.substr(6);
    std::replace(name.begin(), name.end(), '/', '_');
    std::replace(name.begin(), name.end(), ':', '_');
    return base / "frames" / date / (name + ".log");
  }
  return base / date / (category + ".log");
}

void LoggerEngine::writeToFile(const fs::path &filePath,
                               const std::string &message) {
  std::ofstream &stream = logFiles_[filePath.string()];
  if (!stream.is_open()) {
    stream.open(filePath, std::ios::app);
  }
  if (stream.is_open()) {
    stream << message << '\n';
    stream.flush();
    rotateIfNeeded(filePath, stream);
  }
}

void LoggerEngine::rotateIfNeeded(const fs::path &filePath,
                                  std::ofstream &stream) {
  auto pos = stream.tellp();
  if (pos <= 0)
    return;

  size_t size_mb = static_cast<size_t>(pos) / (1024 * 1024);
  if (size_mb < max_log_size_mb_)
    return;

  stream.close();

  std::string stamp = currentTimestamp();
  std::replace(stamp.begin(), stamp.end(), ':', '-');
  std::replace(stamp.begin(), stamp.end(), ' ', '_');
  fs::path backup = filePath.parent_path() /
                    (filePath.stem().string() + "_" + stamp +
                     filePath.extension().string());

  std::error_code ec;
  fs::rename(filePath, backup, ec);
  if (ec && console_output_enabled_) {
    std::cerr << "[LoggerEngine] rotate failed: " << ec.message()
              << std::endl;
  }
  pruneBackups(filePath);

  stream.open(filePath, std::ios::app);
}

void LoggerEngine::pruneBackups(const fs::path &filePath) {
  std::error_code ec;
  std::vector<fs::directory_entry> backups;
  std::string prefix = filePath.stem().string() + "_";

  for (const auto &entry : fs::directory_iterator(filePath.parent_path(), ec)) {
    if (!entry.is_regular_file())
      continue;
    if (entry.path().filename().string().rfind(prefix, 0) == 0)
      backups.push_back(entry);
  }

  if (static_cast<int>(backups.size()) <= max_log_files_)
    return;

  std::sort(backups.begin(), backups.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.last_write_time() < b.last_write_time();
            });

  size_t excess = backups.size() - static_cast<size_t>(max_log_files_);
  for (size_t i = 0; i < excess; ++i) {
    fs::remove(backups[i].path(), ec);
  }
}

void LoggerEngine::updateStatistics(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  switch (level) {
  case LogLevel::TRACE:
    statistics_.trace_count++;
    break;
  case LogLevel::DEBUG:
    statistics_.debug_count++;
    break;
  case LogLevel::INFO:
    statistics_.info_count++;
    break;
  case LogLevel::WARN:
    statistics_.warn_count++;
    break;
  case LogLevel::LOG_ERROR:
    statistics_.error_count++;
    break;
  case LogLevel::LOG_FATAL:
    statistics_.fatal_count++;
    break;
  default:
    break;
  }

  statistics_.total_logs++;
  statistics_.last_log_time = std::chrono::system_clock::now();
}

std::string LoggerEngine::trim(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n\"");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t\r\n\"");
  return s.substr(first, last - first + 1);
}

std::string LoggerEngine::currentDate() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y%m%d");
  return oss.str();
}

std::string LoggerEngine::currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

} // namespace LogLib
