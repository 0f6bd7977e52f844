#ifndef LOGGER_ENGINE_HPP
#define LOGGER_ENGINE_HPP

#include "LogExport.hpp"
#include "LogTypes.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace LogLib {

/**
 * @brief Core logging engine: level filter, console/file sinks, rotation.
 * @details Project-agnostic. Categories map to one file per day under the
 * base path; frame dumps ("frame_<device>") go to a separate frames/ tree so
 * hex traffic does not drown the diagnostic logs.
 */
class HYBRIDLINK_LOG_API LoggerEngine {
public:
  static LoggerEngine &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabled(LogLevel level) const;

  void setLogBasePath(const std::string &path);
  std::string getLogBasePath() const;

  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  bool isFileOutputEnabled() const;

  void setMaxLogSizeMB(size_t size_mb);
  void setMaxLogFiles(int count);

  void log(const std::string &category, LogLevel level,
           const std::string &message);

  /**
   * @brief Dump one wire frame with its decoded interpretation.
   * @param device device id, used as the file name
   * @param hexDump frame bytes rendered as hex
   * @param decoded human-readable decode summary
   */
  void logFrame(const std::string &device, const std::string &hexDump,
                const std::string &decoded);

  void flushAll();
  void rotateLogs();
  LogStatistics getStatistics() const;
  void resetStatistics();

  // KEY=VALUE loader (LOG_LEVEL, LOG_FILE_PATH, LOG_TO_CONSOLE, ...)
  bool loadFromConfigFile(const std::string &path);
  void applyConfig(const std::string &key, const std::string &value);

  static LogLevel stringToLogLevel(const std::string &level);

private:
  LoggerEngine();
  ~LoggerEngine();

  LoggerEngine(const LoggerEngine &) = delete;
  LoggerEngine &operator=(const LoggerEngine &) = delete;

  std::filesystem::path buildLogFilePath(const std::string &category) const;
  void emit(const std::string &category, const std::string &message);
  void writeToFile(const std::filesystem::path &filePath,
                   const std::string &message);
  void rotateIfNeeded(const std::filesystem::path &filePath,
                      std::ofstream &stream);
  void pruneBackups(const std::filesystem::path &filePath);
  void updateStatistics(LogLevel level);

  static std::string trim(const std::string &s);
  static std::string currentDate();
  static std::string currentTimestamp();

  mutable std::recursive_mutex mutex_;
  std::map<std::string, std::ofstream> logFiles_;

  LogLevel minLevel_;
  std::string log_base_path_;
  bool console_output_enabled_;
  bool file_output_enabled_;
  size_t max_log_size_mb_;
  int max_log_files_;

  LogStatistics statistics_;
};

} // namespace LogLib

#endif // LOGGER_ENGINE_HPP
