#pragma once
#ifndef INGESTVAULT_LOGGER_H
#define INGESTVAULT_LOGGER_H
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace ingestvault {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide diagnostic logger writing one JSON object per line.
 *
 * Rotates the file by size. This is operator diagnostics only; the audit
 * ledger is the evidence record.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const { return currentLogLevel; }

  void log(LogLevel level, const std::string &message);

  /**
   * @brief Log with structured context.
   *
   * @param fields JSON object emitted under "fields" (e.g. source path,
   *               destination, status).
   */
  void log(LogLevel level, const std::string &message,
           const nlohmann::json &fields);

  static std::string levelToString(LogLevel level);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  void write(const std::string &jsonLine);
  void rotateIfNeeded();
  static std::string getTimestamp();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace ingestvault

#endif // INGESTVAULT_LOGGER_H
