#include "ingestvault/utilities/logger.h"
#include <chrono>
#include <cstdio> // For std::rename and std::remove
#include <ctime>
#include <iostream>

namespace ingestvault {

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
}

Logger &Logger::getInstance() {
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_instance)
      return *s_instance;
  }
  std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
               "Logger::init(). Falling back to console output."
            << std::endl;
  init(CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  std::lock_guard<std::mutex> lock(s_mutex);
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      // The logger cannot report on itself yet.
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  log(level, message, nlohmann::json());
}

void Logger::log(LogLevel level, const std::string &message,
                 const nlohmann::json &fields) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  nlohmann::json obj;
  obj["timestamp"] = getTimestamp();
  obj["level"] = levelToString(level);
  obj["message"] = message;
  if (fields.is_object() && !fields.empty()) {
    obj["fields"] = fields;
  }
  // Paths on removable media are not guaranteed to be valid UTF-8.
  write(obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void Logger::write(const std::string &jsonLine) {
  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }
  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0)
    return;
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize)
    return;

  logFileStream.close();
  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOldPath.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

std::string Logger::getTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t currentTime = std::chrono::system_clock::to_time_t(now);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}

} // namespace ingestvault
