#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::thread::id thread_id;
};

// Process-wide asynchronous logger. Calls before Initialize() are dropped.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  bool echo_stderr_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void Stop();
  void WriteLogEntry(const LogEntry&);
  std::string FormatLogEntry(const LogEntry&);
  static std::string LevelToString(LogLevel);
public:
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool echo_stderr = false);
  static void Shutdown();
  // "debug", "info", "warning", "error", "critical"; unknown names map to INFO
  static LogLevel ParseLevel(const std::string& name);
  static void Log(LogLevel level, const std::string& message);
  static void Debug(const std::string& m);
  static void Info(const std::string& m);
  static void Warning(const std::string& m);
  static void Error(const std::string& m);
  static void Critical(const std::string& m);
  ~Logger();
};
