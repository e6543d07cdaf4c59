#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// JSON-lines sink for transaction lifecycle events (tx_submitted, tx_receipt,
// tx_failed). Events logged before Initialize() are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Stamps "event", "ts_ms" and the context fields onto fields and enqueues the result
  void LogEvent(const std::string& event, nlohmann::json fields);
  // Fields copied into every later event (contract, runtime target, command).
  // An event's own fields win on key collisions.
  void SetContext(nlohmann::json context);
  // Graceful shutdown
  void Shutdown();
  void Initialize(const std::string& file_path);
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  void LogJsonLine(const std::string& json_line);
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
  nlohmann::json context_ = nlohmann::json::object();
};
