#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "utils/parse.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <limits>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  size_t start = 0, end = input.size();
  while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return input.substr(start, end - start);
}

static inline std::string StripQuotes(const std::string& v) {
  if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')))
    return v.substr(1, v.size() - 2);
  return v;
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Warning(".env file not found: " + env_path);
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = StripQuotes(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  return std::nullopt;
}

std::string ConfigManager::GetOrThrow(const std::string& key) {
  auto v = Get(key);
  if (!v) throw std::runtime_error("Missing required config: " + key);
  return *v;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  long long v = GetInt64Or(key, default_value);
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    Logger::Warning("Config " + key + " is out of range, using default");
    return default_value;
  }
  return static_cast<int>(v);
}

long long ConfigManager::GetInt64Or(const std::string& key, long long default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  long long out = 0;
  if (ParseInt64(*v, out)) return out;
  Logger::Warning("Config " + key + "='" + *v + "' is not an integer, using default");
  return default_value;
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  return default_value;
}
