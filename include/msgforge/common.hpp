#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace msgforge {

using json = nlohmann::json;
namespace fs = std::filesystem;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline bool starts_with(const std::string& s, const std::string& pfx) {
  return s.size() >= pfx.size() && s.compare(0, pfx.size(), pfx) == 0;
}

// Splits "a, b,,c" into {"a", "b", "c"}.
inline std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  std::istringstream in(s);
  while (std::getline(in, cur, ',')) {
    cur = trim(cur);
    if (!cur.empty()) {
      out.push_back(cur);
    }
  }
  return out;
}

inline std::size_t utf8_length(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) {
      ++n;
    }
  }
  return n;
}

inline std::string read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return "";
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool write_text_file(const fs::path& p, const std::string& content) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << content;
  return true;
}

inline std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

inline int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline std::string random_id(std::size_t n = 17) {
  static constexpr char alphabet[] = "23456789ABCDEFGHJKLMNPQRSTWXYZabcdefghijkmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> d(0, sizeof(alphabet) - 2);

  std::string out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(alphabet[d(rng)]);
  }
  return out;
}

// Leveled stderr logger. Plain lines look like
//   [WARN] Stage quote_links failed, skipping: timeout message=abc
// and JSON mode emits one object per line with the fields merged in.
class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level().store(static_cast<int>(level)); }

  // Accepts "debug", "info", "warn"/"warning", "error" in any case.
  static std::optional<Level> parse_level(const std::string& name) {
    const std::string n = to_lower(trim(name));
    if (n == "debug") {
      return Level::kDebug;
    }
    if (n == "info") {
      return Level::kInfo;
    }
    if (n == "warn" || n == "warning") {
      return Level::kWarn;
    }
    if (n == "error") {
      return Level::kError;
    }
    return std::nullopt;
  }

  static void log(Level level, const std::string& msg, const json& fields = json::object()) {
    if (static_cast<int>(level) < min_level().load()) {
      return;
    }
    std::string line;
    if (json_mode().load()) {
      json j = fields.is_object() ? fields : json::object();
      j["time"] = now_iso8601();
      j["level"] = level_name(level);
      j["msg"] = msg;
      line = j.dump();
    } else {
      line = std::string("[") + level_name(level) + "] " + msg;
      if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
          line += " " + it.key() + "=" + (it->is_string() ? it->get<std::string>() : it->dump());
        }
      }
    }
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << line << "\n";
  }

 private:
  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  // Validation checks log from worker threads.
  static std::atomic<int>& min_level() {
    static std::atomic<int> v{static_cast<int>(Level::kInfo)};
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kDebug:
        return "DEBUG";
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
      default:
        return "ERROR";
    }
  }
};

}  // namespace msgforge
