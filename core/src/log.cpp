#include "mfg/log.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mfg::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "mfg";
Level g_console_level = Level::Info;

std::tm local_now() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

std::string format_now(const char* fmt) {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
  }
  return "INFO";
}

void log_line(Level level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line =
      "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + level_name(level) + "] " + std::string(msg);
  if (level >= g_console_level) {
    auto& stream = level >= Level::Warn ? std::cerr : std::cout;
    stream << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init() {
  init("mfg", std::filesystem::path());
}

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    if (!log_dir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(log_dir, ec);
      const std::string file_name = g_app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
      g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
    }
  }
  log_line(Level::Info, "log init: " + app_name);
#ifdef MFG_DEBUG
  log_line(Level::Info, "build: debug");
#else
  log_line(Level::Info, "build: release");
#endif
}

void shutdown() {
  log_line(Level::Info, "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_console_level(Level level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_console_level = level;
}

void debug(std::string_view msg) {
  log_line(Level::Debug, msg);
}

void info(std::string_view msg) {
  log_line(Level::Info, msg);
}

void warn(std::string_view msg) {
  log_line(Level::Warn, msg);
}

void error(std::string_view msg) {
  log_line(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

void clear_recent() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_ring.clear();
}

} // namespace mfg::log
