#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace arbor {

namespace {

std::atomic<int> g_threshold{static_cast<int>(LogLevel::INFO)};
std::mutex g_write_mu;

constexpr const char* kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

const char* level_name(LogLevel lvl) noexcept {
  const int i = static_cast<int>(lvl);
  return (i >= 0 && i <= 3) ? kLevelNames[i] : "INFO";
}

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const auto ca = std::tolower(static_cast<unsigned char>(a[i]));
    const auto cb = std::tolower(static_cast<unsigned char>(b[i]));
    if (ca != cb) return false;
  }
  return true;
}

// 2026-01-31T08:15:02.417Z
std::string utc_stamp_ms() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

}  // namespace

void set_log_level(LogLevel lvl) noexcept { g_threshold.store(static_cast<int>(lvl)); }

LogLevel get_log_level() noexcept { return static_cast<LogLevel>(g_threshold.load()); }

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  for (int i = 0; i <= 3; ++i) {
    if (iequals(s, kLevelNames[i])) return static_cast<LogLevel>(i);
  }
  if (iequals(s, "warning")) return LogLevel::WARN;
  return std::nullopt;
}

void init_log_level_from_env() noexcept {
  const char* env = std::getenv("ARBOR_LOG_LEVEL");
  if (env == nullptr || *env == '\0') return;
  if (const auto lvl = parse_log_level(env)) set_log_level(*lvl);
}

bool log_enabled(LogLevel lvl) noexcept { return static_cast<int>(lvl) >= g_threshold.load(); }

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (!log_enabled(lvl)) return;
  try {
    std::ostringstream line;
    line << utc_stamp_ms() << ' ' << std::left << std::setw(5) << level_name(lvl) << " arbor: " << msg << '\n';

    const std::lock_guard<std::mutex> lock(g_write_mu);
    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << line.str() << std::flush;
  } catch (const std::exception&) {
    // dropped
  }
}

}  // namespace arbor
