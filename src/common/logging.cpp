#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <functional>
#include <thread>

namespace piecemeal {

LogLevel parse_log_level(const std::string &name, LogLevel fallback) {
  std::string s(name);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (s == "trace")
    return LogLevel::TRACE;
  if (s == "debug")
    return LogLevel::DEBUG;
  if (s == "info")
    return LogLevel::INFO;
  if (s == "warn" || s == "warning")
    return LogLevel::WARN;
  if (s == "error")
    return LogLevel::ERROR;
  return fallback;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) { level_.store(lvl); }

void Logger::set_output(std::FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out_ = out ? out : stderr;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  auto tid = std::hash<std::thread::id>()(std::this_thread::get_id()) % 100000;

  std::lock_guard<std::mutex> lk(mtx_);
  std::fprintf(out_, "%s.%03d [%s] (%05zu) ", ts, (int)ms, level_str(lvl), tid);
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out_, fmt, ap);
  va_end(ap);
  std::fprintf(out_, "\n");
}

} // namespace piecemeal
