#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace sectorcast {

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "trace")
    out = LogLevel::TRACE;
  else if (s == "debug")
    out = LogLevel::DEBUG;
  else if (s == "info")
    out = LogLevel::INFO;
  else if (s == "warn")
    out = LogLevel::WARN;
  else if (s == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mtx_);
  level_ = lvl;
}

LogLevel Logger::level() {
  std::lock_guard<std::mutex> lk(mtx_);
  return level_;
}

void Logger::set_output(std::FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out_ = out;
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
  std::lock_guard<std::mutex> lk(mtx_);
  if (lvl < level_)
    return;
  std::FILE *out = out_ ? out_ : stderr;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(out, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
}

} // namespace sectorcast
