#include "msig/common/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace msig {
namespace {

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kOff:
      break;
  }
  return "-";
}

std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis;
  return out.str();
}

}  // namespace

Logger& Logger::Instance() {
  static Logger logger;
  return logger;
}

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mu_);
  level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mu_);
  return level_;
}

bool Logger::Enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mu_);
  return level != LogLevel::kOff && level >= level_;
}

void Logger::SetStderrEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mu_);
  stderr_enabled_ = enabled;
}

void Logger::OpenFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mu_);
  if (file_.is_open()) {
    file_.close();
  }
  file_.open(path, std::ios::out | std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + path);
  }
}

void Logger::CloseFile() {
  std::lock_guard<std::mutex> lock(mu_);
  if (file_.is_open()) {
    file_.close();
  }
}

void Logger::Write(LogLevel level, const std::string& message) {
  const std::string line = Timestamp() + " [" + LevelTag(level) + "] " + message + '\n';

  std::lock_guard<std::mutex> lock(mu_);
  if (stderr_enabled_) {
    std::cerr << line;
  }
  if (file_.is_open()) {
    file_ << line;
    file_.flush();
  }
}

LogLine::LogLine(LogLevel level) : level_(level) {}

LogLine::~LogLine() {
  Logger::Instance().Write(level_, stream_.str());
}

}  // namespace msig
