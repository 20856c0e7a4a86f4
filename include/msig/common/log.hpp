#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace msig {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kOff = 4,
};

// Process-wide sink. Lines go to stderr and, when configured, to a file.
class Logger {
 public:
  static Logger& Instance();

  void SetLevel(LogLevel level);
  LogLevel level() const;
  bool Enabled(LogLevel level) const;

  void SetStderrEnabled(bool enabled);
  void OpenFile(const std::string& path);
  void CloseFile();

  void Write(LogLevel level, const std::string& message);

 private:
  Logger() = default;

  mutable std::mutex mu_;
  LogLevel level_ = LogLevel::kInfo;
  bool stderr_enabled_ = true;
  std::ofstream file_;
};

// Collects one line and hands it to the Logger on destruction.
class LogLine {
 public:
  explicit LogLine(LogLevel level);
  ~LogLine();

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& value) {
    stream_ << value;
    return *this;
  }

 private:
  LogLevel level_;
  std::ostringstream stream_;
};

}  // namespace msig

#define MSIG_LOG(level)                                   \
  if (!::msig::Logger::Instance().Enabled(level)) {       \
  } else                                                  \
    ::msig::LogLine(level)

#define LOGDEBUG MSIG_LOG(::msig::LogLevel::kDebug)
#define LOGINFO MSIG_LOG(::msig::LogLevel::kInfo)
#define LOGWARN MSIG_LOG(::msig::LogLevel::kWarn)
#define LOGERR MSIG_LOG(::msig::LogLevel::kError)
