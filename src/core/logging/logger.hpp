#pragma once

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>

namespace jsoncheck::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

// `text` is key=value pairs on one line; `json` is one JSON object per line.
enum class LogFormat {
  kText,
  kJson,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline const char* ToString(LogFormat format) {
  switch (format) {
  case LogFormat::kText:
    return "text";
  case LogFormat::kJson:
    return "json";
  }

  return "text";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

namespace detail {

inline std::string Normalize(std::string_view raw) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return normalized;
}

} // namespace detail

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing log level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  const std::string normalized = detail::Normalize(raw);
  if (normalized == "debug" || normalized == "trace") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info" || normalized == "information") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

inline bool ParseLogFormat(std::string_view raw, LogFormat& format, std::string& error) {
  error.clear();

  const std::string normalized = detail::Normalize(raw);
  if (normalized == "text") {
    format = LogFormat::kText;
    return true;
  }
  if (normalized == "json") {
    format = LogFormat::kJson;
    return true;
  }

  error = "invalid log format '" + std::string(raw) + "' (expected text|json)";
  return false;
}

// Structured logger writing to a console stream, an optional append-only log
// file, or both. A logger with no sink attached is silent.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream* console = &std::cerr)
      : min_level_(min_level), console_(console) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetFormat(LogFormat format) {
    format_ = format;
  }

  LogFormat Format() const {
    return format_;
  }

  void SetCategory(std::string category) {
    category_ = std::move(category);
  }

  void SetSessionId(std::string session_id) {
    session_id_ = std::move(session_id);
  }

  const std::string& SessionId() const {
    return session_id_;
  }

  // Passing nullptr detaches the console sink.
  void SetConsole(std::ostream* console) {
    console_ = console;
  }

  bool OpenFile(const std::filesystem::path& path, std::string& error) {
    file_.close();
    file_.clear();
    file_.open(path, std::ios::binary | std::ios::app);
    if (!file_) {
      error = "unable to open log file: " + path.string();
      return false;
    }
    return true;
  }

  void Disable() {
    console_ = nullptr;
    file_.close();
  }

  bool ShouldLog(LogLevel level) const {
    if (console_ == nullptr && !file_.is_open()) {
      return false;
    }
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    const std::string line = format_ == LogFormat::kJson ? FormatJsonLine(level, message, fields)
                                                          : FormatTextLine(level, message, fields);
    if (console_ != nullptr) {
      (*console_) << line << '\n';
      console_->flush();
    }
    if (file_.is_open()) {
      file_ << line << '\n';
      file_.flush();
    }
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  std::string FormatTextLine(LogLevel level, std::string_view message,
                             std::initializer_list<LogFieldView> fields) const {
    std::string line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " category=" + category_;
    line += " session_id=" + Quote(session_id_);
    line += " msg=" + Quote(message);
    for (const auto& field : fields) {
      line.push_back(' ');
      line += field.key;
      line.push_back('=');
      line += Quote(field.value);
    }
    return line;
  }

  std::string FormatJsonLine(LogLevel level, std::string_view message,
                             std::initializer_list<LogFieldView> fields) const {
    std::string line = "{\"ts_utc\":";
    line += QuoteJson(FormatUtcTimestamp(std::chrono::system_clock::now()));
    line += ",\"level\":";
    line += QuoteJson(ToString(level));
    line += ",\"category\":";
    line += QuoteJson(category_);
    line += ",\"session_id\":";
    line += QuoteJson(session_id_);
    line += ",\"msg\":";
    line += QuoteJson(message);
    for (const auto& field : fields) {
      line.push_back(',');
      line += QuoteJson(field.key);
      line.push_back(':');
      line += QuoteJson(field.value);
    }
    line.push_back('}');
    return line;
  }

  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  LogLevel min_level_ = LogLevel::kInfo;
  LogFormat format_ = LogFormat::kText;
  std::ostream* console_ = &std::cerr;
  std::ofstream file_;
  std::string category_ = "jsoncheck";
  std::string session_id_ = "-";
};

} // namespace jsoncheck::core::logging
