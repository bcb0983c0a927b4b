// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace xstream
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Process-wide logger with levels, an optional daily log file, a
/// configurable line format and an optional external sink.
///
/// All members are static. Logging is synchronous; each record is written
/// under a mutex so the host application may log from any thread.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler function type
  /// Takes log level, formatted message, and original message without timestamp/level prefix
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Configure the minimum level and destination.
  /// \param filePath Base path of the log file. Records go to
  /// "<filePath>.<YYYY-MM-DD>.log". Empty means standard output.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
    data.logBasePath = filePath;
    data.timestampFormat = timeFormat;
    data.currentLogDate.clear();
    data.fileStream.reset();
    openLogFileIfNeeded();
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  /// \brief Flush and close the log file; later records go to standard output.
  static void shutdown()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
      data.fileStream.reset();
    }
    data.logBasePath.clear();
    data.currentLogDate.clear();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Register an external log handler
  /// While a handler is registered, file and console output are disabled.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  /// \brief Remove external log handler and restore normal logging
  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the log line format
  /// Supported placeholders:
  ///   %T - timestamp
  ///   %L - log level (e.g., INFO, DEBUG, ERROR)
  ///   %m - message content
  ///   %F - source file name (only filename, no directory path)
  ///   %l - source line number
  ///   %f - function name
  ///   %% - literal percent sign
  /// Source location placeholders expand to nothing unless the record came
  /// from one of the XSTREAM_LOG_* macros. Empty formats are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  /// \brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
  /// "error", "fatal"), case-insensitive. Unknown names yield \p fallback.
  static Level levelFromString(const std::string &name, Level fallback = Level::Info)
  {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
    {
      lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
    }
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warning" || lower == "warn")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    return fallback;
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    }
    return "UNKNOWN";
  }

  static std::string currentDate()
  {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  static void logf(Level level, const char *fmt, ...)
  {
    if (level < getLevel())
    {
      return;
    }
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    std::string message;
    if (size > 0)
    {
      std::vector<char> buf(static_cast<std::size_t>(size) + 1);
      std::vsnprintf(buf.data(), buf.size(), fmt, args);
      message.assign(buf.data(), static_cast<std::size_t>(size));
    }
    va_end(args);
    log(level, message);
  }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLogMessage(data, level, message, file, line, function);

    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
      return;
    }

    openLogFileIfNeeded();
    if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    std::string logFormat = "[%T] [%L] %m";
    ExternalHandler externalHandler;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  // Caller holds data.mutex.
  static void openLogFileIfNeeded()
  {
    auto &data = getData();
    if (data.logBasePath.empty())
    {
      return;
    }
    std::string today = currentDate();
    if (data.fileStream && today == data.currentLogDate)
    {
      return;
    }
    data.currentLogDate = today;
    std::string fileName = data.logBasePath + "." + today + ".log";
    data.fileStream = std::make_unique<std::ofstream>(fileName, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "xstream: failed to open log file " << fileName << std::endl;
      data.fileStream.reset();
    }
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
  }

  // Caller holds data.mutex.
  static std::string formatLogMessage(const LoggerData &data, Level level,
                                      const std::string &message, const char *file, int line,
                                      const char *function)
  {
    std::string out;
    out.reserve(data.logFormat.size() + message.size() + 32);
    const std::string &fmt = data.logFormat;
    for (std::size_t i = 0; i < fmt.size(); ++i)
    {
      if (fmt[i] != '%' || i + 1 >= fmt.size())
      {
        out.push_back(fmt[i]);
        continue;
      }
      char spec = fmt[++i];
      switch (spec)
      {
      case 'T':
        out += timestamp(data.timestampFormat);
        break;
      case 'L':
        out += levelToString(level);
        break;
      case 'm':
        out += message;
        break;
      case 'F':
        if (file)
        {
          out += detail::basename(file);
        }
        break;
      case 'l':
        if (file)
        {
          out += std::to_string(line);
        }
        break;
      case 'f':
        if (function)
        {
          out += function;
        }
        break;
      case '%':
        out.push_back('%');
        break;
      default:
        // Unknown placeholder, keep it verbatim
        out.push_back('%');
        out.push_back(spec);
        break;
      }
    }
    out.push_back('\n');
    return out;
  }
};

/// \brief Stream interface for composing and emitting log messages with
/// levels.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  LoggerStream(LoggerStream &&other) noexcept
      : _level(other._level), _stream(std::move(other._stream)), _flushed(other._flushed)
  {
    other._flushed = true;
  }

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    try
    {
      if (!_flushed && !_stream.str().empty())
      {
        flush();
      }
    }
    catch (const std::exception &e)
    {
      std::cerr << "xstream: failed to emit log record: " << e.what() << std::endl;
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _flushed = true;
    _stream.str("");
  }
};

/// \brief Proxy for streaming log messages at specific log levels.
class LoggerProxy
{
public:
  LoggerStream operator<<(Logger::Level level) { return Logger::stream(level); }
};

inline LoggerProxy Logger;

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace xstream

/// \brief Stream-style logging macro with source location support
#define XSTREAM_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    if (xstream::core::Logger::Level::level >= xstream::core::Logger::getLevel())                 \
    {                                                                                              \
      std::ostringstream _xsOss;                                                                   \
      _xsOss << msg;                                                                               \
      xstream::core::Logger::log(xstream::core::Logger::Level::level, _xsOss.str(), __FILE__,     \
                                 __LINE__, __func__);                                              \
    }                                                                                              \
  } while (0)

#define XSTREAM_LOG_TRACE(msg) XSTREAM_LOG_WITH_LEVEL(Trace, msg)
#define XSTREAM_LOG_DEBUG(msg) XSTREAM_LOG_WITH_LEVEL(Debug, msg)
#define XSTREAM_LOG_INFO(msg) XSTREAM_LOG_WITH_LEVEL(Info, msg)
#define XSTREAM_LOG_WARN(msg) XSTREAM_LOG_WITH_LEVEL(Warning, msg)
#define XSTREAM_LOG_ERROR(msg) XSTREAM_LOG_WITH_LEVEL(Error, msg)
#define XSTREAM_LOG_FATAL(msg) XSTREAM_LOG_WITH_LEVEL(Fatal, msg)
