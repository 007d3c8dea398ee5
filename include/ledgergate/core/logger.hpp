// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ledgergate
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of a __FILE__ path at compile time.
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    for (; *path; ++path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
    }
    return file;
  }

  inline std::tm localNow(std::chrono::system_clock::time_point now)
  {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
  }

  /// \brief Everything a formatted log line can refer to.
  struct LogRecord
  {
    const char *level;
    const std::string &message;
    const char *file;
    int line;
    const char *function;
  };

  /// \brief Compiled line template.
  ///
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F source file, %l source line, %f function, %% literal percent. Any
  /// other `%x` is kept as written.
  class LineFormat
  {
  public:
    explicit LineFormat(const std::string &pattern = "[%T] [%L] %m") { compile(pattern); }

    const std::string &pattern() const { return _pattern; }

    void setTimeFormat(const std::string &timeFormat) { _timeFormat = timeFormat; }

    std::string render(const LogRecord &record) const
    {
      std::ostringstream out;
      for (const auto &part : _parts)
      {
        switch (part.field)
        {
        case Field::Text:
          out << part.text;
          break;
        case Field::Timestamp:
          writeTimestamp(out);
          break;
        case Field::Thread:
          out << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
              << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
          break;
        case Field::Level:
          out << record.level;
          break;
        case Field::Message:
          out << record.message;
          break;
        case Field::File:
          out << (record.file ? basename(record.file) : "");
          break;
        case Field::Line:
          if (record.file)
          {
            out << record.line;
          }
          break;
        case Field::Function:
          out << (record.function ? record.function : "");
          break;
        }
      }
      out << '\n';
      return out.str();
    }

  private:
    enum class Field
    {
      Text,
      Timestamp,
      Thread,
      Level,
      Message,
      File,
      Line,
      Function
    };

    struct Part
    {
      Field field;
      std::string text;
    };

    void compile(const std::string &pattern)
    {
      _pattern = pattern;
      std::string text;
      for (std::size_t i = 0; i < pattern.size(); ++i)
      {
        Field field = Field::Text;
        if (pattern[i] == '%' && i + 1 < pattern.size())
        {
          field = fieldFor(pattern[i + 1]);
        }
        if (field == Field::Text)
        {
          const bool escapedPercent =
            pattern[i] == '%' && i + 1 < pattern.size() && pattern[i + 1] == '%';
          text += pattern[i];
          i += escapedPercent ? 1 : 0;
          continue;
        }
        if (!text.empty())
        {
          _parts.push_back({Field::Text, std::move(text)});
          text.clear();
        }
        _parts.push_back({field, {}});
        ++i;
      }
      if (!text.empty())
      {
        _parts.push_back({Field::Text, std::move(text)});
      }
    }

    static Field fieldFor(char c)
    {
      switch (c)
      {
      case 'T':
        return Field::Timestamp;
      case 't':
        return Field::Thread;
      case 'L':
        return Field::Level;
      case 'm':
        return Field::Message;
      case 'F':
        return Field::File;
      case 'l':
        return Field::Line;
      case 'f':
        return Field::Function;
      default:
        return Field::Text;
      }
    }

    void writeTimestamp(std::ostringstream &out) const
    {
      auto now = std::chrono::system_clock::now();
      std::tm tm = localNow(now);
      out << std::put_time(&tm, _timeFormat.c_str());
      // Second resolution formats get milliseconds appended.
      if (_timeFormat.find("%S") != std::string::npos)
      {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                  1000;
        out << '.' << std::setfill('0') << std::setw(3) << ms.count();
      }
    }

    std::string _pattern;
    std::string _timeFormat{"%Y-%m-%d %H:%M:%S"};
    std::vector<Part> _parts;
  };

  /// \brief Append-only file named `<base>.<YYYY-MM-DD>.log` that switches
  /// to a new file when the local date changes, removing files of the same
  /// base older than the retention window.
  class DailyFile
  {
  public:
    DailyFile(std::filesystem::path base, int retentionDays)
        : _base(std::move(base)), _retentionDays(retentionDays)
    {
    }

    /// \brief Write one line. Returns false if no file could be opened.
    bool write(const std::string &line)
    {
      std::string today = dateOf(std::chrono::system_clock::now());
      if (!_stream || today != _date)
      {
        open(today);
      }
      if (!_stream)
      {
        return false;
      }
      *_stream << line;
      _stream->flush();
      return true;
    }

    void flush()
    {
      if (_stream)
      {
        _stream->flush();
      }
    }

  private:
    static std::string dateOf(std::chrono::system_clock::time_point when)
    {
      std::tm tm = localNow(when);
      char date[16];
      std::strftime(date, sizeof(date), "%Y-%m-%d", &tm);
      return date;
    }

    std::filesystem::path directory() const
    {
      auto dir = _base.parent_path();
      return dir.empty() ? std::filesystem::current_path() : dir;
    }

    std::string prefix() const { return _base.filename().string() + "."; }

    void open(const std::string &date)
    {
      _stream.reset();
      std::error_code ec;
      std::filesystem::create_directories(directory(), ec);
      if (ec)
      {
        std::cerr << "[Logger] Cannot create log directory " << directory() << ": "
                  << ec.message() << std::endl;
        return;
      }

      auto path = directory() / (prefix() + date + ".log");
      auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
      if (!stream->is_open())
      {
        std::cerr << "[Logger] Cannot open log file " << path << std::endl;
        return;
      }
      _stream = std::move(stream);
      _date = date;
      prune();
    }

    void prune() const
    {
      if (_retentionDays <= 0)
      {
        return;
      }
      const auto now = std::chrono::system_clock::now();
      const std::string head = prefix();
      std::error_code ec;
      for (const auto &entry : std::filesystem::directory_iterator(directory(), ec))
      {
        const std::string name = entry.path().filename().string();
        if (name.size() != head.size() + 14 || name.compare(0, head.size(), head) != 0)
        {
          continue;
        }
        std::tm tm{};
        std::istringstream date(name.substr(head.size(), 10));
        date >> std::get_time(&tm, "%Y-%m-%d");
        if (date.fail())
        {
          continue;
        }
        auto written = std::chrono::system_clock::from_time_t(std::mktime(&tm));
        auto days = std::chrono::duration_cast<std::chrono::hours>(now - written).count() / 24;
        if (days < _retentionDays)
        {
          continue;
        }
        std::error_code rm;
        std::filesystem::remove(entry.path(), rm);
        if (rm)
        {
          std::cerr << "[Logger] Cannot remove expired log " << entry.path() << ": "
                    << rm.message() << std::endl;
        }
      }
    }

    std::filesystem::path _base;
    int _retentionDays;
    std::string _date;
    std::unique_ptr<std::ofstream> _stream;
  };
} // namespace detail

/// \brief Process-wide logger with levels, an optional background writer,
/// daily file rotation and retention.
///
/// Lines go to stdout unless init() names a file base path.
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

  /// \brief (Re)configure the logger. Any queued lines are written first.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   bool async = false, int retentionDays = 7,
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    drainLocked(s);
    s.level = level;
    s.format.setTimeFormat(timeFormat);
    s.timeFormat = timeFormat;
    s.file.reset();
    if (!filePath.empty())
    {
      s.file = std::make_unique<detail::DailyFile>(filePath, retentionDays);
    }
    s.async = async;
    s.stopping = false;
    if (async && !s.writer.joinable())
    {
      // The writer blocks on the mutex until this call returns.
      s.writer = std::thread(writerLoop);
    }
  }

  /// \brief Write every queued line and flush the sink.
  static void flush()
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    drainLocked(s);
    if (s.file)
    {
      s.file->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  /// \brief Flush and stop the background writer. Later lines are written
  /// synchronously.
  static void shutdown()
  {
    auto &s = state();
    stopWriter(s);
    flush();
  }

  static void setLevel(Level level)
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
  }

  static Level getLevel()
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.level;
  }

  /// \brief Replace the line template; see detail::LineFormat. An empty
  /// pattern is ignored.
  static void setLogFormat(const std::string &pattern)
  {
    if (pattern.empty())
    {
      return;
    }
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.format = detail::LineFormat(pattern);
    s.format.setTimeFormat(s.timeFormat);
  }

  static std::string getLogFormat()
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.format.pattern();
  }

  /// \brief Level for a configuration name, case-insensitive. Unknown names
  /// give Info.
  static Level levelFromString(const std::string &name)
  {
    static const std::pair<const char *, Level> kNames[] = {
      {"trace", Level::Trace}, {"debug", Level::Debug},     {"warn", Level::Warning},
      {"warning", Level::Warning}, {"error", Level::Error}, {"fatal", Level::Fatal}};
    std::string lower;
    for (char c : name)
    {
      lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (const auto &entry : kNames)
    {
      if (lower == entry.first)
      {
        return entry.second;
      }
    }
    return Level::Info;
  }

  static const char *levelToString(Level level)
  {
    static const char *kLabels[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    return kLabels[static_cast<int>(level)];
  }

  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }

  /// \brief Log `message`; the source location is optional and only used
  /// by the %F, %l and %f placeholders.
  static void log(Level level, const std::string &message, const char *file = nullptr,
                  int line = 0, const char *function = nullptr)
  {
    auto &s = state();
    std::unique_lock<std::mutex> lock(s.mutex);
    if (level < s.level)
    {
      return;
    }
    std::string text =
      s.format.render({levelToString(level), message, file, line, function});
    if (s.async)
    {
      s.pending.push_back(std::move(text));
      lock.unlock();
      s.wake.notify_one();
      return;
    }
    emitLocked(s, text);
  }

private:
  struct State
  {
    std::mutex mutex;
    std::condition_variable wake;
    std::deque<std::string> pending;
    std::thread writer;
    bool async = false;
    bool stopping = false;
    Level level = Level::Info;
    std::string timeFormat{"%Y-%m-%d %H:%M:%S"};
    detail::LineFormat format;
    std::unique_ptr<detail::DailyFile> file;

    ~State() { stopWriter(*this); }
  };

  static State &state()
  {
    static State s;
    return s;
  }

  static void stopWriter(State &s)
  {
    {
      std::lock_guard<std::mutex> lock(s.mutex);
      s.stopping = true;
      s.async = false;
    }
    s.wake.notify_all();
    if (s.writer.joinable())
    {
      s.writer.join();
    }
  }

  static void writerLoop()
  {
    auto &s = state();
    std::unique_lock<std::mutex> lock(s.mutex);
    while (!s.stopping)
    {
      s.wake.wait(lock, [&s]() { return s.stopping || !s.pending.empty(); });
      drainLocked(s);
    }
    drainLocked(s);
  }

  // Caller holds s.mutex.
  static void drainLocked(State &s)
  {
    while (!s.pending.empty())
    {
      emitLocked(s, s.pending.front());
      s.pending.pop_front();
    }
  }

  // Caller holds s.mutex. Falls back to stdout when the file is unusable.
  static void emitLocked(State &s, const std::string &text)
  {
    if (s.file && s.file->write(text))
    {
      return;
    }
    std::cout << text;
  }
};

} // namespace core
} // namespace ledgergate

/// \brief Stream-style logging with source location.
#define LEDGERGATE_LOG_WITH_LEVEL(level, msg)                                                      \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _lgOss;                                                                     \
    _lgOss << msg;                                                                                 \
    ledgergate::core::Logger::log(ledgergate::core::Logger::Level::level, _lgOss.str(), __FILE__,  \
                                  __LINE__, __func__);                                             \
  } while (0)

#define LEDGERGATE_LOG_TRACE(msg) LEDGERGATE_LOG_WITH_LEVEL(Trace, msg)
#define LEDGERGATE_LOG_DEBUG(msg) LEDGERGATE_LOG_WITH_LEVEL(Debug, msg)
#define LEDGERGATE_LOG_INFO(msg) LEDGERGATE_LOG_WITH_LEVEL(Info, msg)
#define LEDGERGATE_LOG_WARN(msg) LEDGERGATE_LOG_WITH_LEVEL(Warning, msg)
#define LEDGERGATE_LOG_ERROR(msg) LEDGERGATE_LOG_WITH_LEVEL(Error, msg)
#define LEDGERGATE_LOG_FATAL(msg) LEDGERGATE_LOG_WITH_LEVEL(Fatal, msg)
