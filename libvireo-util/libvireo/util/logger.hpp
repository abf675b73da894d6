#pragma once

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace vireo::util {

enum class LogLevel : uint8_t {
  Err    = 0,
  Warn   = 1,
  Info   = 2,
  _Count = 3  // NOLINT
};

static constexpr std::array<std::string_view, static_cast<uint32_t>(LogLevel::_Count)> kLogPrefixes = {"ERROR", "WARN",
                                                                                                       "INFO"};
static constexpr std::string_view kDebugLogPrefix = "DEBUG";
static constexpr uint32_t kMaxLogPrefixSize       = 5;

inline std::string_view log_prefix(LogLevel level) { return kLogPrefixes[static_cast<uint32_t>(level)]; }

std::optional<LogLevel> log_level_from_string(std::string_view str);

/**
 * @brief A copy of an accepted message, delivered to the listeners. `time` is relative to the moment the logger
 * was created.
 *
 */
struct LogMessage {
  LogLevel level;
  std::string content;
  std::chrono::nanoseconds time;
};

using LogListener = std::function<void(const LogMessage&)>;

class LoggerScribe {
 public:
  LoggerScribe() = default;

  LoggerScribe(const LoggerScribe&)            = delete;
  LoggerScribe& operator=(const LoggerScribe&) = delete;
  virtual ~LoggerScribe()                      = default;

  virtual void write(const LogMessage& msg, const std::chrono::system_clock::time_point& time_point,
                     const std::source_location& location, bool is_debug_msg) = 0;
};

/**
 * @brief Logs messages to stdout or stderr. Supports message coloring on unix terminals.
 *
 */
class TerminalLoggerScribe : public LoggerScribe {
 public:
  explicit TerminalLoggerScribe(bool use_stderr = false);

  void write(const LogMessage& msg, const std::chrono::system_clock::time_point& time_point,
             const std::source_location& location, bool is_debug_msg) override;

 private:
  std::FILE* stream_;
};

/**
 * @brief Appends messages to the file at `path`. The file is created when it does not exist.
 *
 */
class FileLoggerScribe : public LoggerScribe {
 public:
  explicit FileLoggerScribe(std::filesystem::path path);

  void write(const LogMessage& msg, const std::chrono::system_clock::time_point& time_point,
             const std::source_location& location, bool is_debug_msg) override;

  [[nodiscard]] bool is_open() const { return file_stream_.is_open(); }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  std::ofstream file_stream_;
};

/**
 * @brief Thread-safe logging service. Forwards every accepted message to the registered `LoggerScribe`s and
 * listeners. It is not a singleton: the application creates one and hands it over to the systems that log.
 *
 */
class Logger {
 public:
  using ListenerToken = uint64_t;

  explicit Logger(LogLevel verbosity = LogLevel::Info);
  ~Logger() = default;

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  struct FormatWithLocation {
    const char* value;
    std::source_location loc;

    FormatWithLocation(const char* s,  // NOLINT
                       const std::source_location& l = std::source_location::current())
        : value(s), loc(l) {}
  };

  template <typename... Args>
  void err(FormatWithLocation fmt_loc, const Args&... args) {
    log(LogLevel::Err, false, fmt_loc.loc, fmt_loc.value, args...);
  }

  template <typename... Args>
  void warn(FormatWithLocation fmt_loc, const Args&... args) {
    log(LogLevel::Warn, false, fmt_loc.loc, fmt_loc.value, args...);
  }

  template <typename... Args>
  void info(FormatWithLocation fmt_loc, const Args&... args) {
    log(LogLevel::Info, false, fmt_loc.loc, fmt_loc.value, args...);
  }

  template <typename... Args>
  void debug(FormatWithLocation fmt_loc, const Args&... args) {
#ifdef VIREO_DEBUG
    log(LogLevel::Info, true, fmt_loc.loc, fmt_loc.value, args...);
#else
    // Silence the unused parameters warnings when in release
    (void)fmt_loc;
    ((void)args, ...);
#endif
  }

  template <typename... Args>
  void log(const LogLevel level, const bool debug, const std::source_location& location, const std::string_view fmt,
           const Args&... args) {
    vlog(level, debug, location, fmt, fmt::make_format_args(args...));
  }

  void vlog(LogLevel level, bool debug, const std::source_location& location, std::string_view fmt,
            fmt::format_args args);

  /**
   * @brief Allows to verify that the result of an operation is not an error. If it is, the error is written to the
   * log and the program proceeds. Use it when an error can be ignored but should still be visible.
   *
   */
  template <typename TType, typename TError>
    requires requires(const TError& e) {
      { e.msg } -> std::convertible_to<std::string_view>;
    }
  void verify(const std::expected<TType, TError>& result,
              const std::source_location& location = std::source_location::current()) {
    if (!result) {
      log(LogLevel::Err, false, location, "Operation failed! Reason: {}", std::string_view(result.error().msg));
    }
  }

  void add_scribe(std::unique_ptr<LoggerScribe> scribe);

  /**
   * @brief Registers a listener called with every accepted message. Listeners are called after the logger lock is
   * released, so they may log through the same logger. Such a listener must not log on every call or it recurses
   * forever.
   *
   */
  ListenerToken add_listener(LogListener listener);
  void remove_listener(ListenerToken token);

  void set_verbosity(LogLevel level);
  [[nodiscard]] LogLevel verbosity() const;

 private:
  std::vector<std::unique_ptr<LoggerScribe>> scribes_;
  std::vector<std::pair<ListenerToken, LogListener>> listeners_;
  ListenerToken next_token_{1};
  LogLevel verbosity_;
  std::chrono::steady_clock::time_point time_origin_;
  mutable std::mutex mutex_;
};

}  // namespace vireo::util
