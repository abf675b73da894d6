#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <libvireo/util/logger.hpp>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vireo::util {

std::optional<LogLevel> log_level_from_string(std::string_view str) {
  for (uint32_t i = 0; i < static_cast<uint32_t>(LogLevel::_Count); ++i) {
    if (str == kLogPrefixes[i]) {
      return static_cast<LogLevel>(i);
    }
  }
  return std::nullopt;
}

namespace {

void begin_terminal_style(std::FILE* stream, std::string_view style) { fmt::print(stream, "\033{}", style); }
void end_terminal_style(std::FILE* stream) { fmt::print(stream, "\033[0m\n"); }

std::string format_msg(std::string_view prefix, const LogMessage& msg,
                       const std::chrono::system_clock::time_point& time_point, const std::source_location& location) {
  auto out = fmt::memory_buffer();

  // Print logger message prefix with date
  auto time = std::chrono::system_clock::to_time_t(time_point);
  fmt::format_to(std::back_inserter(out), "[{0:{2}} {1:%T}]: ", prefix, fmt::localtime(time), kMaxLogPrefixSize);

  // Print location
  if (msg.level < LogLevel::Info) {
#ifdef NDEBUG
    fmt::format_to(std::back_inserter(out), "`{0}`: ", location.function_name());
#else
    fmt::format_to(std::back_inserter(out), "{0}({1}:{2}) `{3}`: ",
                   std::filesystem::path(location.file_name()).filename().string(), location.line(),
                   location.column(), location.function_name());
#endif
  }

  // Print message provided by the user
  fmt::format_to(std::back_inserter(out), "{}", msg.content);
  return fmt::to_string(out);
}

}  // namespace

TerminalLoggerScribe::TerminalLoggerScribe(bool use_stderr) : stream_(use_stderr ? stderr : stdout) {}

void TerminalLoggerScribe::write(const LogMessage& msg, const std::chrono::system_clock::time_point& time_point,
                                 const std::source_location& location, bool is_debug_msg) {
  if (is_debug_msg) {
    begin_terminal_style(stream_, "[34m");  // Blue
    fmt::print(stream_, "{}", format_msg(kDebugLogPrefix, msg, time_point, location));
    end_terminal_style(stream_);
    return;
  }

  if (msg.level == LogLevel::Err) {
    begin_terminal_style(stream_, "[1;31m");  // Red bold
  } else if (msg.level == LogLevel::Warn) {
    begin_terminal_style(stream_, "[1;33m");  // Yellow bold
  } else {
    begin_terminal_style(stream_, "[;37m");  // White
  }

  fmt::print(stream_, "{}", format_msg(log_prefix(msg.level), msg, time_point, location));
  end_terminal_style(stream_);
}

FileLoggerScribe::FileLoggerScribe(std::filesystem::path path)
    : path_(std::move(path)), file_stream_(path_, std::ios::out | std::ios::app) {}

void FileLoggerScribe::write(const LogMessage& msg, const std::chrono::system_clock::time_point& time_point,
                             const std::source_location& location, bool is_debug_msg) {
  if (!file_stream_.is_open()) {
    return;
  }

  const auto prefix = is_debug_msg ? kDebugLogPrefix : log_prefix(msg.level);
  file_stream_ << format_msg(prefix, msg, time_point, location) << '\n';
  file_stream_.flush();
}

Logger::Logger(LogLevel verbosity) : verbosity_(verbosity), time_origin_(std::chrono::steady_clock::now()) {}

void Logger::vlog(LogLevel level, bool debug, const std::source_location& location, std::string_view fmt,
                  fmt::format_args args) {
  auto listeners = std::vector<LogListener>();
  auto msg       = LogMessage{};
  {
    const std::lock_guard lock(mutex_);
    if (!debug && level > verbosity_) {
      return;
    }

    msg = LogMessage{
        .level   = level,
        .content = fmt::vformat(fmt, args),
        .time    = std::chrono::steady_clock::now() - time_origin_,
    };
    const auto now = std::chrono::system_clock::now();

    for (const auto& scribe : scribes_) {
      scribe->write(msg, now, location, debug);
    }

    listeners.reserve(listeners_.size());
    for (const auto& [token, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }

  // Listeners run unlocked, so they may log themselves.
  for (const auto& listener : listeners) {
    listener(msg);
  }
}

void Logger::add_scribe(std::unique_ptr<LoggerScribe> scribe) {
  const std::lock_guard lock(mutex_);

  scribes_.push_back(std::move(scribe));
}

Logger::ListenerToken Logger::add_listener(LogListener listener) {
  const std::lock_guard lock(mutex_);

  auto token = next_token_++;
  listeners_.emplace_back(token, std::move(listener));
  return token;
}

void Logger::remove_listener(ListenerToken token) {
  const std::lock_guard lock(mutex_);

  std::erase_if(listeners_, [token](const auto& entry) { return entry.first == token; });
}

void Logger::set_verbosity(LogLevel level) {
  const std::lock_guard lock(mutex_);
  verbosity_ = level;
}

LogLevel Logger::verbosity() const {
  const std::lock_guard lock(mutex_);
  return verbosity_;
}

}  // namespace vireo::util
