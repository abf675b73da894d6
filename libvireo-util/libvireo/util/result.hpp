#pragma once

#include <cstdlib>
#include <expected>
#include <libvireo/util/logger.hpp>
#include <source_location>
#include <string_view>
#include <utility>

namespace vireo::util {

struct ResultFmtWithLoc {
  const char* value;
  std::source_location loc;

  // NOLINTBEGIN
  ResultFmtWithLoc(const char* s = "", const std::source_location& l = std::source_location::current())
      : value(s), loc(l) {}
  // NOLINTEND
};

template <typename TError>
void log_panic(Logger& logger, const std::source_location& l, const TError& err, std::string_view msg) {
  if constexpr (requires { err.msg; }) {
    if (msg.empty()) {
      logger.log(LogLevel::Err, false, l, "Program has crashed! Reason: {}", std::string_view(err.msg));
    } else {
      logger.log(LogLevel::Err, false, l, "Program has crashed with message: \"{}\". Reason: {}", msg,
                 std::string_view(err.msg));
    }
  } else {
    if (msg.empty()) {
      logger.log(LogLevel::Err, false, l, "Program has crashed!");
    } else {
      logger.log(LogLevel::Err, false, l, "Program has crashed with message: \"{}\"", msg);
    }
  }
}

template <typename TType, typename TError>
struct Result : public std::expected<TType, TError> {
  using base = std::expected<TType, TError>;
  using base::base;  // inherit constructors

  Result(const std::expected<TType, TError>& exp) : base(exp) {}        // NOLINT
  Result(std::expected<TType, TError>&& exp) : base(std::move(exp)) {}  // NOLINT

  /**
   * @brief In the case the error is returned, the error is logged and the program crashes.
   *
   */
  TType or_panic(Logger& logger, ResultFmtWithLoc fmt_loc = {}) {
    if (this->has_value()) {
      return std::move(this->value());
    }
    log_panic(logger, fmt_loc.loc, this->error(), fmt_loc.value);
    std::abort();
  }
};

template <typename TError>
struct [[nodiscard("Result should be checked for errors")]] Result<void, TError> : public std::expected<void, TError> {
  using base = std::expected<void, TError>;
  using base::base;  // inherit constructors

  Result(const std::expected<void, TError>& exp) : base(exp) {}        // NOLINT
  Result(std::expected<void, TError>&& exp) : base(std::move(exp)) {}  // NOLINT

  void or_panic(Logger& logger, ResultFmtWithLoc fmt_loc = {}) {
    if (this->has_value()) {
      return;
    }
    log_panic(logger, fmt_loc.loc, this->error(), fmt_loc.value);
    std::abort();
  }
};

}  // namespace vireo::util
