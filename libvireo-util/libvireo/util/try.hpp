#pragma once

// NOLINTBEGIN
/**
 * @brief Returns the error of `expr` from the enclosing function. For results without a value.
 *
 */
#define TRY(expr)                                        \
  if (const auto result = (expr); !result.has_value()) { \
    return std::unexpected(result.error());              \
  }

/**
 * @brief Declares `var` holding the value of `expr` or returns its error from the enclosing function.
 *
 */
#define TRY_UNWRAP_DEFINE(var, expr)                 \
  auto _##var##_result = (expr);                     \
  if (!_##var##_result.has_value()) {                \
    return std::unexpected(_##var##_result.error()); \
  }                                                  \
  auto var = std::move(_##var##_result.value());

/**
 * @brief Like TRY_UNWRAP_DEFINE, but the error is passed through `map_err` first, e.g. to wrap it into the error
 * type of the enclosing function.
 *
 */
#define TRY_UNWRAP_DEFINE_MAP_ERR(var, expr, map_err)                      \
  auto _##var##_result = (expr);                                       \
  if (!_##var##_result.has_value()) {                                  \
    return std::unexpected(map_err(std::move(_##var##_result.error()))); \
  }                                                                    \
  auto var = std::move(_##var##_result.value());
// NOLINTEND
