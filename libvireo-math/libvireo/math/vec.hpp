#pragma once
#include <fmt/format.h>

#include <cmath>
#include <concepts>
#include <cstddef>
#include <libvireo/math/types.hpp>
#include <libvireo/math/vec_fwd.hpp>

namespace vireo::math {

template <std::size_t N, CPrimitive T>
  requires(N >= 2 && N <= 4)
struct Vec {
  T data[N];

  constexpr auto& x() noexcept { return data[0]; }
  constexpr auto& y() noexcept { return data[1]; }
  constexpr auto& z() noexcept
    requires(N >= 3)
  {
    return data[2];
  }
  constexpr auto& w() noexcept
    requires(N >= 4)
  {
    return data[3];
  }

  constexpr const auto& x() const noexcept { return data[0]; }
  constexpr const auto& y() const noexcept { return data[1]; }
  constexpr const auto& z() const noexcept
    requires(N >= 3)
  {
    return data[2];
  }
  constexpr const auto& w() const noexcept
    requires(N >= 4)
  {
    return data[3];
  }

  /**
   * @brief Default constructor that sets all components of a vector to 0
   *
   */
  constexpr Vec() : data{} {}

  /**
   * @brief Constructor that sets all components of a vector
   *
   */
  template <typename... Args>
    requires(sizeof...(Args) == N) && (std::convertible_to<Args, T> && ...)
  explicit constexpr Vec(Args... args) : data{static_cast<T>(args)...} {}

  // == Factory methods ================================================================================================

  constexpr static Vec zeros() { return Vec(); }

  constexpr static Vec filled(T val) {
    auto result = Vec();
    for (auto& c : result.data) {
      c = val;
    }
    return result;
  }

  constexpr static Vec ones() { return filled(static_cast<T>(1)); }

  // == Operators ======================================================================================================

  friend constexpr bool operator==(const Vec&, const Vec&) = default;

  constexpr Vec& operator+=(const Vec& rhs) {
    for (std::size_t i = 0; i < N; ++i) {
      data[i] += rhs.data[i];
    }
    return *this;
  }

  constexpr Vec& operator-=(const Vec& rhs) {
    for (std::size_t i = 0; i < N; ++i) {
      data[i] -= rhs.data[i];
    }
    return *this;
  }

  constexpr Vec& operator*=(T rhs) {
    for (auto& c : data) {
      c *= rhs;
    }
    return *this;
  }

  constexpr Vec& operator*=(const Vec& rhs) {
    for (std::size_t i = 0; i < N; ++i) {
      data[i] *= rhs.data[i];
    }
    return *this;
  }

  friend constexpr Vec operator+(Vec lhs, const Vec& rhs) { return lhs += rhs; }
  friend constexpr Vec operator-(Vec lhs, const Vec& rhs) { return lhs -= rhs; }
  friend constexpr Vec operator*(Vec lhs, const Vec& rhs) { return lhs *= rhs; }
  friend constexpr Vec operator*(Vec lhs, T rhs) { return lhs *= rhs; }
  friend constexpr Vec operator*(T lhs, Vec rhs) { return rhs *= lhs; }
  constexpr Vec operator-() const { return *this * static_cast<T>(-1); }

  constexpr T& operator[](std::size_t index) noexcept { return data[index]; }
  constexpr const T& operator[](std::size_t index) const noexcept { return data[index]; }
};

template <std::size_t N, CPrimitive T>
[[nodiscard]] constexpr T dot(const Vec<N, T>& lhs, const Vec<N, T>& rhs) {
  auto result = static_cast<T>(0);
  for (std::size_t i = 0; i < N; ++i) {
    result += lhs[i] * rhs[i];
  }
  return result;
}

template <std::size_t N, CFloatingPoint T>
[[nodiscard]] T length(const Vec<N, T>& vec) {
  return std::sqrt(dot(vec, vec));
}

template <std::size_t N, CPrimitive T>
[[nodiscard]] constexpr Vec<N, T> abs(Vec<N, T> vec) {
  for (auto& c : vec.data) {
    c = c < static_cast<T>(0) ? -c : c;
  }
  return vec;
}

template <std::size_t N, CFloatingPoint T>
[[nodiscard]] bool eps_eq(const Vec<N, T>& lhs, const Vec<N, T>& rhs, T epsilon) {
  for (std::size_t i = 0; i < N; ++i) {
    if (std::abs(lhs[i] - rhs[i]) > epsilon) {
      return false;
    }
  }
  return true;
}

}  // namespace vireo::math

template <std::size_t N, vireo::math::CPrimitive T>
struct fmt::formatter<vireo::math::Vec<N, T>> : fmt::formatter<T> {
  auto format(const vireo::math::Vec<N, T>& vec, fmt::format_context& ctx) const {
    auto out = fmt::format_to(ctx.out(), "[");
    for (std::size_t i = 0; i < N; ++i) {
      if (i > 0) {
        out = fmt::format_to(out, ", ");
      }
      ctx.advance_to(out);
      out = fmt::formatter<T>::format(vec[i], ctx);
    }
    return fmt::format_to(out, "]");
  }
};
