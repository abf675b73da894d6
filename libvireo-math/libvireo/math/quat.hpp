#pragma once

#include <fmt/format.h>

#include <cmath>
#include <libvireo/math/types.hpp>
#include <libvireo/math/vec.hpp>

namespace vireo::math {

template <CFloatingPoint T>
struct Quat {
 public:
  T w, x, y, z;

  // CONSTRUCTORS ////////////////////////////////////////////////////////////////////////////////////

  constexpr explicit Quat(T real, const Vec<3, T>& imaginary)
      : w(real), x(imaginary.x()), y(imaginary.y()), z(imaginary.z()) {}
  constexpr explicit Quat(T _w, T _x, T _y, T _z) : w(_w), x(_x), y(_y), z(_z) {}
  constexpr Quat() : w(static_cast<T>(1)), x(static_cast<T>(0)), y(static_cast<T>(0)), z(static_cast<T>(0)) {}

  // FACTORY METHODS //////////////////////////////////////////////////////////////////////////////////

  /**
   * @brief Creates an unit quaternion that represents a rotation around `axis` by `rad_angle` in radians. It is
   * assumed that `axis` has been already normalized.
   *
   */
  static Quat rotation_axis(T rad_angle, const Vec<3, T>& axis) {
    T s = std::sin(rad_angle / static_cast<T>(2));
    return Quat{
        std::cos(rad_angle / static_cast<T>(2)),
        axis.x() * s,
        axis.y() * s,
        axis.z() * s,
    };
  }

  static Quat rotation_x(T rad_angle) { return rotation_axis(rad_angle, Vec<3, T>(1, 0, 0)); }
  static Quat rotation_y(T rad_angle) { return rotation_axis(rad_angle, Vec<3, T>(0, 1, 0)); }
  static Quat rotation_z(T rad_angle) { return rotation_axis(rad_angle, Vec<3, T>(0, 0, 1)); }

  constexpr static Quat identity() { return Quat(); }

  // OPERATORS ////////////////////////////////////////////////////////////////////////////////////////

  friend constexpr bool operator==(const Quat&, const Quat&) = default;

  [[nodiscard]] constexpr friend Quat operator*(const Quat& lhs, const Quat& rhs) {
    return Quat{
        lhs.w * rhs.w - lhs.x * rhs.x - lhs.y * rhs.y - lhs.z * rhs.z,
        lhs.w * rhs.x + lhs.x * rhs.w + lhs.y * rhs.z - lhs.z * rhs.y,
        lhs.w * rhs.y - lhs.x * rhs.z + lhs.y * rhs.w + lhs.z * rhs.x,
        lhs.w * rhs.z + lhs.x * rhs.y - lhs.y * rhs.x + lhs.z * rhs.w,
    };
  }

  [[nodiscard]] constexpr friend Vec<3, T> operator*(const Quat& lhs, const Vec<3, T>& rhs) {
    return (lhs * Quat(static_cast<T>(0), rhs) * lhs.conjugate()).imaginary();
  }

  [[nodiscard]] constexpr Vec<3, T> imaginary() const { return Vec<3, T>(x, y, z); }
  [[nodiscard]] constexpr T real() const { return w; }

  /**
   * @brief Computes conjugate of the quaternion. For unit quaternions (e.g. a rotation quaternions) it's the same as
   * inverse.
   *
   */
  [[nodiscard]] constexpr Quat conjugate() const { return Quat{w, -x, -y, -z}; }

  [[nodiscard]] T norm() const { return std::sqrt(w * w + x * x + y * y + z * z); }

  [[nodiscard]] Quat normalize() const {
    const T n = norm();
    return Quat{w / n, x / n, y / n, z / n};
  }
};

template <CFloatingPoint T>
[[nodiscard]] constexpr T dot(const Quat<T>& lhs, const Quat<T>& rhs) {
  return lhs.w * rhs.w + lhs.x * rhs.x + lhs.y * rhs.y + lhs.z * rhs.z;
}

using Quatf = Quat<float>;
using Quatd = Quat<double>;

}  // namespace vireo::math

template <vireo::math::CFloatingPoint T>
struct fmt::formatter<vireo::math::Quat<T>> : fmt::formatter<T> {
  auto format(const vireo::math::Quat<T>& q, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "[{}, ({}, {}, {})]", q.w, q.x, q.y, q.z);
  }
};
