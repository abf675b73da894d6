#pragma once
#include <cstddef>
#include <cstdint>
#include <libvireo/math/types.hpp>

namespace vireo::math {

template <std::size_t N, CPrimitive T>
  requires(N >= 2 && N <= 4)
struct Vec;

template <CPrimitive T>
using Vec2 = Vec<2, T>;

template <CPrimitive T>
using Vec3 = Vec<3, T>;

template <CPrimitive T>
using Vec4 = Vec<4, T>;

using Vec2f = Vec2<float>;
using Vec3f = Vec3<float>;
using Vec4f = Vec4<float>;

using Vec3i = Vec3<int>;

}  // namespace vireo::math
