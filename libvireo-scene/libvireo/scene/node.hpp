#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <libvireo/math/quat.hpp>
#include <libvireo/math/vec.hpp>
#include <libvireo/scene/pool.hpp>
#include <libvireo/scene/script.hpp>
#include <libvireo/scene/texture.hpp>
#include <libvireo/util/ruleof.hpp>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace vireo::scene {

class Node;
using NodeHandle = Handle<Node>;

enum class Mobility : uint8_t {
  Static     = 0,
  Stationary = 1,
  Dynamic    = 2,
};

/**
 * @brief Local transform of a node. The pivots and offsets are applied around the rotation and the scale the same way
 * FBX-style transforms do.
 *
 */
class Transform {
 public:
  const math::Vec3f& position() const { return position_; }
  void set_position(const math::Vec3f& position) { position_ = position; }

  const math::Vec3f& scale() const { return scale_; }
  void set_scale(const math::Vec3f& scale) { scale_ = scale; }

  const math::Quatf& rotation() const { return rotation_; }
  void set_rotation(const math::Quatf& rotation) { rotation_ = rotation; }

  const math::Quatf& pre_rotation() const { return pre_rotation_; }
  void set_pre_rotation(const math::Quatf& pre_rotation) { pre_rotation_ = pre_rotation; }

  const math::Quatf& post_rotation() const { return post_rotation_; }
  void set_post_rotation(const math::Quatf& post_rotation) { post_rotation_ = post_rotation; }

  const math::Vec3f& rotation_offset() const { return rotation_offset_; }
  void set_rotation_offset(const math::Vec3f& offset) { rotation_offset_ = offset; }

  const math::Vec3f& rotation_pivot() const { return rotation_pivot_; }
  void set_rotation_pivot(const math::Vec3f& pivot) { rotation_pivot_ = pivot; }

  const math::Vec3f& scaling_offset() const { return scaling_offset_; }
  void set_scaling_offset(const math::Vec3f& offset) { scaling_offset_ = offset; }

  const math::Vec3f& scaling_pivot() const { return scaling_pivot_; }
  void set_scaling_pivot(const math::Vec3f& pivot) { scaling_pivot_ = pivot; }

 private:
  math::Vec3f position_{math::Vec3f::zeros()};
  math::Vec3f scale_{math::Vec3f::ones()};
  math::Quatf rotation_{math::Quatf::identity()};
  math::Quatf pre_rotation_{math::Quatf::identity()};
  math::Quatf post_rotation_{math::Quatf::identity()};
  math::Vec3f rotation_offset_{math::Vec3f::zeros()};
  math::Vec3f rotation_pivot_{math::Vec3f::zeros()};
  math::Vec3f scaling_offset_{math::Vec3f::zeros()};
  math::Vec3f scaling_pivot_{math::Vec3f::zeros()};
};

// == Payloads =========================================================================================================

struct Pivot {};

/**
 * @brief Properties shared by all light sources.
 *
 */
struct BaseLight {
  math::Vec3f color{math::Vec3f::ones()};
  float intensity{1.F};
  TextureRef cookie_texture;
};

class PointLight {
 public:
  static constexpr float kDefaultRadius     = 10.F;
  static constexpr float kDefaultShadowBias = 0.025F;

  BaseLight base;

  float radius() const { return radius_; }

  /**
   * @brief Negative radius is stored as its absolute value.
   *
   */
  void set_radius(float radius) { radius_ = std::abs(radius); }

  float shadow_bias() const { return shadow_bias_; }
  void set_shadow_bias(float bias) { shadow_bias_ = bias; }

 private:
  float radius_{kDefaultRadius};
  float shadow_bias_{kDefaultShadowBias};
};

struct AbsoluteFrustumSplit {
  std::array<float, 3> far_planes{5.F, 25.F, 64.F};

  friend bool operator==(const AbsoluteFrustumSplit&, const AbsoluteFrustumSplit&) = default;
};

struct RelativeFrustumSplit {
  std::array<float, 3> fractions{0.08F, 0.32F, 1.F};

  friend bool operator==(const RelativeFrustumSplit&, const RelativeFrustumSplit&) = default;
};

using FrustumSplitOptions = std::variant<AbsoluteFrustumSplit, RelativeFrustumSplit>;

/**
 * @brief Cascaded shadow map settings.
 *
 */
class CsmOptions {
 public:
  static constexpr float kDefaultShadowBias = 0.00025F;

  FrustumSplitOptions split_options{AbsoluteFrustumSplit{}};

  float shadow_bias() const { return shadow_bias_; }
  void set_shadow_bias(float bias) { shadow_bias_ = std::max(bias, 0.F); }

  friend bool operator==(const CsmOptions&, const CsmOptions&) = default;

 private:
  float shadow_bias_{kDefaultShadowBias};
};

struct DirectionalLight {
  BaseLight base;
  CsmOptions csm_options;
};

struct Listener {};

using NodeKind = std::variant<Pivot, PointLight, DirectionalLight, Listener>;

// == Properties =======================================================================================================

using PropertyValue = std::variant<std::monostate, int64_t, uint64_t, float, double, std::string, NodeHandle>;

struct Property {
  std::string name;
  PropertyValue value;

  friend bool operator==(const Property&, const Property&) = default;
};

// == Node =============================================================================================================

class Node {
 public:
  Node() = default;
  explicit Node(std::string name, NodeKind kind = Pivot{});
  ~Node();

  VIREO_DELETE_COPY(Node)
  Node(Node&&) noexcept;
  Node& operator=(Node&&) noexcept;

  /**
   * @brief Creates a detached copy of the node: the hierarchy links are not copied, the script is cloned.
   *
   */
  [[nodiscard]] Node clone() const;

  const std::string& name() const { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  const std::string& tag() const { return tag_; }
  void set_tag(std::string tag) { tag_ = std::move(tag); }

  bool visibility() const { return visibility_; }
  void set_visibility(bool visibility) { visibility_ = visibility; }

  bool frustum_culling() const { return frustum_culling_; }
  void set_frustum_culling(bool frustum_culling) { frustum_culling_ = frustum_culling; }

  Mobility mobility() const { return mobility_; }
  void set_mobility(Mobility mobility) { mobility_ = mobility; }

  float depth_offset_factor() const { return depth_offset_; }

  /**
   * @brief The absolute value of `factor` is clamped to [0, 1].
   *
   */
  void set_depth_offset_factor(float factor);

  bool cast_shadows() const { return cast_shadows_; }
  void set_cast_shadows(bool cast_shadows) { cast_shadows_ = cast_shadows; }

  Transform& local_transform() { return transform_; }
  const Transform& local_transform() const { return transform_; }

  std::vector<Property>& properties() { return properties_; }
  const std::vector<Property>& properties() const { return properties_; }

  Script* script() { return script_.get(); }
  const Script* script() const { return script_.get(); }
  void set_script(std::unique_ptr<Script> script) { script_ = std::move(script); }
  std::unique_ptr<Script> take_script() { return std::move(script_); }

  NodeKind& kind() { return kind_; }
  const NodeKind& kind() const { return kind_; }

  template <typename TKind>
  TKind* as() {
    return std::get_if<TKind>(&kind_);
  }

  template <typename TKind>
  const TKind* as() const {
    return std::get_if<TKind>(&kind_);
  }

  /**
   * @brief Returns the light properties when the node is a light source.
   *
   */
  BaseLight* base_light();
  const BaseLight* base_light() const;

  NodeHandle parent() const { return parent_; }
  const std::vector<NodeHandle>& children() const { return children_; }

 private:
  friend class Graph;

  std::string name_;
  std::string tag_;
  bool visibility_{true};
  bool frustum_culling_{true};
  Mobility mobility_{Mobility::Dynamic};
  float depth_offset_{0.F};
  bool cast_shadows_{true};
  Transform transform_;
  std::vector<Property> properties_;
  std::unique_ptr<Script> script_;
  NodeKind kind_{Pivot{}};

  NodeHandle parent_;
  std::vector<NodeHandle> children_;
};

}  // namespace vireo::scene
