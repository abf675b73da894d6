#pragma once

#include <concepts>
#include <libvireo/editor/command.hpp>
#include <libvireo/math/quat.hpp>
#include <libvireo/math/vec.hpp>
#include <libvireo/scene/node.hpp>
#include <libvireo/util/try.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace vireo::editor {

/**
 * @brief Describes a single node field: its value type, the history label and the way it is read and written.
 * Accessors of payload fields fail when the node has a different payload.
 *
 */
template <typename TField>
concept CNodeField = requires(scene::Node& node, const scene::Node& cnode, const typename TField::Value& value) {
  { TField::kLabel } -> std::convertible_to<std::string_view>;
  { TField::get(cnode) } -> std::same_as<Result<typename TField::Value, CommandError>>;
  { TField::set(node, value) } -> std::same_as<Result<void, CommandError>>;
};

/**
 * @brief Holds a single value and exchanges it with the node field on every execute and revert.
 *
 */
template <CNodeField TField>
class SwapNodeFieldCommand : public Command {
 public:
  using Value = typename TField::Value;

  SwapNodeFieldCommand(scene::NodeHandle node, Value value) : node_(node), value_(std::move(value)) {}

  [[nodiscard]] std::string name(const SceneContext& /*ctx*/) const override { return std::string(TField::kLabel); }

  Result<void, CommandError> execute(SceneContext& ctx) override { return swap(ctx); }
  Result<void, CommandError> revert(SceneContext& ctx) override { return swap(ctx); }

  scene::NodeHandle node() const { return node_; }
  const Value& value() const { return value_; }

 private:
  Result<void, CommandError> swap(SceneContext& ctx) {
    TRY_UNWRAP_DEFINE(node, borrow_node(ctx.scene.graph, node_));
    TRY_UNWRAP_DEFINE(current, TField::get(*node));
    TRY(TField::set(*node, value_));
    value_ = std::move(current);
    return {};
  }

  scene::NodeHandle node_;
  Value value_;
};

/**
 * @brief Holds the old and the new value of a node field. Every call applies the "new" value and swaps the pair, so
 * that the next call applies the other one.
 *
 */
template <CNodeField TField>
class ChangeNodeFieldCommand : public Command {
 public:
  using Value = typename TField::Value;

  ChangeNodeFieldCommand(scene::NodeHandle node, Value old_value, Value new_value)
      : node_(node), old_value_(std::move(old_value)), new_value_(std::move(new_value)) {}

  [[nodiscard]] std::string name(const SceneContext& /*ctx*/) const override { return std::string(TField::kLabel); }

  Result<void, CommandError> execute(SceneContext& ctx) override { return apply(ctx); }
  Result<void, CommandError> revert(SceneContext& ctx) override { return apply(ctx); }

  scene::NodeHandle node() const { return node_; }

 private:
  Value swap() {
    auto value = new_value_;
    std::swap(new_value_, old_value_);
    return value;
  }

  Result<void, CommandError> apply(SceneContext& ctx) {
    TRY_UNWRAP_DEFINE(node, borrow_node(ctx.scene.graph, node_));
    return TField::set(*node, swap());
  }

  scene::NodeHandle node_;
  Value old_value_;
  Value new_value_;
};

// == Field accessors ==================================================================================================

namespace field {

CommandError payload_mismatch(std::string_view expected);

template <typename TValue, auto TGetter, auto TSetter>
struct TransformField {
  using Value = TValue;

  static Result<Value, CommandError> get(const scene::Node& node) { return (node.local_transform().*TGetter)(); }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    (node.local_transform().*TSetter)(value);
    return {};
  }
};

template <typename TValue, auto TGetter, auto TSetter>
struct BaseField {
  using Value = TValue;

  static Result<Value, CommandError> get(const scene::Node& node) { return (node.*TGetter)(); }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    (node.*TSetter)(value);
    return {};
  }
};

struct Position : TransformField<math::Vec3f, &scene::Transform::position, &scene::Transform::set_position> {
  static constexpr std::string_view kLabel = "Move Node";
};

struct Scale : TransformField<math::Vec3f, &scene::Transform::scale, &scene::Transform::set_scale> {
  static constexpr std::string_view kLabel = "Scale Node";
};

struct Rotation : TransformField<math::Quatf, &scene::Transform::rotation, &scene::Transform::set_rotation> {
  static constexpr std::string_view kLabel = "Rotate Node";
};

struct PreRotation
    : TransformField<math::Quatf, &scene::Transform::pre_rotation, &scene::Transform::set_pre_rotation> {
  static constexpr std::string_view kLabel = "Set Pre Rotation";
};

struct PostRotation
    : TransformField<math::Quatf, &scene::Transform::post_rotation, &scene::Transform::set_post_rotation> {
  static constexpr std::string_view kLabel = "Set Post Rotation";
};

struct RotationOffset
    : TransformField<math::Vec3f, &scene::Transform::rotation_offset, &scene::Transform::set_rotation_offset> {
  static constexpr std::string_view kLabel = "Set Rotation Offset";
};

struct RotationPivot
    : TransformField<math::Vec3f, &scene::Transform::rotation_pivot, &scene::Transform::set_rotation_pivot> {
  static constexpr std::string_view kLabel = "Set Rotation Pivot";
};

struct ScalingOffset
    : TransformField<math::Vec3f, &scene::Transform::scaling_offset, &scene::Transform::set_scaling_offset> {
  static constexpr std::string_view kLabel = "Set Scaling Offset";
};

struct ScalingPivot
    : TransformField<math::Vec3f, &scene::Transform::scaling_pivot, &scene::Transform::set_scaling_pivot> {
  static constexpr std::string_view kLabel = "Set Scaling Pivot";
};

struct Name {
  using Value                              = std::string;
  static constexpr std::string_view kLabel = "Set Name";

  static Result<Value, CommandError> get(const scene::Node& node) { return node.name(); }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    node.set_name(value);
    return {};
  }
};

struct Tag {
  using Value                              = std::string;
  static constexpr std::string_view kLabel = "Set Tag";

  static Result<Value, CommandError> get(const scene::Node& node) { return node.tag(); }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    node.set_tag(value);
    return {};
  }
};

struct Visibility : BaseField<bool, &scene::Node::visibility, &scene::Node::set_visibility> {
  static constexpr std::string_view kLabel = "Set Visible";
};

struct FrustumCulling : BaseField<bool, &scene::Node::frustum_culling, &scene::Node::set_frustum_culling> {
  static constexpr std::string_view kLabel = "Set Frustum Culling";
};

struct Mobility : BaseField<scene::Mobility, &scene::Node::mobility, &scene::Node::set_mobility> {
  static constexpr std::string_view kLabel = "Set Mobility";
};

struct DepthOffset : BaseField<float, &scene::Node::depth_offset_factor, &scene::Node::set_depth_offset_factor> {
  static constexpr std::string_view kLabel = "Set Depth Offset";
};

struct CastShadows : BaseField<bool, &scene::Node::cast_shadows, &scene::Node::set_cast_shadows> {
  static constexpr std::string_view kLabel = "Set Cast Shadows";
};

struct PointLightRadius {
  using Value                              = float;
  static constexpr std::string_view kLabel = "Set Point Light Radius";

  static Result<Value, CommandError> get(const scene::Node& node) {
    if (const auto* light = node.as<scene::PointLight>()) {
      return light->radius();
    }
    return std::unexpected(payload_mismatch("point light"));
  }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    if (auto* light = node.as<scene::PointLight>()) {
      light->set_radius(value);
      return {};
    }
    return std::unexpected(payload_mismatch("point light"));
  }
};

struct PointLightShadowBias {
  using Value                              = float;
  static constexpr std::string_view kLabel = "Set Point Light Shadow Bias";

  static Result<Value, CommandError> get(const scene::Node& node) {
    if (const auto* light = node.as<scene::PointLight>()) {
      return light->shadow_bias();
    }
    return std::unexpected(payload_mismatch("point light"));
  }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    if (auto* light = node.as<scene::PointLight>()) {
      light->set_shadow_bias(value);
      return {};
    }
    return std::unexpected(payload_mismatch("point light"));
  }
};

struct DirectionalLightCsmOptions {
  using Value                              = scene::CsmOptions;
  static constexpr std::string_view kLabel = "Set Csm Options";

  static Result<Value, CommandError> get(const scene::Node& node) {
    if (const auto* light = node.as<scene::DirectionalLight>()) {
      return light->csm_options;
    }
    return std::unexpected(payload_mismatch("directional light"));
  }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    if (auto* light = node.as<scene::DirectionalLight>()) {
      light->csm_options = value;
      return {};
    }
    return std::unexpected(payload_mismatch("directional light"));
  }
};

struct LightColor {
  using Value                              = math::Vec3f;
  static constexpr std::string_view kLabel = "Set Light Color";

  static Result<Value, CommandError> get(const scene::Node& node) {
    if (const auto* light = node.base_light()) {
      return light->color;
    }
    return std::unexpected(payload_mismatch("light"));
  }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    if (auto* light = node.base_light()) {
      light->color = value;
      return {};
    }
    return std::unexpected(payload_mismatch("light"));
  }
};

struct LightIntensity {
  using Value                              = float;
  static constexpr std::string_view kLabel = "Set Light Intensity";

  static Result<Value, CommandError> get(const scene::Node& node) {
    if (const auto* light = node.base_light()) {
      return light->intensity;
    }
    return std::unexpected(payload_mismatch("light"));
  }
  static Result<void, CommandError> set(scene::Node& node, const Value& value) {
    if (auto* light = node.base_light()) {
      light->intensity = value;
      return {};
    }
    return std::unexpected(payload_mismatch("light"));
  }
};

}  // namespace field

using MoveNodeCommand   = ChangeNodeFieldCommand<field::Position>;
using ScaleNodeCommand  = ChangeNodeFieldCommand<field::Scale>;
using RotateNodeCommand = ChangeNodeFieldCommand<field::Rotation>;

using SetNameCommand           = SwapNodeFieldCommand<field::Name>;
using SetTagCommand            = SwapNodeFieldCommand<field::Tag>;
using SetVisibleCommand        = SwapNodeFieldCommand<field::Visibility>;
using SetFrustumCullingCommand = SwapNodeFieldCommand<field::FrustumCulling>;
using SetMobilityCommand       = SwapNodeFieldCommand<field::Mobility>;
using SetDepthOffsetCommand    = SwapNodeFieldCommand<field::DepthOffset>;
using SetCastShadowsCommand    = SwapNodeFieldCommand<field::CastShadows>;
using SetPreRotationCommand    = SwapNodeFieldCommand<field::PreRotation>;
using SetPostRotationCommand   = SwapNodeFieldCommand<field::PostRotation>;
using SetRotationOffsetCommand = SwapNodeFieldCommand<field::RotationOffset>;
using SetRotationPivotCommand  = SwapNodeFieldCommand<field::RotationPivot>;
using SetScaleOffsetCommand    = SwapNodeFieldCommand<field::ScalingOffset>;
using SetScalePivotCommand     = SwapNodeFieldCommand<field::ScalingPivot>;

using SetPointLightRadiusCommand     = SwapNodeFieldCommand<field::PointLightRadius>;
using SetPointLightShadowBiasCommand = SwapNodeFieldCommand<field::PointLightShadowBias>;
using SetCsmOptionsCommand           = SwapNodeFieldCommand<field::DirectionalLightCsmOptions>;
using SetLightColorCommand           = SwapNodeFieldCommand<field::LightColor>;
using SetLightIntensityCommand       = SwapNodeFieldCommand<field::LightIntensity>;

}  // namespace vireo::editor
