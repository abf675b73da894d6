#include <gtest/gtest.h>

#include <libvireo/editor/commands/node.hpp>
#include <tests/helpers/scene_fixture.hpp>

using namespace vireo::editor;  // NOLINT
using vireo::math::Quatf;
using vireo::math::Vec3f;
using vireo::scene::Node;
using vireo::scene::NodeHandle;

class NodeCommandsTest : public SceneFixture {
 protected:
  NodeCommandsTest() {
    node_        = graph().add_node(Node("node"));
    point_light_ = graph().add_node(Node("point", vireo::scene::PointLight{}));
    sun_         = graph().add_node(Node("sun", vireo::scene::DirectionalLight{}));
  }

  NodeHandle node_;
  NodeHandle point_light_;
  NodeHandle sun_;
};

TEST_F(NodeCommandsTest, MoveNodeTogglesBetweenPositions) {
  // given
  auto command = MoveNodeCommand(node_, Vec3f::zeros(), Vec3f(1.F, 2.F, 3.F));

  // when / then
  ASSERT_TRUE(command.execute(ctx_).has_value());
  EXPECT_EQ(graph()[node_].local_transform().position(), Vec3f(1.F, 2.F, 3.F));

  ASSERT_TRUE(command.revert(ctx_).has_value());
  EXPECT_EQ(graph()[node_].local_transform().position(), Vec3f::zeros());

  ASSERT_TRUE(command.execute(ctx_).has_value());
  EXPECT_EQ(graph()[node_].local_transform().position(), Vec3f(1.F, 2.F, 3.F));
  EXPECT_EQ(command.name(ctx_), "Move Node");
}

TEST_F(NodeCommandsTest, RotateAndScaleUseStoredValues) {
  // given
  const auto rotation = Quatf::rotation_y(1.F);
  auto rotate         = RotateNodeCommand(node_, Quatf::identity(), rotation);
  auto scale          = ScaleNodeCommand(node_, Vec3f::ones(), Vec3f::filled(2.F));

  // when
  ASSERT_TRUE(rotate.execute(ctx_).has_value());
  ASSERT_TRUE(scale.execute(ctx_).has_value());

  // then
  EXPECT_EQ(graph()[node_].local_transform().rotation(), rotation);
  EXPECT_EQ(graph()[node_].local_transform().scale(), Vec3f::filled(2.F));

  ASSERT_TRUE(scale.revert(ctx_).has_value());
  ASSERT_TRUE(rotate.revert(ctx_).has_value());
  EXPECT_EQ(graph()[node_].local_transform().rotation(), Quatf::identity());
  EXPECT_EQ(graph()[node_].local_transform().scale(), Vec3f::ones());
}

TEST_F(NodeCommandsTest, SwapCommandRestoresPreviousValue) {
  // given
  auto command = SetNameCommand(node_, "renamed");

  // when
  ASSERT_TRUE(command.execute(ctx_).has_value());

  // then
  EXPECT_EQ(graph()[node_].name(), "renamed");
  EXPECT_EQ(command.value(), "node");

  // when
  ASSERT_TRUE(command.revert(ctx_).has_value());

  // then
  EXPECT_EQ(graph()[node_].name(), "node");
  EXPECT_EQ(command.value(), "renamed");
}

TEST_F(NodeCommandsTest, NodeFlagsCanBeSwapped) {
  // given
  auto visible  = SetVisibleCommand(node_, false);
  auto mobility = SetMobilityCommand(node_, vireo::scene::Mobility::Static);
  auto shadows  = SetCastShadowsCommand(node_, false);
  auto culling  = SetFrustumCullingCommand(node_, false);
  auto tag      = SetTagCommand(node_, "enemy");

  // when
  ASSERT_TRUE(visible.execute(ctx_).has_value());
  ASSERT_TRUE(mobility.execute(ctx_).has_value());
  ASSERT_TRUE(shadows.execute(ctx_).has_value());
  ASSERT_TRUE(culling.execute(ctx_).has_value());
  ASSERT_TRUE(tag.execute(ctx_).has_value());

  // then
  const auto& node = graph()[node_];
  EXPECT_FALSE(node.visibility());
  EXPECT_EQ(node.mobility(), vireo::scene::Mobility::Static);
  EXPECT_FALSE(node.cast_shadows());
  EXPECT_FALSE(node.frustum_culling());
  EXPECT_EQ(node.tag(), "enemy");
}

TEST_F(NodeCommandsTest, DepthOffsetIsClampedBySetter) {
  // given
  auto command = SetDepthOffsetCommand(node_, -2.F);

  // when
  ASSERT_TRUE(command.execute(ctx_).has_value());

  // then
  EXPECT_EQ(graph()[node_].depth_offset_factor(), 1.F);
  ASSERT_TRUE(command.revert(ctx_).has_value());
  EXPECT_EQ(graph()[node_].depth_offset_factor(), 0.F);
}

TEST_F(NodeCommandsTest, TransformOffsetsAndPivotsCanBeSwapped) {
  auto offset = SetRotationOffsetCommand(node_, Vec3f(1.F, 0.F, 0.F));
  auto pivot  = SetScalePivotCommand(node_, Vec3f(0.F, 1.F, 0.F));
  auto pre    = SetPreRotationCommand(node_, Quatf::rotation_x(0.5F));

  ASSERT_TRUE(offset.execute(ctx_).has_value());
  ASSERT_TRUE(pivot.execute(ctx_).has_value());
  ASSERT_TRUE(pre.execute(ctx_).has_value());

  const auto& transform = graph()[node_].local_transform();
  EXPECT_EQ(transform.rotation_offset(), Vec3f(1.F, 0.F, 0.F));
  EXPECT_EQ(transform.scaling_pivot(), Vec3f(0.F, 1.F, 0.F));
  EXPECT_EQ(transform.pre_rotation(), Quatf::rotation_x(0.5F));
}

TEST_F(NodeCommandsTest, PointLightFieldsAreSwapped) {
  // given
  auto radius = SetPointLightRadiusCommand(point_light_, -5.F);
  auto bias   = SetPointLightShadowBiasCommand(point_light_, 0.5F);

  // when
  ASSERT_TRUE(radius.execute(ctx_).has_value());
  ASSERT_TRUE(bias.execute(ctx_).has_value());

  // then
  const auto* light = graph()[point_light_].as<vireo::scene::PointLight>();
  EXPECT_EQ(light->radius(), 5.F);
  EXPECT_EQ(light->shadow_bias(), 0.5F);

  ASSERT_TRUE(radius.revert(ctx_).has_value());
  EXPECT_EQ(light->radius(), vireo::scene::PointLight::kDefaultRadius);
}

TEST_F(NodeCommandsTest, CsmOptionsAreSwapped) {
  // given
  auto options          = vireo::scene::CsmOptions();
  options.split_options = vireo::scene::RelativeFrustumSplit{};
  options.set_shadow_bias(0.01F);
  auto command = SetCsmOptionsCommand(sun_, options);

  // when
  ASSERT_TRUE(command.execute(ctx_).has_value());

  // then
  EXPECT_EQ(graph()[sun_].as<vireo::scene::DirectionalLight>()->csm_options, options);
  ASSERT_TRUE(command.revert(ctx_).has_value());
  EXPECT_EQ(graph()[sun_].as<vireo::scene::DirectionalLight>()->csm_options, vireo::scene::CsmOptions());
}

TEST_F(NodeCommandsTest, LightColorWorksForEveryLight) {
  auto point = SetLightColorCommand(point_light_, Vec3f(1.F, 0.F, 0.F));
  auto sun   = SetLightIntensityCommand(sun_, 3.F);

  ASSERT_TRUE(point.execute(ctx_).has_value());
  ASSERT_TRUE(sun.execute(ctx_).has_value());

  EXPECT_EQ(graph()[point_light_].base_light()->color, Vec3f(1.F, 0.F, 0.F));
  EXPECT_EQ(graph()[sun_].base_light()->intensity, 3.F);
}

TEST_F(NodeCommandsTest, LightCommandOnWrongPayloadFails) {
  // given
  auto radius = SetPointLightRadiusCommand(sun_, 3.F);
  auto color  = SetLightColorCommand(node_, Vec3f::zeros());

  // when
  auto radius_result = radius.execute(ctx_);
  auto color_result  = color.execute(ctx_);

  // then
  ASSERT_FALSE(radius_result.has_value());
  EXPECT_TRUE(radius_result.error().has_code<CommandErrorCode::PayloadMismatch>());
  ASSERT_FALSE(color_result.has_value());
  EXPECT_TRUE(color_result.error().has_code<CommandErrorCode::PayloadMismatch>());
  EXPECT_EQ(radius.value(), 3.F);
}

TEST_F(NodeCommandsTest, StaleHandleIsReported) {
  // given
  graph().remove_node(node_);
  auto command = MoveNodeCommand(node_, Vec3f::zeros(), Vec3f::ones());

  // when
  auto result = command.execute(ctx_);

  // then
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().has_code<CommandErrorCode::InvalidHandle>());
}
