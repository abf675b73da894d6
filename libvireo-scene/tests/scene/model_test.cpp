#include <gtest/gtest.h>

#include <libvireo/scene/model.hpp>
#include <libvireo/scene/scene.hpp>

using namespace vireo::scene;  // NOLINT
using vireo::math::Vec3f;

class ModelTest : public testing::Test {
 protected:
  ModelTest() : model_("models/lamp.mdl") {
    auto& graph = model_.graph();
    base_       = graph.add_node(Node("Base"));
    bulb_       = graph.add_node(Node("Bulb", PointLight{}));
    graph.link_nodes(bulb_, base_);
    graph[base_].properties().push_back(Property{.name = "bulb", .value = bulb_});
    model_.set_root(base_);

    auto swing = Animation("Swing");
    swing.add_track(Track{
        .node      = bulb_,
        .keyframes = {{.time = 0.F, .position = Vec3f(0.F, 0.F, 0.F)},
                      {.time = 2.F, .position = Vec3f(2.F, 0.F, 0.F)}},
        .enabled   = true,
    });
    model_.animations().push_back(std::move(swing));
  }

  Model model_;
  NodeHandle base_;
  NodeHandle bulb_;
};

TEST_F(ModelTest, InstantiateCopiesPrototypeTree) {
  // given
  auto scene = Scene();

  // when
  auto instance = model_.instantiate(scene);

  // then
  ASSERT_TRUE(instance.has_value());
  EXPECT_EQ(scene.graph.node_count(), 3);
  EXPECT_EQ(scene.graph[instance->root].name(), "Base");
  EXPECT_EQ(scene.graph[instance->root].parent(), scene.graph.root());

  const auto& children = scene.graph[instance->root].children();
  ASSERT_EQ(children.size(), 1);
  EXPECT_EQ(scene.graph[children[0]].name(), "Bulb");
  EXPECT_NE(scene.graph[children[0]].as<PointLight>(), nullptr);
}

TEST_F(ModelTest, NodePropertiesPointToCopies) {
  // given
  auto scene = Scene();

  // when
  auto instance = model_.instantiate(scene);

  // then
  ASSERT_TRUE(instance.has_value());
  const auto& properties = scene.graph[instance->root].properties();
  ASSERT_EQ(properties.size(), 1);
  const auto* target = std::get_if<NodeHandle>(&properties[0].value);
  ASSERT_NE(target, nullptr);
  EXPECT_EQ(*target, scene.graph[instance->root].children()[0]);
}

TEST_F(ModelTest, AnimationsDriveInstantiatedNodes) {
  // given
  auto scene    = Scene();
  auto instance = model_.instantiate(scene);
  ASSERT_TRUE(instance.has_value());
  ASSERT_EQ(instance->animations.size(), 1);
  const auto bulb = scene.graph[instance->root].children()[0];

  // when
  scene.update(1.F);

  // then
  EXPECT_TRUE(vireo::math::eps_eq(scene.graph[bulb].local_transform().position(), Vec3f(1.F, 0.F, 0.F), 1e-5F));
  EXPECT_TRUE(model_.graph()[bulb_].local_transform().position() == Vec3f::zeros());
}

TEST_F(ModelTest, FailedInstantiationLeavesSceneUntouched) {
  // given
  auto broken = Animation("Broken");
  broken.add_track(Track{.node = NodeHandle::compose(99, 1), .keyframes = {}, .enabled = true});
  model_.animations().push_back(std::move(broken));
  auto scene = Scene();

  // when
  auto instance = model_.instantiate(scene);

  // then
  ASSERT_FALSE(instance.has_value());
  EXPECT_TRUE(instance.error().has_code<InstantiationErrorCode::InvalidTrack>());
  EXPECT_EQ(scene.graph.node_count(), 1);
  EXPECT_EQ(scene.animations.alive_count(), 0);
}

TEST(ModelBasicTest, EmptyPrototypeCannotBeInstantiated) {
  const auto model = Model("models/empty.mdl");
  auto scene       = Scene();

  auto instance = model.instantiate(scene);

  ASSERT_FALSE(instance.has_value());
  EXPECT_TRUE(instance.error().has_code<InstantiationErrorCode::EmptyPrototype>());
}

TEST(AnimationTest, TickWrapsLoopedAndClampsOneShot) {
  // given
  auto looped = Animation("looped");
  looped.add_track(Track{.node = NodeHandle(), .keyframes = {{.time = 0.F, .position = {}}, {.time = 1.F, .position = {}}}});
  auto once = Animation("once");
  once.add_track(Track{.node = NodeHandle(), .keyframes = {{.time = 0.F, .position = {}}, {.time = 1.F, .position = {}}}});
  once.set_looped(false);

  // when
  looped.tick(1.5F);
  once.tick(1.5F);

  // then
  EXPECT_FLOAT_EQ(looped.time_position(), 0.5F);
  EXPECT_FLOAT_EQ(once.time_position(), 1.F);
}

TEST(AnimationTest, RetargetMatchesNodesByName) {
  // given
  auto src      = Graph();
  auto src_node = src.add_node(Node("Arm"));
  auto dst      = Graph();
  auto dst_root = dst.add_node(Node("Character"));
  auto dst_arm  = dst.add_node(Node("Arm"));
  dst.link_nodes(dst_arm, dst_root);

  auto animation = Animation("wave");
  animation.add_track(Track{.node = src_node, .keyframes = {}, .enabled = true});

  // when
  auto retargeted = animation.retarget(src, dst, dst_root);
  auto missing    = animation.retarget(src, dst, dst.add_node(Node("Other")));

  // then
  ASSERT_TRUE(retargeted.has_value());
  EXPECT_EQ(retargeted->tracks()[0].node, dst_arm);
  EXPECT_EQ(retargeted->name(), "wave");
  ASSERT_FALSE(missing.has_value());
  ASSERT_TRUE(missing.error().has_code<InstantiationErrorCode::MissingTargetNode>());
  EXPECT_EQ(missing.error().get_code<InstantiationErrorCode::MissingTargetNode>().node_name, "Arm");
}
