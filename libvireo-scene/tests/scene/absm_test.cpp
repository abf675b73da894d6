#include <gtest/gtest.h>

#include <filesystem>
#include <libvireo/scene/absm.hpp>
#include <libvireo/scene/model.hpp>
#include <libvireo/scene/resource_manager.hpp>
#include <libvireo/scene/scene.hpp>
#include <libvireo/util/logger.hpp>
#include <memory>
#include <vector>

using namespace vireo::scene;  // NOLINT
using vireo::math::Vec3f;

class AbsmTest : public testing::Test {
 protected:
  AbsmTest() : resource_manager_(logger_) {
    auto model = std::make_shared<Model>("models/character.mdl");
    auto& graph = model->graph();
    auto body   = graph.add_node(Node("Body"));
    auto leg    = graph.add_node(Node("Leg"));
    graph.link_nodes(leg, body);
    model->set_root(body);

    auto idle = Animation("Idle");
    idle.add_track(Track{.node = body, .keyframes = {{.time = 1.F, .position = Vec3f(0.F, 1.F, 0.F)}}, .enabled = true});
    auto walk = Animation("Walk");
    walk.add_track(Track{.node = leg, .keyframes = {{.time = 1.F, .position = Vec3f(1.F, 0.F, 0.F)}}, .enabled = true});
    model->animations().push_back(std::move(idle));
    model->animations().push_back(std::move(walk));
    resource_manager_.register_model(std::move(model));

    character_ = scene_.graph.add_node(Node("Body"));
    leg_       = scene_.graph.add_node(Node("Leg"));
    scene_.graph.link_nodes(leg_, character_);

    definition_ = MachineDefinition{
        .states =
            {
                StateDefinition{.name = "idle", .model = "models/character.mdl", .animation = "Idle"},
                StateDefinition{.name = "walk", .model = "models/character.mdl", .animation = "Walk"},
            },
        .transitions =
            {
                TransitionDefinition{
                    .name = "idle_to_walk", .source = "idle", .dest = "walk", .duration = 0.3F, .rule = "moving"},
            },
        .entry_state = "idle",
    };
  }

  vireo::util::Logger logger_;
  ResourceManager resource_manager_;
  Scene scene_;
  NodeHandle character_;
  NodeHandle leg_;
  MachineDefinition definition_;
};

TEST_F(AbsmTest, InstantiateCreatesMachineAndAnimations) {
  // given
  const auto resource = AbsmResource("machines/character.absm", definition_);

  // when
  auto machine = resource.instantiate(character_, scene_, resource_manager_);

  // then
  ASSERT_TRUE(machine.has_value());
  EXPECT_EQ(scene_.animations.alive_count(), 2);
  const auto& m = scene_.animation_machines[*machine];
  EXPECT_EQ(m.root(), character_);
  EXPECT_EQ(m.active_state().name, "idle");
  EXPECT_EQ(m.resource().generic_string(), "machines/character.absm");
  EXPECT_EQ(scene_.animations[m.states()[1].animation].tracks()[0].node, leg_);
}

TEST_F(AbsmTest, TransitionFollowsRuleParameter) {
  // given
  const auto resource = AbsmResource("machines/character.absm", definition_);
  auto handle         = resource.instantiate(character_, scene_, resource_manager_);
  ASSERT_TRUE(handle.has_value());
  auto& machine = scene_.animation_machines[*handle];

  // when / then
  EXPECT_FALSE(machine.evaluate());
  EXPECT_EQ(machine.active_state_index(), 0);

  machine.set_parameter("moving", true);
  EXPECT_TRUE(machine.evaluate());
  EXPECT_EQ(machine.active_state().name, "walk");
}

TEST_F(AbsmTest, SceneUpdatePlaysOnlyActiveState) {
  // given
  const auto resource = AbsmResource("machines/character.absm", definition_);
  auto handle         = resource.instantiate(character_, scene_, resource_manager_);
  ASSERT_TRUE(handle.has_value());

  // when
  scene_.update(0.5F);

  // then
  EXPECT_EQ(scene_.graph[character_].local_transform().position(), Vec3f(0.F, 1.F, 0.F));
  EXPECT_EQ(scene_.graph[leg_].local_transform().position(), Vec3f::zeros());

  // when
  scene_.animation_machines[*handle].set_parameter("moving", true);
  scene_.update(0.5F);

  // then
  EXPECT_EQ(scene_.graph[leg_].local_transform().position(), Vec3f(1.F, 0.F, 0.F));
}

TEST_F(AbsmTest, MissingTargetNodeLeavesSceneUntouched) {
  // given
  scene_.graph.remove_node(leg_);
  const auto resource = AbsmResource("machines/character.absm", definition_);

  // when
  auto machine = resource.instantiate(character_, scene_, resource_manager_);

  // then
  ASSERT_FALSE(machine.has_value());
  ASSERT_TRUE(machine.error().has_code<MachineInstantiationErrorCode::Retargeting>());
  const auto& code = machine.error().get_code<MachineInstantiationErrorCode::Retargeting>();
  EXPECT_EQ(code.state, "walk");
  EXPECT_TRUE(code.error.has_code<InstantiationErrorCode::MissingTargetNode>());
  EXPECT_EQ(scene_.animations.alive_count(), 0);
  EXPECT_EQ(scene_.animation_machines.alive_count(), 0);
}

TEST_F(AbsmTest, MissingAnimationIsReported) {
  // given
  definition_.states[1].animation = "Run";
  const auto resource             = AbsmResource("machines/character.absm", definition_);

  // when
  auto machine = resource.instantiate(character_, scene_, resource_manager_);

  // then
  ASSERT_FALSE(machine.has_value());
  ASSERT_TRUE(machine.error().has_code<MachineInstantiationErrorCode::MissingAnimation>());
  EXPECT_EQ(machine.error().get_code<MachineInstantiationErrorCode::MissingAnimation>().animation, "Run");
  EXPECT_EQ(scene_.animations.alive_count(), 0);
}

TEST_F(AbsmTest, UnknownModelIsReported) {
  // given
  definition_.states[0].model = "models/missing.mdl";
  const auto resource         = AbsmResource("machines/character.absm", definition_);

  // when
  auto machine = resource.instantiate(character_, scene_, resource_manager_);

  // then
  ASSERT_FALSE(machine.has_value());
  ASSERT_TRUE(machine.error().has_code<MachineInstantiationErrorCode::ResourceLoad>());
  EXPECT_EQ(machine.error().get_code<MachineInstantiationErrorCode::ResourceLoad>().error.code,
            ResourceErrorCode::NotFound);
}

TEST_F(AbsmTest, UnknownEntryStateIsInvalid) {
  definition_.entry_state = "jump";
  const auto resource     = AbsmResource("machines/character.absm", definition_);

  auto machine = resource.instantiate(character_, scene_, resource_manager_);

  ASSERT_FALSE(machine.has_value());
  EXPECT_TRUE(machine.error().has_code<MachineInstantiationErrorCode::InvalidDefinition>());
}

TEST_F(AbsmTest, ResourceIsReadBackFromMemory) {
  // given
  const auto bytes = AbsmResource("machines/character.absm", definition_).to_memory();

  // when
  auto resource = AbsmResource::from_memory(bytes, "machines/copy.absm");

  // then
  ASSERT_TRUE(resource.has_value());
  EXPECT_EQ(resource->path().generic_string(), "machines/copy.absm");
  const auto& definition = resource->definition();
  ASSERT_EQ(definition.states.size(), 2);
  EXPECT_EQ(definition.states[1].model.generic_string(), "models/character.mdl");
  ASSERT_EQ(definition.transitions.size(), 1);
  EXPECT_EQ(definition.transitions[0].rule, "moving");
  EXPECT_FLOAT_EQ(definition.transitions[0].duration, 0.3F);
  EXPECT_EQ(definition.entry_state, "idle");
}

TEST(AbsmResourceTest, MalformedBytesAreRejected) {
  const auto bytes = std::vector<uint8_t>{0x01, 0x02, 0x03};

  auto resource = AbsmResource::from_memory(bytes);

  ASSERT_FALSE(resource.has_value());
  EXPECT_TRUE(resource.error().has_code<MachineInstantiationErrorCode::Deserialization>());
}

TEST(AbsmResourceTest, IncompleteDefinitionIsRejected) {
  auto document       = nlohmann::json::object();
  document["machine"] = {{"states", nlohmann::json::array({{{"name", "idle"}}})}, {"entry_state", "idle"}};
  const auto bytes    = nlohmann::json::to_cbor(document);

  auto resource = AbsmResource::from_memory(bytes);

  ASSERT_FALSE(resource.has_value());
  EXPECT_TRUE(resource.error().has_code<MachineInstantiationErrorCode::InvalidDefinition>());
}

TEST(AbsmResourceTest, MissingFileIsReported) {
  auto resource = AbsmResource::from_file(std::filesystem::temp_directory_path() / "vireo_missing.absm");

  ASSERT_FALSE(resource.has_value());
  ASSERT_TRUE(resource.error().has_code<MachineInstantiationErrorCode::ResourceLoad>());
  EXPECT_EQ(resource.error().get_code<MachineInstantiationErrorCode::ResourceLoad>().error.code,
            ResourceErrorCode::NotFound);
}

TEST(AbsmResourceTest, SavedFileCanBeLoaded) {
  // given
  const auto path        = std::filesystem::temp_directory_path() / "vireo_saved.absm";
  auto definition        = MachineDefinition();
  definition.states      = {StateDefinition{.name = "idle", .model = "models/a.mdl", .animation = "Idle"}};
  definition.entry_state = "idle";

  // when
  auto saved  = AbsmResource(path, definition).save(path);
  auto loaded = AbsmResource::from_file(path);

  // then
  ASSERT_TRUE(saved.has_value());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->path() == path);
  EXPECT_EQ(loaded->definition().states[0].animation, "Idle");

  std::filesystem::remove(path);
}
