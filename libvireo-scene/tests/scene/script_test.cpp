#include <gtest/gtest.h>

#include <libvireo/scene/resource_manager.hpp>
#include <libvireo/scene/script.hpp>
#include <libvireo/util/logger.hpp>
#include <tests/helpers/test_script.hpp>
#include <vector>

using namespace vireo::scene;  // NOLINT

class ScriptSerializationTest : public testing::Test {
 protected:
  ScriptSerializationTest() { ctx_.script_registry.register_script<CounterScript>(); }

  SerializationContext ctx_;
};

TEST(ScriptRegistryTest, CreatesRegisteredTypes) {
  // given
  auto registry = ScriptRegistry();
  registry.register_script<CounterScript>();

  // when
  auto script  = registry.create("CounterScript");
  auto missing = registry.create("Missing");

  // then
  EXPECT_EQ(registry.size(), 1);
  EXPECT_TRUE(registry.contains("CounterScript"));
  ASSERT_NE(script, nullptr);
  EXPECT_EQ(script->type_name(), "CounterScript");
  EXPECT_EQ(missing, nullptr);
}

TEST_F(ScriptSerializationTest, RestoresScriptState) {
  // given
  const auto original = CounterScript(7, "textures/a.png");

  // when
  auto blob = serialize_script(&original, ctx_);
  ASSERT_TRUE(blob.has_value());
  auto restored = deserialize_script(*blob, ctx_);

  // then
  ASSERT_TRUE(restored.has_value());
  const auto* script = dynamic_cast<const CounterScript*>(restored->get());
  ASSERT_NE(script, nullptr);
  EXPECT_EQ(script->counter(), 7);
  EXPECT_EQ(script->texture().path.generic_string(), "textures/a.png");
  EXPECT_FALSE(script->texture().is_resolved());
}

TEST_F(ScriptSerializationTest, AbsentScriptRestoresAsNull) {
  // when
  auto blob = serialize_script(nullptr, ctx_);
  ASSERT_TRUE(blob.has_value());
  auto restored = deserialize_script(*blob, ctx_);

  // then
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, nullptr);
}

TEST_F(ScriptSerializationTest, UnregisteredTypeCannotBeSerialized) {
  // given
  const auto script = UnregisteredScript();

  // when
  auto blob = serialize_script(&script, ctx_);

  // then
  ASSERT_FALSE(blob.has_value());
  ASSERT_TRUE(blob.error().has_code<SerializationErrorCode::UnknownScriptType>());
  EXPECT_EQ(blob.error().get_code<SerializationErrorCode::UnknownScriptType>().type_name, "UnregisteredScript");
}

TEST_F(ScriptSerializationTest, UnknownTypeCannotBeDeserialized) {
  // given
  const auto script = CounterScript(1);
  auto blob         = serialize_script(&script, ctx_);
  ASSERT_TRUE(blob.has_value());
  const auto empty_ctx = SerializationContext();

  // when
  auto restored = deserialize_script(*blob, empty_ctx);

  // then
  ASSERT_FALSE(restored.has_value());
  EXPECT_TRUE(restored.error().has_code<SerializationErrorCode::UnknownScriptType>());
}

TEST_F(ScriptSerializationTest, MalformedBlobIsRejected) {
  // given
  const auto blob = std::vector<uint8_t>{0xFF, 0x00, 0x13};

  // when
  auto restored = deserialize_script(blob, ctx_);

  // then
  ASSERT_FALSE(restored.has_value());
  EXPECT_TRUE(restored.error().has_code<SerializationErrorCode::MalformedData>());
}

TEST_F(ScriptSerializationTest, InvalidFieldIsReported) {
  // given
  auto document      = nlohmann::json::object();
  document["script"] = {{"type", "CounterScript"}, {"data", {{"counter", "many"}}}};
  const auto blob    = nlohmann::json::to_cbor(document);

  // when
  auto restored = deserialize_script(blob, ctx_);

  // then
  ASSERT_FALSE(restored.has_value());
  ASSERT_TRUE(restored.error().has_code<SerializationErrorCode::InvalidField>());
  EXPECT_EQ(restored.error().get_code<SerializationErrorCode::InvalidField>().field, "counter");
}

TEST(ResourceManagerTest, RestoreResourcesResolvesScriptAndCookie) {
  // given
  auto logger           = vireo::util::Logger();
  auto resource_manager = ResourceManager(logger);
  resource_manager.register_texture(Texture{.path = "textures/a.png", .width = 4, .height = 4});

  auto graph   = Graph();
  auto handle  = graph.add_node(Node("lamp", PointLight{}));
  auto& node   = graph[handle];
  node.set_script(std::make_unique<CounterScript>(1, "textures/a.png"));
  node.base_light()->cookie_texture.path = "textures/a.png";

  // when
  resource_manager.restore_resources(graph, handle);

  // then
  const auto* script = dynamic_cast<const CounterScript*>(graph[handle].script());
  ASSERT_NE(script, nullptr);
  EXPECT_TRUE(script->texture().is_resolved());
  EXPECT_EQ(script->texture().data->width, 4);
  EXPECT_TRUE(graph[handle].base_light()->cookie_texture.is_resolved());
}

TEST(ResourceManagerTest, UnknownTextureIsNotResolved) {
  // given
  auto logger           = vireo::util::Logger();
  auto resource_manager = ResourceManager(logger);
  auto texture          = TextureRef{.path = "textures/missing.png", .data = nullptr};
  auto empty            = TextureRef();

  // when / then
  EXPECT_FALSE(resource_manager.resolve(texture));
  EXPECT_FALSE(texture.is_resolved());
  EXPECT_TRUE(resource_manager.resolve(empty));
}

TEST(ResourceManagerTest, UnknownModelIsNotFound) {
  auto logger           = vireo::util::Logger();
  auto resource_manager = ResourceManager(logger);

  auto model = resource_manager.request_model("models/missing.mdl");

  ASSERT_FALSE(model.has_value());
  EXPECT_EQ(model.error().code, ResourceErrorCode::NotFound);
}
