#include <cstdint>
#include <filesystem>
#include <libvireo/editor/command_stack.hpp>
#include <libvireo/editor/commands/graph.hpp>
#include <libvireo/editor/commands/node.hpp>
#include <libvireo/editor/commands/property.hpp>
#include <libvireo/editor/commands/script.hpp>
#include <libvireo/editor/settings.hpp>
#include <libvireo/scene/model.hpp>
#include <libvireo/scene/resource_manager.hpp>
#include <libvireo/scene/scene.hpp>
#include <libvireo/util/logger.hpp>
#include <memory>
#include <sandbox/blink_script.hpp>

using namespace vireo;  // NOLINT

namespace {

std::shared_ptr<scene::Model> build_lamp_model() {
  auto model = std::make_shared<scene::Model>("models/lamp.mdl");
  auto& graph = model->graph();

  auto base = graph.add_node(scene::Node("Base"));
  auto bulb = graph.add_node(scene::Node("Bulb", scene::PointLight{}));
  graph.link_nodes(bulb, base);
  model->set_root(base);

  auto swing = scene::Animation("Swing");
  swing.add_track(scene::Track{
      .node      = bulb,
      .keyframes = {{.time = 0.F, .position = math::Vec3f(0.F, 1.F, 0.F)},
                    {.time = 1.F, .position = math::Vec3f(0.5F, 1.F, 0.F)}},
      .enabled   = true,
  });
  model->animations().push_back(std::move(swing));
  return model;
}

}  // namespace

int main() {
  auto settings = editor::EditorSettings();
  auto loaded   = editor::EditorSettings::load("vireo.json");
  if (loaded) {
    settings = *loaded;
  }

  auto logger = editor::make_logger(settings);
  if (!loaded && loaded.error().code != editor::SettingsErrorCode::FileNotFound) {
    logger->warn("Using default settings. Reason: {}", loaded.error().msg);
  }

  auto world                 = scene::Scene();
  auto serialization_context = scene::SerializationContext();
  serialization_context.script_registry.register_script<sandbox::BlinkScript>();

  auto resource_manager = scene::ResourceManager(*logger);
  resource_manager.register_texture(scene::Texture{.path = "textures/cookie.png", .width = 64, .height = 64});
  auto lamp = build_lamp_model();
  resource_manager.register_model(lamp);

  auto ctx = editor::SceneContext{
      .scene                 = world,
      .serialization_context = serialization_context,
      .resource_manager      = resource_manager,
      .logger                = *logger,
  };
  auto stack = editor::CommandStack(settings.max_history);

  auto add_pivot = std::make_unique<editor::AddNodeCommand>(scene::Node("Pivot"), world.graph.root());
  auto* add_pivot_raw = add_pivot.get();
  stack.do_command(std::move(add_pivot), ctx).or_panic(*logger, "Could not add the pivot");

  // The stack may evict and destroy the command on any later push.
  const auto pivot = add_pivot_raw->handle();

  stack
      .do_command(std::make_unique<editor::MoveNodeCommand>(pivot, math::Vec3f::zeros(),
                                                            math::Vec3f(1.F, 2.F, 3.F)),
                  ctx)
      .or_panic(*logger);
  stack
      .do_command(std::make_unique<editor::AddPropertyCommand>(
                      pivot, scene::Property{.name = "health", .value = int64_t{100}}),
                  ctx)
      .or_panic(*logger);
  stack
      .do_command(std::make_unique<editor::SetScriptCommand>(
                      pivot, std::make_unique<sandbox::BlinkScript>(0.5F, "textures/cookie.png")),
                  ctx)
      .or_panic(*logger);

  if (auto instance = lamp->instantiate(world)) {
    auto model = instance->root;
    stack.do_command(editor::make_add_model_command(world, *instance), ctx).or_panic(*logger);
    stack.do_command(std::make_unique<editor::LinkNodesCommand>(model, pivot), ctx).or_panic(*logger);
    stack.do_command(std::make_unique<editor::DeleteSubGraphCommand>(model), ctx).or_panic(*logger);
  } else {
    logger->err("Could not instantiate the lamp. Reason: {}", instance.error().msg);
  }

  for (int i = 0; i < 3; ++i) {
    logger->verify(stack.undo(ctx));
  }
  logger->verify(stack.redo(ctx));

  for (const auto& name : stack.names(ctx)) {
    logger->info("History: {}", name);
  }
  logger->info("Scene holds {} nodes and {} animations", world.graph.node_count(), world.animations.alive_count());

  world.update(0.25F);
  stack.clear(ctx);

  return 0;
}
