#pragma once

#include <libvireo/scene/resource_manager.hpp>
#include <libvireo/scene/scene.hpp>
#include <libvireo/scene/script.hpp>
#include <libvireo/util/logger.hpp>

namespace vireo::editor {

/**
 * @brief Everything a command may touch. The context is rebuilt for every call, commands must not keep references to
 * its members.
 *
 */
struct SceneContext {
  scene::Scene& scene;
  scene::SerializationContext& serialization_context;
  scene::ResourceManager& resource_manager;
  util::Logger& logger;
};

}  // namespace vireo::editor
