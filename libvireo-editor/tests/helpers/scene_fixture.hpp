#pragma once
#include <gtest/gtest.h>

#include <libvireo/editor/scene_context.hpp>
#include <libvireo/scene/resource_manager.hpp>
#include <libvireo/scene/scene.hpp>
#include <libvireo/scene/script.hpp>
#include <libvireo/util/logger.hpp>
#include <tests/helpers/test_script.hpp>

/**
 * @brief Scene with everything a command needs to run.
 *
 */
class SceneFixture : public testing::Test {
 protected:
  SceneFixture()
      : logger_(vireo::util::LogLevel::Warn),
        resource_manager_(logger_),
        ctx_{
            .scene                 = scene_,
            .serialization_context = serialization_context_,
            .resource_manager      = resource_manager_,
            .logger                = logger_,
        } {
    serialization_context_.script_registry.register_script<CounterScript>();
  }

  vireo::scene::Graph& graph() { return scene_.graph; }
  vireo::scene::NodeHandle root() const { return scene_.graph.root(); }

  vireo::util::Logger logger_;
  vireo::scene::Scene scene_;
  vireo::scene::SerializationContext serialization_context_;
  vireo::scene::ResourceManager resource_manager_;
  vireo::editor::SceneContext ctx_;
};
