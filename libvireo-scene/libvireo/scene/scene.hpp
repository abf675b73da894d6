#pragma once

#include <libvireo/scene/animation.hpp>
#include <libvireo/scene/graph.hpp>
#include <libvireo/scene/machine.hpp>
#include <libvireo/scene/pool.hpp>

namespace vireo::scene {

/**
 * @brief A graph of nodes together with the animations and state machines that drive them. Animations refer to the
 * nodes by handle, so they have to be moved in and out of the scene together with the nodes.
 *
 */
struct Scene {
  Graph graph;
  Pool<Animation> animations;
  Pool<Machine> animation_machines;

  /**
   * @brief Advances every enabled animation by `dt` and writes the sampled positions to the graph.
   *
   */
  void update(float dt);
};

}  // namespace vireo::scene
