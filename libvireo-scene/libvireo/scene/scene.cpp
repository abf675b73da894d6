#include <cstddef>
#include <libvireo/scene/scene.hpp>

namespace vireo::scene {

void Scene::update(float dt) {
  for (auto handle : animation_machines.handles()) {
    auto& machine = animation_machines[handle];
    machine.evaluate();

    // Only the active state plays.
    for (size_t i = 0; i < machine.states().size(); ++i) {
      if (auto* animation = animations.try_borrow(machine.states()[i].animation)) {
        animation->set_enabled(i == machine.active_state_index());
      }
    }
  }

  for (auto handle : animations.handles()) {
    auto& animation = animations[handle];
    animation.tick(dt);
    animation.apply(graph);
  }
}

}  // namespace vireo::scene
