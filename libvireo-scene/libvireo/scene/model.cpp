#include <algorithm>
#include <libvireo/scene/model.hpp>
#include <unordered_map>

namespace vireo::scene {

const Animation* Model::find_animation(std::string_view name) const {
  auto it = std::ranges::find(animations_, name, &Animation::name);
  return it == animations_.end() ? nullptr : &*it;
}

Result<ModelInstance, InstantiationError> Model::instantiate(Scene& scene) const {
  if (!graph_.is_valid_handle(root_)) {
    return std::unexpected(InstantiationError{
        .msg  = "Model has no prototype tree",
        .code = InstantiationErrorCode::EmptyPrototype{},
    });
  }

  auto mapping = std::unordered_map<NodeHandle, NodeHandle>();
  for (auto handle : graph_.traverse_handles(root_)) {
    const auto& prototype = graph_[handle];
    auto copy             = scene.graph.add_node(prototype.clone());
    if (handle != root_) {
      scene.graph.link_nodes(copy, mapping.at(prototype.parent()));
    }
    mapping.emplace(handle, copy);
  }
  const auto instance_root = mapping.at(root_);

  // Properties referring to nodes of the prototype must point to the copies.
  for (const auto& [prototype, copy] : mapping) {
    for (auto& property : scene.graph[copy].properties()) {
      if (auto* target = std::get_if<NodeHandle>(&property.value)) {
        if (auto it = mapping.find(*target); it != mapping.end()) {
          *target = it->second;
        }
      }
    }
  }

  auto animations = std::vector<Animation>();
  animations.reserve(animations_.size());
  for (const auto& animation : animations_) {
    auto retargeted = animation.remap(mapping);
    if (!retargeted) {
      scene.graph.remove_node(instance_root);
      return std::unexpected(std::move(retargeted.error()));
    }
    animations.push_back(std::move(*retargeted));
  }

  auto instance = ModelInstance{.root = instance_root, .animations = {}};
  instance.animations.reserve(animations.size());
  for (auto& animation : animations) {
    instance.animations.push_back(scene.animations.spawn(std::move(animation)));
  }

  return instance;
}

}  // namespace vireo::scene
