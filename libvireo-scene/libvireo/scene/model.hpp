#pragma once

#include <filesystem>
#include <libvireo/scene/animation.hpp>
#include <libvireo/scene/error.hpp>
#include <libvireo/scene/graph.hpp>
#include <libvireo/scene/scene.hpp>
#include <string_view>
#include <vector>

namespace vireo::scene {

/**
 * @brief Handles of everything a single `Model::instantiate` call created in a scene.
 *
 */
struct ModelInstance {
  NodeHandle root;
  std::vector<AnimationHandle> animations;
};

/**
 * @brief Model resource: a prototype node tree together with the animations of that tree. Instances are deep copies
 * of the prototype.
 *
 */
class Model {
 public:
  explicit Model(std::filesystem::path path) : path_(std::move(path)) {}

  const std::filesystem::path& path() const { return path_; }

  Graph& graph() { return graph_; }
  const Graph& graph() const { return graph_; }

  /**
   * @brief Root of the prototype tree, a node of `graph()`.
   *
   */
  NodeHandle root() const { return root_; }
  void set_root(NodeHandle root) { root_ = root; }

  std::vector<Animation>& animations() { return animations_; }
  const std::vector<Animation>& animations() const { return animations_; }

  [[nodiscard]] const Animation* find_animation(std::string_view name) const;

  /**
   * @brief Copies the prototype tree under the scene root and adds copies of the animations retargeted onto the copied
   * nodes. On failure nothing is left in the scene.
   *
   */
  [[nodiscard]] Result<ModelInstance, InstantiationError> instantiate(Scene& scene) const;

 private:
  std::filesystem::path path_;
  Graph graph_;
  NodeHandle root_;
  std::vector<Animation> animations_;
};

}  // namespace vireo::scene
