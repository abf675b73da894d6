#pragma once

#include <filesystem>
#include <libvireo/scene/error.hpp>
#include <libvireo/scene/graph.hpp>
#include <libvireo/scene/model.hpp>
#include <libvireo/scene/texture.hpp>
#include <libvireo/util/logger.hpp>
#include <memory>
#include <string>
#include <unordered_map>

namespace vireo::scene {

/**
 * @brief In-memory registry of the resources a scene refers to. Resources are registered up front and requested by
 * path.
 *
 */
class ResourceManager {
 public:
  explicit ResourceManager(util::Logger& logger) : logger_(logger) {}

  void register_texture(Texture texture);
  void register_model(std::shared_ptr<const Model> model);

  /**
   * @brief Returns nullptr when no texture with this path was registered.
   *
   */
  [[nodiscard]] std::shared_ptr<const Texture> request_texture(const std::filesystem::path& path) const;

  [[nodiscard]] Result<std::shared_ptr<const Model>, ResourceError> request_model(
      const std::filesystem::path& path) const;

  /**
   * @brief Looks the texture up by the path stored in the reference. Returns false if the texture is unknown.
   *
   */
  bool resolve(TextureRef& texture) const;

  /**
   * @brief Re-resolves resource references of a node: the references held by its script and its light cookie.
   *
   */
  void restore_resources(Graph& graph, NodeHandle node);

  [[nodiscard]] size_t texture_count() const { return textures_.size(); }
  [[nodiscard]] size_t model_count() const { return models_.size(); }

 private:
  util::Logger& logger_;
  std::unordered_map<std::string, std::shared_ptr<const Texture>> textures_;
  std::unordered_map<std::string, std::shared_ptr<const Model>> models_;
};

}  // namespace vireo::scene
