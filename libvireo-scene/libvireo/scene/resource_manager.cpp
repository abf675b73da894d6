#include <libvireo/scene/resource_manager.hpp>

namespace vireo::scene {

void ResourceManager::register_texture(Texture texture) {
  auto key = texture.path.generic_string();
  textures_.insert_or_assign(std::move(key), std::make_shared<const Texture>(std::move(texture)));
}

void ResourceManager::register_model(std::shared_ptr<const Model> model) {
  auto key = model->path().generic_string();
  models_.insert_or_assign(std::move(key), std::move(model));
}

std::shared_ptr<const Texture> ResourceManager::request_texture(const std::filesystem::path& path) const {
  if (auto it = textures_.find(path.generic_string()); it != textures_.end()) {
    return it->second;
  }
  return nullptr;
}

Result<std::shared_ptr<const Model>, ResourceError> ResourceManager::request_model(
    const std::filesystem::path& path) const {
  if (auto it = models_.find(path.generic_string()); it != models_.end()) {
    return it->second;
  }

  logger_.err(R"(Requested model "{}" is not registered.)", path.string());
  return std::unexpected(ResourceError{
      .path = path,
      .msg  = "Model is not registered.",
      .code = ResourceErrorCode::NotFound,
  });
}

bool ResourceManager::resolve(TextureRef& texture) const {
  if (texture.path.empty()) {
    texture.data = nullptr;
    return true;
  }

  texture.data = request_texture(texture.path);
  if (!texture.data) {
    logger_.warn(R"(Unable to resolve texture "{}".)", texture.path.string());
    return false;
  }
  return true;
}

void ResourceManager::restore_resources(Graph& graph, NodeHandle node) {
  auto* n = graph.try_get(node);
  if (n == nullptr) {
    return;
  }

  if (auto* script = n->script()) {
    script->restore_resources(*this);
  }
  if (auto* light = n->base_light()) {
    resolve(light->cookie_texture);
  }
}

}  // namespace vireo::scene
