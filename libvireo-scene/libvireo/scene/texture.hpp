#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

namespace vireo::scene {

struct Texture {
  std::filesystem::path path;
  uint32_t width{};
  uint32_t height{};
};

/**
 * @brief Reference to a texture resource. Only the path is meaningful across serialization, the data pointer is
 * resolved again through `ResourceManager::resolve`.
 *
 */
struct TextureRef {
  std::filesystem::path path;
  std::shared_ptr<const Texture> data;

  [[nodiscard]] bool is_resolved() const { return data != nullptr; }

  friend bool operator==(const TextureRef& lhs, const TextureRef& rhs) { return lhs.path == rhs.path; }
};

}  // namespace vireo::scene
