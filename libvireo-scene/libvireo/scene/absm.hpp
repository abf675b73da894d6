#pragma once

#include <cstdint>
#include <filesystem>
#include <libvireo/scene/error.hpp>
#include <libvireo/scene/machine.hpp>
#include <libvireo/scene/resource_manager.hpp>
#include <libvireo/scene/scene.hpp>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <vector>

namespace vireo::scene {

struct StateDefinition {
  std::string name;

  /**
   * @brief Path of the model resource that owns the animation.
   *
   */
  std::filesystem::path model;
  std::string animation;
};

struct TransitionDefinition {
  std::string name;
  std::string source;
  std::string dest;
  float duration{};
  std::string rule;
};

/**
 * @brief Serializable description of an animation blending state machine. States refer to other states and
 * animations by name.
 *
 */
struct MachineDefinition {
  std::vector<StateDefinition> states;
  std::vector<TransitionDefinition> transitions;
  std::string entry_state;

  [[nodiscard]] nlohmann::json save() const;
  static Result<MachineDefinition, MachineInstantiationError> load(const nlohmann::json& data);
};

/**
 * @brief Animation blending state machine resource stored as a binary (CBOR) file.
 *
 */
class AbsmResource {
 public:
  AbsmResource(std::filesystem::path path, MachineDefinition definition)
      : path_(std::move(path)), definition_(std::move(definition)) {}

  static Result<AbsmResource, MachineInstantiationError> from_file(const std::filesystem::path& path);
  static Result<AbsmResource, MachineInstantiationError> from_memory(std::span<const uint8_t> data,
                                                                     std::filesystem::path path = {});

  [[nodiscard]] std::vector<uint8_t> to_memory() const;
  [[nodiscard]] Result<void, ResourceError> save(const std::filesystem::path& path) const;

  const std::filesystem::path& path() const { return path_; }
  const MachineDefinition& definition() const { return definition_; }

  /**
   * @brief Creates a machine driving the hierarchy that starts at `root`. Every state animation is retargeted onto
   * that hierarchy and added to the scene. If any animation can not be loaded or retargeted the whole instantiation
   * fails and the scene is left untouched.
   *
   */
  [[nodiscard]] Result<MachineHandle, MachineInstantiationError> instantiate(NodeHandle root, Scene& scene,
                                                                             const ResourceManager& resource_manager) const;

 private:
  std::filesystem::path path_;
  MachineDefinition definition_;
};

}  // namespace vireo::scene
