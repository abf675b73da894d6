#pragma once

#include <cstdint>
#include <functional>
#include <libvireo/scene/error.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vireo::scene {

class ResourceManager;

/**
 * @brief User-defined behavior attached to a node. Scripts are saved to and loaded from a JSON document, the
 * `ScriptRegistry` recreates the concrete type from its `type_name()`.
 *
 */
class Script {
 public:
  Script()          = default;
  virtual ~Script() = default;

  Script(const Script&)            = delete;
  Script& operator=(const Script&) = delete;

  [[nodiscard]] virtual std::string_view type_name() const = 0;

  [[nodiscard]] virtual std::unique_ptr<Script> clone() const = 0;

  [[nodiscard]] virtual nlohmann::json save() const = 0;

  virtual Result<void, SerializationError> load(const nlohmann::json& data) = 0;

  /**
   * @brief Called after the script was recreated from serialized data, so that it can look up the resources it
   * references by path.
   *
   */
  virtual void restore_resources(ResourceManager& /*resource_manager*/) {}
};

class ScriptRegistry {
 public:
  using Factory = std::function<std::unique_ptr<Script>()>;

  template <typename TScript>
    requires std::derived_from<TScript, Script>
  void register_script() {
    add(std::string(TScript::kTypeName), [] { return std::make_unique<TScript>(); });
  }

  void add(std::string type_name, Factory factory);

  [[nodiscard]] bool contains(std::string_view type_name) const;

  /**
   * @brief Returns a default-constructed script of the given type or nullptr when the type is not registered.
   *
   */
  [[nodiscard]] std::unique_ptr<Script> create(std::string_view type_name) const;

  [[nodiscard]] size_t size() const { return factories_.size(); }

 private:
  struct StringHash {
    using is_transparent = void;
    size_t operator()(std::string_view str) const { return std::hash<std::string_view>{}(str); }
  };

  std::unordered_map<std::string, Factory, StringHash, std::equal_to<>> factories_;
};

/**
 * @brief Environment needed to turn serialized scripts back into live objects.
 *
 */
struct SerializationContext {
  ScriptRegistry script_registry;
};

using ScriptBlob = std::vector<uint8_t>;

/**
 * @brief Writes the script (or its absence) into a binary CBOR buffer.
 *
 */
Result<ScriptBlob, SerializationError> serialize_script(const Script* script, const SerializationContext& ctx);

/**
 * @brief Reads a buffer produced by `serialize_script`. A buffer written for an absent script yields nullptr.
 *
 */
Result<std::unique_ptr<Script>, SerializationError> deserialize_script(std::span<const uint8_t> blob,
                                                                       const SerializationContext& ctx);

}  // namespace vireo::scene
