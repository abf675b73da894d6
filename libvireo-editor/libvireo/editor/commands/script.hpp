#pragma once

#include <libvireo/editor/command.hpp>
#include <libvireo/scene/node.hpp>
#include <libvireo/scene/script.hpp>
#include <memory>
#include <string>
#include <variant>

namespace vireo::editor {

/**
 * @brief Attaches a script to a node. A reverted script is kept in its serialized form, and it is recreated through
 * the serialization context on redo.
 *
 */
class SetScriptCommand : public Command {
 public:
  struct Undefined {};
  struct NonExecuted {
    std::unique_ptr<scene::Script> script;
  };
  struct Executed {};
  struct Reverted {
    scene::ScriptBlob data;
  };

  using State = std::variant<Undefined, NonExecuted, Executed, Reverted>;

  /**
   * @brief A null `script` removes the current script of the node.
   *
   */
  SetScriptCommand(scene::NodeHandle handle, std::unique_ptr<scene::Script> script)
      : handle_(handle), state_(NonExecuted{.script = std::move(script)}) {}

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;

  const State& state() const { return state_; }

 private:
  scene::NodeHandle handle_;
  State state_;
};

/**
 * @brief Replaces the script of a node with the one deserialized from the "new" blob and swaps the blobs.
 *
 */
class ScriptDataBlobCommand : public Command {
 public:
  ScriptDataBlobCommand(scene::NodeHandle handle, scene::ScriptBlob old_value, scene::ScriptBlob new_value)
      : handle_(handle), old_value_(std::move(old_value)), new_value_(std::move(new_value)) {}

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;

 private:
  Result<void, CommandError> swap(SceneContext& ctx);

  scene::NodeHandle handle_;
  scene::ScriptBlob old_value_;
  scene::ScriptBlob new_value_;
};

}  // namespace vireo::editor
