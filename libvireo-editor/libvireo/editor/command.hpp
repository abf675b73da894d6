#pragma once

#include <libvireo/editor/error.hpp>
#include <libvireo/editor/scene_context.hpp>
#include <memory>
#include <string>
#include <vector>

namespace vireo::editor {

/**
 * @brief Reversible change of a scene. `execute` and `revert` are always called alternately, starting with
 * `execute`. A revert followed by an execute must leave the scene in exactly the same state as the first execute
 * did, with the same handles.
 *
 */
class Command {
 public:
  Command()          = default;
  virtual ~Command() = default;

  Command(const Command&)            = delete;
  Command& operator=(const Command&) = delete;

  /**
   * @brief Label shown in the history.
   *
   */
  [[nodiscard]] virtual std::string name(const SceneContext& ctx) const = 0;

  virtual Result<void, CommandError> execute(SceneContext& ctx) = 0;
  virtual Result<void, CommandError> revert(SceneContext& ctx)  = 0;

  /**
   * @brief Called exactly once, when the command leaves the history for good. Commands holding reserved objects
   * release them here.
   *
   */
  virtual void finalize(SceneContext& /*ctx*/) {}
};

/**
 * @brief Executes a list of commands as a single undoable step.
 *
 */
class CommandGroup : public Command {
 public:
  CommandGroup() = default;
  explicit CommandGroup(std::vector<std::unique_ptr<Command>> commands, std::string name = "Command Group")
      : commands_(std::move(commands)), name_(std::move(name)) {}

  void push(std::unique_ptr<Command> command) { commands_.push_back(std::move(command)); }
  [[nodiscard]] bool is_empty() const { return commands_.empty(); }
  [[nodiscard]] size_t size() const { return commands_.size(); }

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;

  /**
   * @brief Executes the children in order. When one of them fails, the already executed ones are reverted and the
   * error is returned.
   *
   */
  Result<void, CommandError> execute(SceneContext& ctx) override;

  /**
   * @brief Reverts the children in reverse order. When one of them fails, the already reverted ones are executed
   * again, so the group stays fully executed.
   *
   */
  Result<void, CommandError> revert(SceneContext& ctx) override;

  void finalize(SceneContext& ctx) override;

 private:
  std::vector<std::unique_ptr<Command>> commands_;
  std::string name_{"Command Group"};
};

/**
 * @brief Returns the node or an `InvalidHandle` error if the handle does not refer to a live node.
 *
 */
Result<scene::Node*, CommandError> borrow_node(scene::Graph& graph, scene::NodeHandle handle);

}  // namespace vireo::editor
