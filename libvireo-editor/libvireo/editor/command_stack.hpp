#pragma once

#include <cstddef>
#include <libvireo/editor/command.hpp>
#include <libvireo/editor/error.hpp>
#include <libvireo/editor/scene_context.hpp>
#include <libvireo/util/ruleof.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vireo::editor {

/**
 * @brief Undo/redo history. Commands below `top` are executed, commands above it are reverted and can be redone.
 *
 * @note `finalize` is called exactly once for every command that entered the stack, so the stack must be cleared
 * with `clear` before it is destroyed.
 */
class CommandStack {
 public:
  explicit CommandStack(size_t max_capacity);
  ~CommandStack();

  VIREO_DELETE_COPY(CommandStack)

  /**
   * @brief Drops the redo tail, executes the command and pushes it. When the command fails nothing is pushed and the
   * error is returned. Exceeding the capacity finalizes and drops the oldest command.
   *
   */
  Result<void, CommandError> do_command(std::unique_ptr<Command> command, SceneContext& ctx);

  /**
   * @brief Reverts the top command. Returns false if there is nothing to undo.
   *
   */
  Result<bool, CommandError> undo(SceneContext& ctx);

  /**
   * @brief Executes the first reverted command. Returns false if there is nothing to redo.
   *
   */
  Result<bool, CommandError> redo(SceneContext& ctx);

  /**
   * @brief Finalizes and drops every command.
   *
   */
  void clear(SceneContext& ctx);

  [[nodiscard]] bool can_undo() const { return top_ > 0; }
  [[nodiscard]] bool can_redo() const { return top_ < commands_.size(); }

  [[nodiscard]] size_t len() const { return commands_.size(); }
  [[nodiscard]] bool is_empty() const { return commands_.empty(); }
  [[nodiscard]] size_t max_capacity() const { return max_capacity_; }

  /**
   * @brief Name of the command that would be reverted by `undo`.
   *
   */
  [[nodiscard]] std::optional<std::string> top_name(const SceneContext& ctx) const;

  /**
   * @brief Names of all commands, the oldest first.
   *
   */
  [[nodiscard]] std::vector<std::string> names(const SceneContext& ctx) const;

 private:
  void drop_redo_tail(SceneContext& ctx);

  std::vector<std::unique_ptr<Command>> commands_;

  /**
   * @brief Number of executed commands.
   *
   */
  size_t top_{0};
  size_t max_capacity_;
};

}  // namespace vireo::editor
