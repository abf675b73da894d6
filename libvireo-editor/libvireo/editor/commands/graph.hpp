#pragma once

#include <libvireo/editor/command.hpp>
#include <libvireo/scene/animation.hpp>
#include <libvireo/scene/graph.hpp>
#include <libvireo/scene/model.hpp>
#include <libvireo/scene/node.hpp>
#include <libvireo/scene/pool.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vireo::editor {

using ReservedNode      = std::pair<scene::NodeTicket, scene::Node>;
using ReservedAnimation = std::pair<scene::Ticket<scene::Animation>, scene::Animation>;

/**
 * @brief Attaches a node to a new parent. Every call swaps the stored parent with the current one, so execute and
 * revert are the same operation.
 *
 */
class LinkNodesCommand : public Command {
 public:
  LinkNodesCommand(scene::NodeHandle child, scene::NodeHandle parent) : child_(child), parent_(parent) {}

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;

 private:
  Result<void, CommandError> link(SceneContext& ctx);

  scene::NodeHandle child_;
  scene::NodeHandle parent_;
};

/**
 * @brief Adds a node to the graph. Reverting reserves the slot of the node, so the redo puts the node back under the
 * exact same handle.
 *
 */
class AddNodeCommand : public Command {
 public:
  AddNodeCommand(scene::Node node, scene::NodeHandle parent);

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;
  void finalize(SceneContext& ctx) override;

  /**
   * @brief Handle assigned on the first execution.
   *
   */
  scene::NodeHandle handle() const { return handle_; }

 private:
  std::optional<scene::Node> pending_;
  std::optional<ReservedNode> reserved_;
  scene::NodeHandle handle_;
  scene::NodeHandle parent_;
  size_t sibling_index_{};
  std::string cached_name_;
};

/**
 * @brief Removes a leaf node. The node is kept reserved until the command is finalized.
 *
 */
class DeleteNodeCommand : public Command {
 public:
  explicit DeleteNodeCommand(scene::NodeHandle handle) : handle_(handle) {}

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;
  void finalize(SceneContext& ctx) override;

 private:
  scene::NodeHandle handle_;
  scene::NodeHandle parent_;
  size_t sibling_index_{};
  std::optional<ReservedNode> reserved_;
};

/**
 * @brief Brings a reserved model instance (a sub-graph and its animations) into the scene. The command is created
 * with everything reserved, so it starts in the reverted state.
 *
 */
class AddModelCommand : public Command {
 public:
  AddModelCommand(scene::SubGraph sub_graph, std::vector<ReservedAnimation> animations);

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;
  void finalize(SceneContext& ctx) override;

  scene::NodeHandle model() const { return model_; }
  const std::vector<scene::AnimationHandle>& animations() const { return animation_handles_; }

 private:
  scene::NodeHandle model_;
  std::optional<scene::SubGraph> sub_graph_;
  std::vector<ReservedAnimation> animations_;

  /**
   * @brief Recorded once from the tickets, the handles never change afterwards.
   *
   */
  std::vector<scene::AnimationHandle> animation_handles_;
};

/**
 * @brief Reserves a freshly instantiated model and wraps it into a command, so that adding the model can be undone.
 *
 */
std::unique_ptr<AddModelCommand> make_add_model_command(scene::Scene& scene, const scene::ModelInstance& instance);

/**
 * @brief Removes a node together with all of its descendants.
 *
 */
class DeleteSubGraphCommand : public Command {
 public:
  explicit DeleteSubGraphCommand(scene::NodeHandle sub_graph_root) : sub_graph_root_(sub_graph_root) {}

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;
  void finalize(SceneContext& ctx) override;

 private:
  scene::NodeHandle sub_graph_root_;
  std::optional<scene::SubGraph> sub_graph_;
};

}  // namespace vireo::editor
