#include <fmt/format.h>

#include <libvireo/editor/command.hpp>

namespace vireo::editor {

Result<scene::Node*, CommandError> borrow_node(scene::Graph& graph, scene::NodeHandle handle) {
  if (auto* node = graph.try_get(handle)) {
    return node;
  }
  return std::unexpected(CommandError{
      .msg  = fmt::format("Node handle {:#x} does not refer to a live node", handle.value),
      .code = CommandErrorCode::InvalidHandle{},
  });
}

std::string CommandGroup::name(const SceneContext& ctx) const {
  if (commands_.size() == 1) {
    return commands_.front()->name(ctx);
  }
  return fmt::format("{} ({})", name_, commands_.size());
}

Result<void, CommandError> CommandGroup::execute(SceneContext& ctx) {
  for (size_t i = 0; i < commands_.size(); ++i) {
    if (auto result = commands_[i]->execute(ctx); !result) {
      for (size_t j = i; j > 0; --j) {
        commands_[j - 1]->revert(ctx).or_panic(ctx.logger, "Rollback of a partially executed group failed");
      }
      return result;
    }
  }
  return {};
}

Result<void, CommandError> CommandGroup::revert(SceneContext& ctx) {
  for (size_t i = commands_.size(); i > 0; --i) {
    if (auto result = commands_[i - 1]->revert(ctx); !result) {
      for (size_t j = i; j < commands_.size(); ++j) {
        commands_[j]->execute(ctx).or_panic(ctx.logger, "Rollback of a partially reverted group failed");
      }
      return result;
    }
  }
  return {};
}

void CommandGroup::finalize(SceneContext& ctx) {
  for (auto& command : commands_) {
    command->finalize(ctx);
  }
}

}  // namespace vireo::editor
