#include <cassert>
#include <libvireo/editor/command_stack.hpp>

namespace vireo::editor {

CommandStack::CommandStack(size_t max_capacity) : max_capacity_(max_capacity) {
  assert(max_capacity_ > 0 && "Command stack capacity must be positive");
}

CommandStack::~CommandStack() {
  assert(commands_.empty() && "Command stack must be cleared before destruction, otherwise commands are not finalized");
}

void CommandStack::drop_redo_tail(SceneContext& ctx) {
  while (commands_.size() > top_) {
    auto command = std::move(commands_.back());
    commands_.pop_back();
    ctx.logger.debug("Finalizing reverted command \"{}\"", command->name(ctx));
    command->finalize(ctx);
  }
}

Result<void, CommandError> CommandStack::do_command(std::unique_ptr<Command> command, SceneContext& ctx) {
  // Reverted commands only hold reserved slots, so the redo tail survives a failed command.
  if (auto result = command->execute(ctx); !result) {
    ctx.logger.err("Command \"{}\" failed. Reason: {}", command->name(ctx), result.error().msg);
    return result;
  }
  ctx.logger.info("Executed \"{}\"", command->name(ctx));

  drop_redo_tail(ctx);
  commands_.push_back(std::move(command));
  ++top_;

  if (commands_.size() > max_capacity_) {
    auto oldest = std::move(commands_.front());
    commands_.erase(commands_.begin());
    --top_;
    oldest->finalize(ctx);
  }

  return {};
}

Result<bool, CommandError> CommandStack::undo(SceneContext& ctx) {
  if (!can_undo()) {
    return false;
  }

  auto& command = commands_[top_ - 1];
  if (auto result = command->revert(ctx); !result) {
    ctx.logger.err("Undo of \"{}\" failed. Reason: {}", command->name(ctx), result.error().msg);
    return std::unexpected(result.error());
  }
  ctx.logger.info("Undo \"{}\"", command->name(ctx));

  --top_;
  return true;
}

Result<bool, CommandError> CommandStack::redo(SceneContext& ctx) {
  if (!can_redo()) {
    return false;
  }

  auto& command = commands_[top_];
  if (auto result = command->execute(ctx); !result) {
    ctx.logger.err("Redo of \"{}\" failed. Reason: {}", command->name(ctx), result.error().msg);
    return std::unexpected(result.error());
  }
  ctx.logger.info("Redo \"{}\"", command->name(ctx));

  ++top_;
  return true;
}

void CommandStack::clear(SceneContext& ctx) {
  for (auto& command : commands_) {
    command->finalize(ctx);
  }
  commands_.clear();
  top_ = 0;
}

std::optional<std::string> CommandStack::top_name(const SceneContext& ctx) const {
  if (!can_undo()) {
    return std::nullopt;
  }
  return commands_[top_ - 1]->name(ctx);
}

std::vector<std::string> CommandStack::names(const SceneContext& ctx) const {
  auto result = std::vector<std::string>();
  result.reserve(commands_.size());
  for (const auto& command : commands_) {
    result.push_back(command->name(ctx));
  }
  return result;
}

}  // namespace vireo::editor
