#include <fmt/format.h>

#include <libvireo/editor/commands/script.hpp>
#include <libvireo/util/match.hpp>
#include <libvireo/util/try.hpp>
#include <utility>

namespace vireo::editor {

namespace {

CommandError invalid_transition(std::string_view operation) {
  return CommandError{
      .msg  = fmt::format("Set Script can not {} in its current state", operation),
      .code = CommandErrorCode::InvalidState{},
  };
}

CommandError serialization_failure(scene::SerializationError error) {
  auto msg = fmt::format("Script serialization failed: {}", error.msg);
  return CommandError{
      .msg  = std::move(msg),
      .code = CommandErrorCode::Serialization{.error = std::move(error)},
  };
}

}  // namespace

// == SetScriptCommand =================================================================================================

std::string SetScriptCommand::name(const SceneContext& /*ctx*/) const { return "Set Script Command"; }

Result<void, CommandError> SetScriptCommand::execute(SceneContext& ctx) {
  TRY_UNWRAP_DEFINE(node, borrow_node(ctx.scene.graph, handle_));

  // The state is Undefined only for the duration of the transition. Failures restore the previous state.
  auto state  = std::exchange(state_, Undefined{});
  auto result = std::visit(
      util::match{
          [&](NonExecuted& non_executed) -> Result<void, CommandError> {
            node->set_script(std::move(non_executed.script));
            return {};
          },
          [&](Reverted& reverted) -> Result<void, CommandError> {
            TRY_UNWRAP_DEFINE_MAP_ERR(script, scene::deserialize_script(reverted.data, ctx.serialization_context),
                                      serialization_failure);
            node->set_script(std::move(script));
            ctx.resource_manager.restore_resources(ctx.scene.graph, handle_);
            return {};
          },
          [](auto&) -> Result<void, CommandError> { return std::unexpected(invalid_transition("execute")); },
      },
      state);

  if (result) {
    state_ = Executed{};
  } else {
    state_ = std::move(state);
  }
  return result;
}

Result<void, CommandError> SetScriptCommand::revert(SceneContext& ctx) {
  TRY_UNWRAP_DEFINE(node, borrow_node(ctx.scene.graph, handle_));
  if (!std::holds_alternative<Executed>(state_)) {
    return std::unexpected(invalid_transition("revert"));
  }

  // Serialized before the script is taken off the node, so a failure leaves the node untouched.
  TRY_UNWRAP_DEFINE_MAP_ERR(data, scene::serialize_script(node->script(), ctx.serialization_context),
                            serialization_failure);

  node->take_script();
  state_ = Reverted{.data = std::move(data)};
  return {};
}

// == ScriptDataBlobCommand ============================================================================================

std::string ScriptDataBlobCommand::name(const SceneContext& /*ctx*/) const { return "Change Script Property"; }

Result<void, CommandError> ScriptDataBlobCommand::execute(SceneContext& ctx) { return swap(ctx); }

Result<void, CommandError> ScriptDataBlobCommand::revert(SceneContext& ctx) { return swap(ctx); }

Result<void, CommandError> ScriptDataBlobCommand::swap(SceneContext& ctx) {
  TRY_UNWRAP_DEFINE(node, borrow_node(ctx.scene.graph, handle_));
  if (node->script() == nullptr) {
    return std::unexpected(CommandError{
        .msg  = "Node has no script to change",
        .code = CommandErrorCode::MissingScript{},
    });
  }

  auto script = scene::deserialize_script(new_value_, ctx.serialization_context);
  if (!script) {
    return std::unexpected(serialization_failure(std::move(script.error())));
  }
  if (*script == nullptr) {
    return std::unexpected(CommandError{
        .msg  = "Script data holds no script",
        .code = CommandErrorCode::MissingScript{},
    });
  }

  std::swap(old_value_, new_value_);
  node->set_script(std::move(*script));
  ctx.resource_manager.restore_resources(ctx.scene.graph, handle_);
  return {};
}

}  // namespace vireo::editor
