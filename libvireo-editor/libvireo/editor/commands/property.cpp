#include <libvireo/editor/commands/property.hpp>
#include <utility>

namespace vireo::editor {

CommandError invalid_index(size_t index, size_t size) {
  return CommandError{
      .msg  = fmt::format("Index {} is out of range, the collection has {} items", index, size),
      .code = CommandErrorCode::InvalidIndex{.index = index, .size = size},
  };
}

namespace {

Result<scene::Property*, CommandError> borrow_property(SceneContext& ctx, scene::NodeHandle handle, size_t index) {
  TRY_UNWRAP_DEFINE(node, borrow_node(ctx.scene.graph, handle));
  auto& properties = node->properties();
  if (index >= properties.size()) {
    return std::unexpected(invalid_index(index, properties.size()));
  }
  return &properties[index];
}

}  // namespace

std::string SetPropertyValueCommand::name(const SceneContext& /*ctx*/) const { return "Set Property Value"; }

Result<void, CommandError> SetPropertyValueCommand::execute(SceneContext& ctx) { return swap(ctx); }

Result<void, CommandError> SetPropertyValueCommand::revert(SceneContext& ctx) { return swap(ctx); }

Result<void, CommandError> SetPropertyValueCommand::swap(SceneContext& ctx) {
  TRY_UNWRAP_DEFINE(property, borrow_property(ctx, handle_, index_));
  std::swap(property->value, value_);
  return {};
}

std::string SetPropertyNameCommand::name(const SceneContext& /*ctx*/) const { return "Set Property Name"; }

Result<void, CommandError> SetPropertyNameCommand::execute(SceneContext& ctx) { return swap(ctx); }

Result<void, CommandError> SetPropertyNameCommand::revert(SceneContext& ctx) { return swap(ctx); }

Result<void, CommandError> SetPropertyNameCommand::swap(SceneContext& ctx) {
  TRY_UNWRAP_DEFINE(property, borrow_property(ctx, handle_, index_));
  std::swap(property->name, name_);
  return {};
}

}  // namespace vireo::editor
