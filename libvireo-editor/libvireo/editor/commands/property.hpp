#pragma once

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <libvireo/editor/command.hpp>
#include <libvireo/scene/node.hpp>
#include <libvireo/util/try.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vireo::editor {

CommandError invalid_index(size_t index, size_t size);

/**
 * @brief Gives access to a vector owned by a scene entity.
 *
 */
template <typename TCollection>
concept CVecCollection = requires(SceneContext& ctx, scene::NodeHandle handle) {
  typename TCollection::Item;
  { TCollection::kAddLabel } -> std::convertible_to<std::string_view>;
  { TCollection::kRemoveLabel } -> std::convertible_to<std::string_view>;
  { TCollection::get(ctx, handle) } -> std::same_as<Result<std::vector<typename TCollection::Item>*, CommandError>>;
};

/**
 * @brief Appends an item on execute and removes it on revert.
 *
 */
template <CVecCollection TCollection>
class AddVecItemCommand : public Command {
 public:
  using Item = typename TCollection::Item;

  AddVecItemCommand(scene::NodeHandle handle, Item item) : handle_(handle), item_(std::move(item)) {}

  [[nodiscard]] std::string name(const SceneContext& /*ctx*/) const override {
    return std::string(TCollection::kAddLabel);
  }

  Result<void, CommandError> execute(SceneContext& ctx) override {
    TRY_UNWRAP_DEFINE(items, TCollection::get(ctx, handle_));
    if (!item_) {
      return std::unexpected(CommandError{.msg = "Item has already been added", .code = CommandErrorCode::InvalidState{}});
    }
    items->push_back(std::move(*item_));
    item_.reset();
    return {};
  }

  Result<void, CommandError> revert(SceneContext& ctx) override {
    TRY_UNWRAP_DEFINE(items, TCollection::get(ctx, handle_));
    if (item_ || items->empty()) {
      return std::unexpected(CommandError{.msg = "Item has not been added", .code = CommandErrorCode::InvalidState{}});
    }
    item_ = std::move(items->back());
    items->pop_back();
    return {};
  }

 private:
  scene::NodeHandle handle_;
  std::optional<Item> item_;
};

/**
 * @brief Removes the item at `index` on execute and inserts it back at the same index on revert.
 *
 */
template <CVecCollection TCollection>
class RemoveVecItemCommand : public Command {
 public:
  using Item = typename TCollection::Item;

  RemoveVecItemCommand(scene::NodeHandle handle, size_t index) : handle_(handle), index_(index) {}

  [[nodiscard]] std::string name(const SceneContext& /*ctx*/) const override {
    return std::string(TCollection::kRemoveLabel);
  }

  Result<void, CommandError> execute(SceneContext& ctx) override {
    TRY_UNWRAP_DEFINE(items, TCollection::get(ctx, handle_));
    if (item_) {
      return std::unexpected(
          CommandError{.msg = "Item has already been removed", .code = CommandErrorCode::InvalidState{}});
    }
    if (index_ >= items->size()) {
      return std::unexpected(invalid_index(index_, items->size()));
    }
    item_ = std::move((*items)[index_]);
    items->erase(items->begin() + static_cast<std::ptrdiff_t>(index_));
    return {};
  }

  Result<void, CommandError> revert(SceneContext& ctx) override {
    TRY_UNWRAP_DEFINE(items, TCollection::get(ctx, handle_));
    if (!item_) {
      return std::unexpected(CommandError{.msg = "Item has not been removed", .code = CommandErrorCode::InvalidState{}});
    }
    if (index_ > items->size()) {
      return std::unexpected(invalid_index(index_, items->size()));
    }
    items->insert(items->begin() + static_cast<std::ptrdiff_t>(index_), std::move(*item_));
    item_.reset();
    return {};
  }

 private:
  scene::NodeHandle handle_;
  size_t index_;
  std::optional<Item> item_;
};

struct NodeProperties {
  using Item                                     = scene::Property;
  static constexpr std::string_view kAddLabel    = "Add Property";
  static constexpr std::string_view kRemoveLabel = "Remove Property";

  static Result<std::vector<Item>*, CommandError> get(SceneContext& ctx, scene::NodeHandle handle) {
    TRY_UNWRAP_DEFINE(node, borrow_node(ctx.scene.graph, handle));
    return &node->properties();
  }
};

using AddPropertyCommand    = AddVecItemCommand<NodeProperties>;
using RemovePropertyCommand = RemoveVecItemCommand<NodeProperties>;

/**
 * @brief Swaps the value of the property at `index` with the stored one.
 *
 */
class SetPropertyValueCommand : public Command {
 public:
  SetPropertyValueCommand(scene::NodeHandle handle, size_t index, scene::PropertyValue value)
      : handle_(handle), index_(index), value_(std::move(value)) {}

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;

 private:
  Result<void, CommandError> swap(SceneContext& ctx);

  scene::NodeHandle handle_;
  size_t index_;
  scene::PropertyValue value_;
};

/**
 * @brief Swaps the name of the property at `index` with the stored one.
 *
 */
class SetPropertyNameCommand : public Command {
 public:
  SetPropertyNameCommand(scene::NodeHandle handle, size_t index, std::string name)
      : handle_(handle), index_(index), name_(std::move(name)) {}

  [[nodiscard]] std::string name(const SceneContext& ctx) const override;
  Result<void, CommandError> execute(SceneContext& ctx) override;
  Result<void, CommandError> revert(SceneContext& ctx) override;

 private:
  Result<void, CommandError> swap(SceneContext& ctx);

  scene::NodeHandle handle_;
  size_t index_;
  std::string name_;
};

}  // namespace vireo::editor
