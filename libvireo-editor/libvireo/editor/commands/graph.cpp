#include <fmt/format.h>

#include <libvireo/editor/commands/graph.hpp>
#include <libvireo/util/panic.hpp>
#include <libvireo/util/try.hpp>

namespace vireo::editor {

namespace {

CommandError invalid_state(std::string_view command) {
  return CommandError{
      .msg  = fmt::format("{} was executed and reverted out of order", command),
      .code = CommandErrorCode::InvalidState{},
  };
}

CommandError node_has_children() {
  return CommandError{
      .msg  = "Node has children, delete the whole sub graph instead",
      .code = CommandErrorCode::NodeHasChildren{},
  };
}

CommandError root_not_allowed() {
  return CommandError{
      .msg  = "Graph root can not be modified",
      .code = CommandErrorCode::InvalidHandle{},
  };
}

Result<void, CommandError> require_parent(const scene::Graph& graph, scene::NodeHandle parent) {
  if (!graph.is_valid_handle(parent)) {
    return std::unexpected(CommandError{
        .msg  = fmt::format("Parent {:#x} does not refer to a live node", parent.value),
        .code = CommandErrorCode::InvalidHandle{},
    });
  }
  return {};
}

}  // namespace

// == LinkNodesCommand =================================================================================================

std::string LinkNodesCommand::name(const SceneContext& /*ctx*/) const { return "Link Nodes"; }

Result<void, CommandError> LinkNodesCommand::execute(SceneContext& ctx) { return link(ctx); }

Result<void, CommandError> LinkNodesCommand::revert(SceneContext& ctx) { return link(ctx); }

Result<void, CommandError> LinkNodesCommand::link(SceneContext& ctx) {
  auto& graph = ctx.scene.graph;
  TRY_UNWRAP_DEFINE(child, borrow_node(graph, child_));
  TRY(borrow_node(graph, parent_));
  if (child_ == graph.root()) {
    return std::unexpected(root_not_allowed());
  }
  if (graph.is_ancestor(child_, parent_)) {
    return std::unexpected(CommandError{
        .msg  = "Node can not be linked to its own descendant",
        .code = CommandErrorCode::CyclicLink{},
    });
  }

  auto old_parent = child->parent();
  graph.link_nodes(child_, parent_);
  parent_ = old_parent;
  return {};
}

// == AddNodeCommand ===================================================================================================

AddNodeCommand::AddNodeCommand(scene::Node node, scene::NodeHandle parent)
    : pending_(std::move(node)), parent_(parent), cached_name_(fmt::format("Add Node {}", pending_->name())) {}

std::string AddNodeCommand::name(const SceneContext& /*ctx*/) const { return cached_name_; }

Result<void, CommandError> AddNodeCommand::execute(SceneContext& ctx) {
  auto& graph = ctx.scene.graph;
  if (!reserved_ && !pending_) {
    return std::unexpected(invalid_state("Add Node"));
  }
  TRY(require_parent(graph, parent_));

  if (reserved_) {
    auto [ticket, node] = std::move(*reserved_);
    reserved_.reset();

    auto handle = graph.put_back(std::move(ticket), std::move(node));
    if (handle != handle_) {
      util::panic(ctx.logger, "Node was put back under handle {:#x}, expected {:#x}", handle.value, handle_.value);
    }
    graph.insert_child(handle_, parent_, sibling_index_);
  } else {
    handle_ = graph.add_node(std::move(*pending_));
    pending_.reset();
    graph.link_nodes(handle_, parent_);
  }

  return {};
}

Result<void, CommandError> AddNodeCommand::revert(SceneContext& ctx) {
  auto& graph = ctx.scene.graph;
  if (reserved_ || pending_) {
    return std::unexpected(invalid_state("Add Node"));
  }
  TRY_UNWRAP_DEFINE(node, borrow_node(graph, handle_));
  if (!node->children().empty()) {
    return std::unexpected(node_has_children());
  }

  // Reserving the node unlinks it from its parent.
  sibling_index_ = graph.sibling_index(handle_);
  reserved_      = graph.take_reserve(handle_);
  return {};
}

void AddNodeCommand::finalize(SceneContext& ctx) {
  if (reserved_) {
    ctx.scene.graph.forget_ticket(std::move(reserved_->first), std::move(reserved_->second));
    reserved_.reset();
  }
}

// == DeleteNodeCommand ================================================================================================

std::string DeleteNodeCommand::name(const SceneContext& /*ctx*/) const { return "Delete Node"; }

Result<void, CommandError> DeleteNodeCommand::execute(SceneContext& ctx) {
  auto& graph = ctx.scene.graph;
  if (reserved_) {
    return std::unexpected(invalid_state("Delete Node"));
  }
  TRY_UNWRAP_DEFINE(node, borrow_node(graph, handle_));
  if (handle_ == graph.root()) {
    return std::unexpected(root_not_allowed());
  }
  if (!node->children().empty()) {
    return std::unexpected(node_has_children());
  }

  parent_        = node->parent();
  sibling_index_ = graph.sibling_index(handle_);
  reserved_      = graph.take_reserve(handle_);
  return {};
}

Result<void, CommandError> DeleteNodeCommand::revert(SceneContext& ctx) {
  auto& graph = ctx.scene.graph;
  if (!reserved_) {
    return std::unexpected(invalid_state("Delete Node"));
  }
  TRY(require_parent(graph, parent_));

  auto [ticket, node] = std::move(*reserved_);
  reserved_.reset();

  auto handle = graph.put_back(std::move(ticket), std::move(node));
  if (handle != handle_) {
    util::panic(ctx.logger, "Node was put back under handle {:#x}, expected {:#x}", handle.value, handle_.value);
  }
  graph.insert_child(handle_, parent_, sibling_index_);
  return {};
}

void DeleteNodeCommand::finalize(SceneContext& ctx) {
  if (reserved_) {
    ctx.scene.graph.forget_ticket(std::move(reserved_->first), std::move(reserved_->second));
    reserved_.reset();
  }
}

// == AddModelCommand ==================================================================================================

AddModelCommand::AddModelCommand(scene::SubGraph sub_graph, std::vector<ReservedAnimation> animations)
    : model_(sub_graph.root.first.handle()), sub_graph_(std::move(sub_graph)), animations_(std::move(animations)) {
  animation_handles_.reserve(animations_.size());
  for (const auto& [ticket, animation] : animations_) {
    animation_handles_.push_back(ticket.handle());
  }
}

std::string AddModelCommand::name(const SceneContext& /*ctx*/) const { return "Load Model"; }

Result<void, CommandError> AddModelCommand::execute(SceneContext& ctx) {
  if (!sub_graph_) {
    return std::unexpected(invalid_state("Load Model"));
  }
  TRY(require_parent(ctx.scene.graph, sub_graph_->parent));

  auto root = ctx.scene.graph.put_sub_graph_back(std::move(*sub_graph_));
  sub_graph_.reset();
  if (root != model_) {
    util::panic(ctx.logger, "Model root was put back under handle {:#x}, expected {:#x}", root.value, model_.value);
  }

  for (size_t i = 0; i < animations_.size(); ++i) {
    auto& [ticket, animation] = animations_[i];
    auto handle               = ctx.scene.animations.put_back(std::move(ticket), std::move(animation));
    if (handle != animation_handles_[i]) {
      util::panic(ctx.logger, "Animation was put back under handle {:#x}, expected {:#x}", handle.value,
                  animation_handles_[i].value);
    }
  }
  animations_.clear();

  return {};
}

Result<void, CommandError> AddModelCommand::revert(SceneContext& ctx) {
  if (sub_graph_) {
    return std::unexpected(invalid_state("Load Model"));
  }
  TRY(borrow_node(ctx.scene.graph, model_));
  for (auto handle : animation_handles_) {
    if (!ctx.scene.animations.is_valid_handle(handle)) {
      return std::unexpected(CommandError{
          .msg  = fmt::format("Animation {:#x} of the model does not exist anymore", handle.value),
          .code = CommandErrorCode::InvalidHandle{},
      });
    }
  }

  sub_graph_ = ctx.scene.graph.take_reserve_sub_graph(model_);
  animations_.reserve(animation_handles_.size());
  for (auto handle : animation_handles_) {
    animations_.push_back(ctx.scene.animations.take_reserve(handle));
  }
  return {};
}

void AddModelCommand::finalize(SceneContext& ctx) {
  if (sub_graph_) {
    ctx.scene.graph.forget_sub_graph(std::move(*sub_graph_));
    sub_graph_.reset();
  }
  for (auto& reserved : animations_) {
    ctx.scene.animations.forget_ticket(std::move(reserved.first));
  }
  animations_.clear();
}

std::unique_ptr<AddModelCommand> make_add_model_command(scene::Scene& scene, const scene::ModelInstance& instance) {
  auto sub_graph  = scene.graph.take_reserve_sub_graph(instance.root);
  auto animations = std::vector<ReservedAnimation>();
  animations.reserve(instance.animations.size());
  for (auto handle : instance.animations) {
    animations.push_back(scene.animations.take_reserve(handle));
  }
  return std::make_unique<AddModelCommand>(std::move(sub_graph), std::move(animations));
}

// == DeleteSubGraphCommand ============================================================================================

std::string DeleteSubGraphCommand::name(const SceneContext& /*ctx*/) const { return "Delete Sub Graph"; }

Result<void, CommandError> DeleteSubGraphCommand::execute(SceneContext& ctx) {
  auto& graph = ctx.scene.graph;
  if (sub_graph_) {
    return std::unexpected(invalid_state("Delete Sub Graph"));
  }
  TRY(borrow_node(graph, sub_graph_root_));
  if (sub_graph_root_ == graph.root()) {
    return std::unexpected(root_not_allowed());
  }

  // The sub graph records the parent of its root.
  sub_graph_ = graph.take_reserve_sub_graph(sub_graph_root_);
  return {};
}

Result<void, CommandError> DeleteSubGraphCommand::revert(SceneContext& ctx) {
  if (!sub_graph_) {
    return std::unexpected(invalid_state("Delete Sub Graph"));
  }
  TRY(require_parent(ctx.scene.graph, sub_graph_->parent));

  auto root = ctx.scene.graph.put_sub_graph_back(std::move(*sub_graph_));
  sub_graph_.reset();
  if (root != sub_graph_root_) {
    util::panic(ctx.logger, "Sub graph root was put back under handle {:#x}, expected {:#x}", root.value,
                sub_graph_root_.value);
  }
  return {};
}

void DeleteSubGraphCommand::finalize(SceneContext& ctx) {
  if (sub_graph_) {
    ctx.scene.graph.forget_sub_graph(std::move(*sub_graph_));
    sub_graph_.reset();
  }
}

}  // namespace vireo::editor
