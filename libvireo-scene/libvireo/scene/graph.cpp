#include <algorithm>
#include <cassert>
#include <cstddef>
#include <iterator>
#include <libvireo/scene/graph.hpp>
#include <ranges>

namespace vireo::scene {

Graph::Graph() : root_(pool_.spawn(Node("__ROOT__"))) {}

NodeHandle Graph::add_node(Node node) {
  node.parent_ = NodeHandle::none();
  node.children_.clear();

  auto handle = pool_.spawn(std::move(node));
  link_nodes(handle, root_);
  return handle;
}

void Graph::isolate_node(NodeHandle node) {
  auto& n = pool_[node];
  if (auto* parent = pool_.try_borrow(n.parent_)) {
    std::erase(parent->children_, node);
  }
  n.parent_ = NodeHandle::none();
}

void Graph::link_nodes(NodeHandle child, NodeHandle parent) {
  insert_child(child, parent, pool_[parent].children_.size());
}

void Graph::insert_child(NodeHandle child, NodeHandle parent, size_t index) {
  assert(child != root_ && "Root node cannot be linked");
  assert(!is_ancestor(child, parent) && "Linking a node to its own descendant creates a cycle");

  isolate_node(child);
  pool_[child].parent_ = parent;

  auto& children = pool_[parent].children_;
  index          = std::min(index, children.size());
  children.insert(children.begin() + static_cast<std::ptrdiff_t>(index), child);
}

size_t Graph::sibling_index(NodeHandle node) const {
  const auto* parent = pool_.try_borrow(pool_[node].parent_);
  if (parent == nullptr) {
    return 0;
  }
  auto it = std::ranges::find(parent->children_, node);
  return static_cast<size_t>(std::distance(parent->children_.begin(), it));
}

void Graph::unlink_node(NodeHandle node) { link_nodes(node, root_); }

void Graph::remove_node(NodeHandle node) {
  assert(node != root_ && "Root node cannot be removed");

  auto handles = traverse_handles(node);
  isolate_node(node);
  for (auto handle : handles) {
    pool_.free(handle);
  }
}

std::pair<NodeTicket, Node> Graph::take_reserve(NodeHandle node) {
  assert(node != root_ && "Root node cannot be reserved");
  assert(pool_[node].children_.empty() && "Only leaf nodes can be reserved, reserve a sub graph instead");

  isolate_node(node);
  return pool_.take_reserve(node);
}

NodeHandle Graph::put_back(NodeTicket ticket, Node node) { return pool_.put_back(std::move(ticket), std::move(node)); }

void Graph::forget_ticket(NodeTicket ticket, Node /*node*/) { pool_.forget_ticket(std::move(ticket)); }

SubGraph Graph::take_reserve_sub_graph(NodeHandle root) {
  assert(root != root_ && "Root node cannot be reserved");

  auto parent        = pool_[root].parent_;
  auto sibling_index = this->sibling_index(root);
  auto handles       = traverse_handles(root);
  isolate_node(root);

  auto root_pair   = pool_.take_reserve(root);
  auto descendants = std::vector<std::pair<NodeTicket, Node>>();
  descendants.reserve(handles.size() - 1);
  for (auto handle : handles | std::views::drop(1)) {
    descendants.push_back(pool_.take_reserve(handle));
  }

  return SubGraph{
      .root          = std::move(root_pair),
      .descendants   = std::move(descendants),
      .parent        = parent,
      .sibling_index = sibling_index,
  };
}

NodeHandle Graph::put_sub_graph_back(SubGraph sub_graph) {
  assert(is_valid_handle(sub_graph.parent) && "Parent of the sub graph must be alive");

  for (auto& [ticket, node] : sub_graph.descendants) {
    pool_.put_back(std::move(ticket), std::move(node));
  }
  auto root = pool_.put_back(std::move(sub_graph.root.first), std::move(sub_graph.root.second));

  insert_child(root, sub_graph.parent, sub_graph.sibling_index);
  return root;
}

void Graph::forget_sub_graph(SubGraph sub_graph) {
  for (auto& descendant : sub_graph.descendants) {
    pool_.forget_ticket(std::move(descendant.first));
  }
  pool_.forget_ticket(std::move(sub_graph.root.first));
}

std::vector<NodeHandle> Graph::traverse_handles(NodeHandle from) const {
  auto result = std::vector<NodeHandle>();
  auto stack  = std::vector<NodeHandle>{from};
  while (!stack.empty()) {
    auto handle = stack.back();
    stack.pop_back();
    result.push_back(handle);

    const auto& children = pool_[handle].children_;
    for (auto child : children | std::views::reverse) {
      stack.push_back(child);
    }
  }
  return result;
}

NodeHandle Graph::find_by_name(NodeHandle from, std::string_view name) const {
  for (auto handle : traverse_handles(from)) {
    if (pool_[handle].name_ == name) {
      return handle;
    }
  }
  return NodeHandle::none();
}

bool Graph::is_ancestor(NodeHandle ancestor, NodeHandle node) const {
  for (auto current = node; pool_.is_valid_handle(current); current = pool_[current].parent_) {
    if (current == ancestor) {
      return true;
    }
  }
  return false;
}

}  // namespace vireo::scene
