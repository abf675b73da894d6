#pragma once

#include <cstddef>
#include <libvireo/scene/node.hpp>
#include <libvireo/scene/pool.hpp>
#include <libvireo/util/ruleof.hpp>
#include <string_view>
#include <utility>
#include <vector>

namespace vireo::scene {

using NodeTicket = Ticket<Node>;

/**
 * @brief Nodes of a detached sub-tree. The nodes keep their parent and children handles, so the tree can be put back
 * in the exact same shape.
 *
 */
struct SubGraph {
  std::pair<NodeTicket, Node> root;
  std::vector<std::pair<NodeTicket, Node>> descendants;

  /**
   * @brief Parent of the root at the moment of extraction.
   *
   */
  NodeHandle parent;

  /**
   * @brief Position of the root among the children of `parent`.
   *
   */
  size_t sibling_index{};
};

/**
 * @brief Hierarchy of nodes stored in a generational pool. The graph always has a root node that cannot be removed.
 *
 */
class Graph {
 public:
  Graph();

  VIREO_DELETE_COPY(Graph)
  VIREO_DEFAULT_MOVE(Graph)

  NodeHandle root() const { return root_; }

  /**
   * @brief Moves the node into the graph and links it to the root. The hierarchy links of `node` are ignored.
   *
   */
  NodeHandle add_node(Node node);

  /**
   * @brief Attaches `child` to `parent`, detaching it from its previous parent first.
   *
   */
  void link_nodes(NodeHandle child, NodeHandle parent);

  /**
   * @brief Like `link_nodes`, but places `child` at `index` among the children of `parent`. Indices past the end
   * append.
   *
   */
  void insert_child(NodeHandle child, NodeHandle parent, size_t index);

  /**
   * @brief Position of the node among the children of its parent. Zero for nodes without a parent.
   *
   */
  [[nodiscard]] size_t sibling_index(NodeHandle node) const;

  /**
   * @brief Detaches the node from its parent and attaches it to the root.
   *
   */
  void unlink_node(NodeHandle node);

  /**
   * @brief Destroys the node and every node of its sub-tree.
   *
   */
  void remove_node(NodeHandle node);

  /**
   * @brief Isolates the node from its parent and moves it out of the pool. The node must not have children, use
   * `take_reserve_sub_graph` for whole trees.
   *
   */
  [[nodiscard]] std::pair<NodeTicket, Node> take_reserve(NodeHandle node);

  /**
   * @brief Returns the node to the slot it was taken from. The node is not linked to anything.
   *
   */
  NodeHandle put_back(NodeTicket ticket, Node node);

  /**
   * @brief Destroys a reserved node and releases its slot.
   *
   */
  void forget_ticket(NodeTicket ticket, Node node);

  [[nodiscard]] SubGraph take_reserve_sub_graph(NodeHandle root);

  /**
   * @brief Puts every node of the sub-graph back into its slot and links the root to the recorded parent at its
   * recorded position. The recorded parent must be alive.
   *
   */
  NodeHandle put_sub_graph_back(SubGraph sub_graph);

  void forget_sub_graph(SubGraph sub_graph);

  /**
   * @brief Returns handles of the sub-tree starting at `from` in depth-first pre-order.
   *
   */
  [[nodiscard]] std::vector<NodeHandle> traverse_handles(NodeHandle from) const;

  /**
   * @brief Depth-first search for the first node named `name` in the sub-tree of `from`. Returns a none handle when
   * there is no such node.
   *
   */
  [[nodiscard]] NodeHandle find_by_name(NodeHandle from, std::string_view name) const;

  /**
   * @brief Returns true when `ancestor` lies on the path from `node` to the root (`node` included).
   *
   */
  [[nodiscard]] bool is_ancestor(NodeHandle ancestor, NodeHandle node) const;

  [[nodiscard]] bool is_valid_handle(NodeHandle node) const { return pool_.is_valid_handle(node); }

  [[nodiscard]] Node* try_get(NodeHandle node) { return pool_.try_borrow(node); }
  [[nodiscard]] const Node* try_get(NodeHandle node) const { return pool_.try_borrow(node); }

  Node& operator[](NodeHandle node) { return pool_[node]; }
  const Node& operator[](NodeHandle node) const { return pool_[node]; }

  /**
   * @brief Number of alive nodes, including the root.
   *
   */
  [[nodiscard]] size_t node_count() const { return pool_.alive_count(); }

  [[nodiscard]] const Pool<Node>& pool() const { return pool_; }

 private:
  void isolate_node(NodeHandle node);

  Pool<Node> pool_;
  NodeHandle root_;
};

}  // namespace vireo::scene
