#include <gtest/gtest.h>

#include <libvireo/scene/graph.hpp>
#include <tests/helpers/test_script.hpp>

using namespace vireo::scene;  // NOLINT

class GraphTest : public testing::Test {
 protected:
  GraphTest() {
    a_ = graph_.add_node(Node("a"));
    b_ = graph_.add_node(Node("b"));
    c_ = graph_.add_node(Node("c"));
    graph_.link_nodes(b_, a_);
    graph_.link_nodes(c_, b_);
  }

  // root
  // ├── a
  // │   └── b
  // │       └── c
  Graph graph_;
  NodeHandle a_;
  NodeHandle b_;
  NodeHandle c_;
};

TEST(GraphBasicTest, NewGraphHasOnlyRoot) {
  const auto graph = Graph();

  EXPECT_EQ(graph.node_count(), 1);
  EXPECT_TRUE(graph.is_valid_handle(graph.root()));
  EXPECT_TRUE(graph[graph.root()].parent().is_none());
}

TEST(GraphBasicTest, AddedNodeIsLinkedToRoot) {
  // given
  auto graph = Graph();

  // when
  auto node = graph.add_node(Node("node"));

  // then
  EXPECT_EQ(graph[node].parent(), graph.root());
  ASSERT_EQ(graph[graph.root()].children().size(), 1);
  EXPECT_EQ(graph[graph.root()].children()[0], node);
}

TEST_F(GraphTest, LinkMovesNodeToNewParent) {
  // when
  graph_.link_nodes(c_, a_);

  // then
  EXPECT_EQ(graph_[c_].parent(), a_);
  EXPECT_TRUE(graph_[b_].children().empty());
  ASSERT_EQ(graph_[a_].children().size(), 2);
  EXPECT_EQ(graph_[a_].children()[1], c_);
}

TEST_F(GraphTest, UnlinkAttachesNodeToRoot) {
  // when
  graph_.unlink_node(b_);

  // then
  EXPECT_EQ(graph_[b_].parent(), graph_.root());
  EXPECT_TRUE(graph_[a_].children().empty());
  EXPECT_EQ(graph_[c_].parent(), b_);
}

TEST_F(GraphTest, TraverseIsDepthFirstPreOrder) {
  // given
  auto d = graph_.add_node(Node("d"));
  graph_.link_nodes(d, a_);

  // when
  auto handles = graph_.traverse_handles(a_);

  // then
  ASSERT_EQ(handles.size(), 4);
  EXPECT_EQ(handles[0], a_);
  EXPECT_EQ(handles[1], b_);
  EXPECT_EQ(handles[2], c_);
  EXPECT_EQ(handles[3], d);
}

TEST_F(GraphTest, AncestorQueriesFollowParents) {
  EXPECT_TRUE(graph_.is_ancestor(a_, c_));
  EXPECT_TRUE(graph_.is_ancestor(c_, c_));
  EXPECT_TRUE(graph_.is_ancestor(graph_.root(), c_));
  EXPECT_FALSE(graph_.is_ancestor(c_, a_));
}

TEST_F(GraphTest, FindByNameSearchesSubTree) {
  EXPECT_EQ(graph_.find_by_name(graph_.root(), "c"), c_);
  EXPECT_EQ(graph_.find_by_name(b_, "b"), b_);
  EXPECT_TRUE(graph_.find_by_name(b_, "a").is_none());
}

TEST_F(GraphTest, RemoveNodeDestroysSubTree) {
  // when
  graph_.remove_node(b_);

  // then
  EXPECT_EQ(graph_.node_count(), 2);
  EXPECT_FALSE(graph_.is_valid_handle(b_));
  EXPECT_FALSE(graph_.is_valid_handle(c_));
  EXPECT_TRUE(graph_[a_].children().empty());
}

TEST_F(GraphTest, TakeReserveAndPutBackKeepsHandle) {
  // when
  auto [ticket, node] = graph_.take_reserve(c_);

  // then
  EXPECT_FALSE(graph_.is_valid_handle(c_));
  EXPECT_TRUE(graph_[b_].children().empty());
  EXPECT_EQ(node.name(), "c");

  // when
  auto restored = graph_.put_back(std::move(ticket), std::move(node));
  graph_.link_nodes(restored, b_);

  // then
  EXPECT_EQ(restored, c_);
  EXPECT_EQ(graph_[c_].parent(), b_);
  EXPECT_EQ(graph_.node_count(), 4);
}

TEST_F(GraphTest, ForgottenTicketFreesSlotForReuse) {
  // given
  auto [ticket, node] = graph_.take_reserve(c_);

  // when
  graph_.forget_ticket(std::move(ticket), std::move(node));
  auto d = graph_.add_node(Node("d"));

  // then
  EXPECT_EQ(d.index(), c_.index());
  EXPECT_NE(d, c_);
  EXPECT_FALSE(graph_.is_valid_handle(c_));
}

TEST(NodeTest, CloneCopiesDataWithoutLinks) {
  // given
  auto graph  = Graph();
  auto parent = graph.add_node(Node("parent"));
  auto child  = graph.add_node(Node("child", PointLight{}));
  graph.link_nodes(child, parent);

  auto& node = graph[child];
  node.set_tag("lamp");
  node.properties().push_back(Property{.name = "health", .value = int64_t{10}});
  node.set_script(std::make_unique<CounterScript>(3));

  // when
  auto copy = node.clone();

  // then
  EXPECT_EQ(copy.name(), "child");
  EXPECT_EQ(copy.tag(), "lamp");
  EXPECT_EQ(copy.properties(), node.properties());
  EXPECT_NE(copy.as<PointLight>(), nullptr);
  EXPECT_TRUE(copy.parent().is_none());
  EXPECT_TRUE(copy.children().empty());
  ASSERT_NE(copy.script(), nullptr);
  EXPECT_NE(copy.script(), node.script());
  EXPECT_EQ(dynamic_cast<const CounterScript*>(copy.script())->counter(), 3);
}

TEST(NodeTest, SettersNormalizeValues) {
  auto node = Node("node");
  node.set_depth_offset_factor(-3.F);

  auto light = PointLight();
  light.set_radius(-4.F);

  auto csm = CsmOptions();
  csm.set_shadow_bias(-1.F);

  EXPECT_EQ(node.depth_offset_factor(), 1.F);
  EXPECT_EQ(light.radius(), 4.F);
  EXPECT_EQ(csm.shadow_bias(), 0.F);
}

TEST(NodeTest, BaseLightIsOnlyAvailableForLights) {
  auto pivot       = Node("pivot");
  auto point       = Node("point", PointLight{});
  auto directional = Node("sun", DirectionalLight{});

  EXPECT_EQ(pivot.base_light(), nullptr);
  EXPECT_NE(point.base_light(), nullptr);
  EXPECT_NE(directional.base_light(), nullptr);
}
