#include "env.hpp"
#include "store.hpp"
#include "traversal.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <string>

using namespace quasar;
using namespace std::string_literals;

class TraversalTest : public ::testing::Test
{
protected:
  Env env{":memory:"};
  Store store{env};
  Traversal traversal{store};
  std::map<std::string, EntityId> ids;

  EntityId node(const std::string &name)
  {
    auto it = ids.find(name);
    if (it != ids.end())
      return it->second;
    auto n = store.createNode({{"name", name}});
    ids.emplace(name, n->id());
    return n->id();
  }

  EntityId edge(const std::string &from, const std::string &to, std::optional<std::string> label = std::nullopt)
  {
    return store.createEdge(node(from), node(to), label)->id();
  }

  std::vector<std::string> names(Walk walk)
  {
    std::vector<std::string> out;
    for (const auto &v : walk)
      out.push_back(std::get<std::string>(*v.node->property("name")));
    return out;
  }

  std::vector<std::string> names(const Path &path)
  {
    std::vector<std::string> out;
    for (const auto &n : path.nodes)
      out.push_back(std::get<std::string>(*n->property("name")));
    return out;
  }

  TraverseParams from(const std::string &start, Direction direction = Direction::Out)
  {
    TraverseParams p{};
    p.start = node(start);
    p.direction = direction;
    return p;
  }
};

TEST_F(TraversalTest, BfsVisitsEachNodeOfACycleOnce)
{
  edge("A", "B");
  edge("B", "C");
  edge("C", "A");
  EXPECT_EQ(names(traversal.bfs(from("A"))), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(names(traversal.dfs(from("A"))), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(names(traversal.bfs(from("A", Direction::Both))), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(TraversalTest, BreadthAndDepthOrder)
{
  edge("A", "B");
  edge("A", "C");
  edge("B", "D");
  edge("C", "E");
  EXPECT_EQ(names(traversal.bfs(from("A"))), (std::vector<std::string>{"A", "B", "C", "D", "E"}));
  EXPECT_EQ(names(traversal.dfs(from("A"))), (std::vector<std::string>{"A", "B", "D", "C", "E"}));
}

TEST_F(TraversalTest, VisitCarriesDepthPathAndEdge)
{
  auto ab = edge("A", "B");
  edge("B", "C");
  auto walk = traversal.bfs(from("A"));

  auto a = walk.next();
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->depth, 0u);
  EXPECT_EQ(a->via, nullptr);
  EXPECT_EQ(a->path, (std::vector<EntityId>{node("A")}));

  auto b = walk.next();
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->depth, 1u);
  EXPECT_EQ(b->via->id(), ab);

  auto c = walk.next();
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->depth, 2u);
  EXPECT_EQ(c->path, (std::vector<EntityId>{node("A"), node("B"), node("C")}));
  EXPECT_FALSE(walk.next().has_value());
  EXPECT_FALSE(walk.next().has_value());
}

TEST_F(TraversalTest, WalksAreRestartable)
{
  edge("A", "B");
  edge("B", "C");
  auto first = traversal.bfs(from("A"));
  ASSERT_TRUE(first.next().has_value());
  // abandoned after one step; a new call starts over
  EXPECT_EQ(names(traversal.bfs(from("A"))), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(TraversalTest, MaxDepthStopsExpansion)
{
  edge("A", "B");
  edge("B", "C");
  edge("C", "D");
  auto p = from("A");
  p.maxDepth = 2;
  EXPECT_EQ(names(traversal.bfs(p)), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(names(traversal.dfs(p)), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(TraversalTest, MaxDepthReachesNodesOnTheShorterRoute)
{
  // D is three hops away through B but two through C
  edge("A", "B");
  edge("B", "C");
  edge("C", "D");
  edge("A", "C");
  auto p = from("A");
  p.maxDepth = 2;
  EXPECT_EQ(names(traversal.bfs(p)), (std::vector<std::string>{"A", "B", "C", "D"}));
  EXPECT_EQ(names(traversal.dfs(p)), (std::vector<std::string>{"A", "B", "C", "D"}));

  // each node still yielded once, D reported at its shallow depth
  std::map<std::string, uint32_t> depths;
  for (const auto &v : traversal.dfs(p))
    EXPECT_TRUE(depths.emplace(std::get<std::string>(*v.node->property("name")), v.depth).second);
  EXPECT_EQ(depths["D"], 2u);
}

TEST_F(TraversalTest, DepthFirstWithoutBoundKeepsFirstRoute)
{
  edge("A", "B");
  edge("B", "C");
  edge("C", "D");
  edge("A", "C");
  EXPECT_EQ(names(traversal.dfs(from("A"))), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST_F(TraversalTest, NodeIsExpandedOnlyWhenTheWalkAdvances)
{
  edge("A", "B");
  for (auto order : {WalkOrder::BreadthFirst, WalkOrder::DepthFirst})
  {
    Walk walk(store, from("A"), order);
    auto a = walk.next();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->node->id(), node("A"));
    // added after A was yielded, picked up because A had not been expanded yet
    auto late = store.createEdge(node("A"), node("A" + std::to_string(static_cast<int>(order))));
    std::vector<EntityId> rest;
    while (auto v = walk.next())
      rest.push_back(v->node->id());
    EXPECT_EQ(rest.size(), store.neighbors(node("A")).size());
    EXPECT_NE(std::find(rest.begin(), rest.end(), late->dst()), rest.end());
  }
}

TEST_F(TraversalTest, PredicatePrunesBranches)
{
  edge("A", "B");
  edge("A", "C");
  edge("B", "D");
  edge("C", "E");
  auto p = from("A");
  p.visit = [](const Visit &v)
  { return v.node->property("name") != std::optional<Value>("B"s); };
  EXPECT_EQ(names(traversal.bfs(p)), (std::vector<std::string>{"A", "C", "E"}));
  EXPECT_EQ(names(traversal.dfs(p)), (std::vector<std::string>{"A", "C", "E"}));
}

TEST_F(TraversalTest, LabelAndDirectionFilters)
{
  edge("A", "B", "knows"s);
  edge("A", "C", "likes"s);
  edge("D", "A", "knows"s);

  auto p = from("A", Direction::Both);
  p.label = "knows"s;
  EXPECT_EQ(names(traversal.bfs(p)), (std::vector<std::string>{"A", "B", "D"}));
  EXPECT_EQ(names(traversal.bfs(from("A", Direction::In))), (std::vector<std::string>{"A", "D"}));
}

TEST_F(TraversalTest, UnknownStartThrows)
{
  TraverseParams p{};
  p.start = 999;
  auto walk = traversal.bfs(p);
  EXPECT_THROW(walk.next(), NotFoundError);
}

TEST_F(TraversalTest, ShortestPathOfLengthTwo)
{
  edge("A", "B");
  edge("B", "D");
  edge("A", "C");
  edge("C", "D");

  auto path = traversal.shortestPath(node("A"), node("D"));
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->length(), 2u);
  auto got = names(*path);
  EXPECT_TRUE(got == (std::vector<std::string>{"A", "B", "D"}) || got == (std::vector<std::string>{"A", "C", "D"}));
  ASSERT_EQ(path->edges.size(), 2u);
  EXPECT_EQ(path->edges[0]->src(), node("A"));
  EXPECT_EQ(path->edges[1]->dst(), node("D"));
  EXPECT_EQ(path->ids().front(), node("A"));
}

TEST_F(TraversalTest, ShortestPathPrefersFewerHops)
{
  edge("A", "B");
  edge("B", "C");
  edge("C", "D");
  edge("A", "D");
  auto path = traversal.shortestPath(node("A"), node("D"));
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(names(*path), (std::vector<std::string>{"A", "D"}));
}

TEST_F(TraversalTest, ShortestPathEdgeCases)
{
  edge("A", "B");
  node("Z");

  auto self = traversal.shortestPath(node("A"), node("A"));
  ASSERT_TRUE(self.has_value());
  EXPECT_EQ(self->length(), 0u);
  EXPECT_EQ(self->nodes.size(), 1u);

  EXPECT_FALSE(traversal.shortestPath(node("A"), node("Z")).has_value());
  EXPECT_FALSE(traversal.shortestPath(node("B"), node("A")).has_value());
  EXPECT_TRUE(traversal.shortestPath(node("B"), node("A"), Direction::In).has_value());
  EXPECT_THROW(traversal.shortestPath(node("A"), 999), NotFoundError);
}

TEST_F(TraversalTest, NeighborsWhere)
{
  edge("A", "B");
  edge("A", "C");
  store.setProperty(node("B"), "age", int64_t{30});
  store.setProperty(node("C"), "age", int64_t{40});
  store.setProperty(node("C"), "vip", true);

  auto forty = traversal.neighborsWhere(node("A"), Direction::Out, std::nullopt, {{"age", Value{int64_t{40}}}});
  ASSERT_EQ(forty.size(), 1u);
  EXPECT_EQ(forty[0].node->id(), node("C"));

  auto anyAge = traversal.neighborsWhere(node("A"), Direction::Out, std::nullopt, {{"age", std::nullopt}});
  EXPECT_EQ(anyAge.size(), 2u);
  EXPECT_TRUE(traversal.neighborsWhere(node("A"), Direction::Out, std::nullopt, {{"vip", Value{int64_t{1}}}}).empty());
}
