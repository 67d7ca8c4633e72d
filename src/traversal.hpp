#pragma once
#include "store.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quasar
{

  struct Visit
  {
    std::shared_ptr<Node> node{};
    // edge the node was reached through, null for the start node
    std::shared_ptr<Edge> via{};
    uint32_t depth{0};
    // node ids from the start node to `node`, both included
    std::vector<EntityId> path{};
  };

  // false prunes the node: it is neither yielded nor expanded
  using VisitPredicate = std::function<bool(const Visit &)>;

  struct TraverseParams
  {
    EntityId start{0};
    Direction direction{Direction::Out};
    std::optional<std::string> label{};
    VisitPredicate visit{};
    uint32_t maxDepth{0}; // 0 -> unlimited
  };

  struct Path
  {
    std::vector<std::shared_ptr<Node>> nodes{};
    std::vector<std::shared_ptr<Edge>> edges{};

    size_t length() const { return edges.size(); }
    std::vector<EntityId> ids() const;
  };

  enum class WalkOrder : uint8_t
  {
    BreadthFirst = 0,
    DepthFirst = 1
  };

  // Lazy walk over the graph. Each node is yielded at most once; the walk
  // reads adjacency from the store only as far as it is advanced.
  class Walk
  {
  public:
    class iterator
    {
    public:
      using iterator_category = std::input_iterator_tag;
      using value_type = Visit;
      using difference_type = std::ptrdiff_t;
      using pointer = const Visit *;
      using reference = const Visit &;

      iterator() = default;
      explicit iterator(Walk *walk) : walk_(walk) { ++*this; }

      reference operator*() const { return *current_; }
      pointer operator->() const { return &*current_; }
      iterator &operator++();
      bool operator==(const iterator &other) const { return walk_ == other.walk_; }
      bool operator!=(const iterator &other) const { return walk_ != other.walk_; }

    private:
      Walk *walk_{};
      std::optional<Visit> current_{};
    };

    Walk(Store &store, TraverseParams params, WalkOrder order);

    std::optional<Visit> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

  private:
    void seed();
    bool admit(const Visit &v);
    void expand(const Visit &v);
    bool improves(EntityId id, uint32_t depth) const;

    Store *store_;
    TraverseParams params_;
    WalkOrder order_;
    bool started_{false};
    std::deque<Visit> frontier_;
    std::optional<Visit> pending_;
    std::unordered_set<EntityId> visited_;
    // depth first: shallowest depth each node was expanded from
    std::unordered_map<EntityId, uint32_t> reached_;
  };

  class Traversal
  {
  public:
    explicit Traversal(Store &store) : store_(store) {}

    Walk bfs(const TraverseParams &params);
    // pre-order, neighbours in enumeration order
    Walk dfs(const TraverseParams &params);

    // Unweighted shortest path. Among equally short paths the first one
    // discovered wins, which follows edge id order and is not canonical.
    std::optional<Path> shortestPath(EntityId from, EntityId to,
                                     Direction direction = Direction::Out,
                                     const std::optional<std::string> &label = std::nullopt);

    // neighbours whose node satisfies every filter
    std::vector<Neighbor> neighborsWhere(EntityId node, Direction direction,
                                         const std::optional<std::string> &label,
                                         const std::vector<PropertyFilter> &filters);

  private:
    Store &store_;
  };

} // namespace quasar
