#include "traversal.hpp"
#include <algorithm>
#include <queue>
#include <unordered_map>
#include <utility>

namespace quasar
{

  std::vector<EntityId> Path::ids() const
  {
    std::vector<EntityId> out;
    out.reserve(nodes.size());
    for (const auto &n : nodes)
      out.push_back(n->id());
    return out;
  }

  // -------------------- Walk --------------------

  Walk::iterator &Walk::iterator::operator++()
  {
    current_ = walk_->next();
    if (!current_)
      walk_ = nullptr;
    return *this;
  }

  Walk::Walk(Store &store, TraverseParams params, WalkOrder order)
      : store_(&store), params_(std::move(params)), order_(order)
  {
  }

  bool Walk::admit(const Visit &v)
  {
    if (!visited_.insert(v.node->id()).second)
      return false;
    // pruned nodes stay marked, another route does not bring them back
    return !params_.visit || params_.visit(v);
  }

  bool Walk::improves(EntityId id, uint32_t depth) const
  {
    auto it = reached_.find(id);
    if (it == reached_.end())
      return true;
    // with a depth bound a shorter route can reach further
    return params_.maxDepth != 0 && depth < it->second;
  }

  void Walk::seed()
  {
    Visit start{};
    start.node = store_->getNode(params_.start);
    start.path.push_back(params_.start);
    if (order_ == WalkOrder::DepthFirst || admit(start))
      frontier_.push_back(std::move(start));
  }

  void Walk::expand(const Visit &v)
  {
    if (params_.maxDepth != 0 && v.depth >= params_.maxDepth)
      return;

    auto adjacent = store_->neighbors(v.node->id(), params_.direction, params_.label);
    if (order_ == WalkOrder::DepthFirst)
      std::reverse(adjacent.begin(), adjacent.end());

    for (auto &nb : adjacent)
    {
      EntityId id = nb.node->id();
      if (order_ == WalkOrder::BreadthFirst ? visited_.count(id) > 0 : !improves(id, v.depth + 1))
        continue;
      Visit child{};
      child.node = std::move(nb.node);
      child.via = std::move(nb.edge);
      child.depth = v.depth + 1;
      child.path = v.path;
      child.path.push_back(id);

      if (order_ == WalkOrder::BreadthFirst)
      {
        if (admit(child))
          frontier_.push_back(std::move(child));
      }
      else
      {
        // checked when popped, a node may be pushed from several parents
        frontier_.push_back(std::move(child));
      }
    }
  }

  std::optional<Visit> Walk::next()
  {
    if (!started_)
    {
      started_ = true;
      seed();
    }
    // the last yielded node is expanded only once the caller asks for more
    if (pending_)
    {
      Visit last = std::move(*pending_);
      pending_.reset();
      expand(last);
    }

    while (!frontier_.empty())
    {
      Visit v;
      if (order_ == WalkOrder::BreadthFirst)
      {
        v = std::move(frontier_.front());
        frontier_.pop_front();
      }
      else
      {
        v = std::move(frontier_.back());
        frontier_.pop_back();
        EntityId id = v.node->id();
        auto seen = reached_.find(id);
        if (seen != reached_.end())
        {
          // already yielded or pruned; expand again only from a shallower depth
          if (!improves(id, v.depth))
            continue;
          seen->second = v.depth;
          expand(v);
          continue;
        }
        if (!admit(v))
        {
          reached_.emplace(id, 0);
          continue;
        }
        reached_.emplace(id, v.depth);
      }
      pending_ = v;
      return v;
    }
    return std::nullopt;
  }

  // -------------------- Traversal --------------------

  Walk Traversal::bfs(const TraverseParams &params)
  {
    return Walk(store_, params, WalkOrder::BreadthFirst);
  }

  Walk Traversal::dfs(const TraverseParams &params)
  {
    return Walk(store_, params, WalkOrder::DepthFirst);
  }

  std::optional<Path> Traversal::shortestPath(EntityId from, EntityId to, Direction direction,
                                              const std::optional<std::string> &label)
  {
    auto origin = store_.getNode(from);
    store_.getNode(to);

    if (from == to)
    {
      Path p{};
      p.nodes.push_back(origin);
      return p;
    }

    struct Step
    {
      std::shared_ptr<Node> node;
      EntityId parent{0};
      std::shared_ptr<Edge> via;
    };
    std::unordered_map<EntityId, Step> steps;
    steps.emplace(from, Step{origin, 0, nullptr});

    std::queue<EntityId> frontier;
    frontier.push(from);
    while (!frontier.empty())
    {
      EntityId cur = frontier.front();
      frontier.pop();
      for (auto &nb : store_.neighbors(cur, direction, label))
      {
        EntityId id = nb.node->id();
        if (steps.count(id))
          continue;
        steps.emplace(id, Step{nb.node, cur, nb.edge});
        if (id != to)
        {
          frontier.push(id);
          continue;
        }

        Path p{};
        for (EntityId at = to; at != from; at = steps.at(at).parent)
        {
          const Step &s = steps.at(at);
          p.nodes.push_back(s.node);
          p.edges.push_back(s.via);
        }
        p.nodes.push_back(origin);
        std::reverse(p.nodes.begin(), p.nodes.end());
        std::reverse(p.edges.begin(), p.edges.end());
        return p;
      }
    }
    return std::nullopt;
  }

  static bool matches(const Node &n, const std::vector<PropertyFilter> &filters)
  {
    for (const auto &f : filters)
    {
      auto v = n.property(f.key);
      if (!v)
        return false;
      if (f.equals && !(*v == *f.equals))
        return false;
    }
    return true;
  }

  std::vector<Neighbor> Traversal::neighborsWhere(EntityId node, Direction direction,
                                                  const std::optional<std::string> &label,
                                                  const std::vector<PropertyFilter> &filters)
  {
    auto all = store_.neighbors(node, direction, label);
    std::vector<Neighbor> out;
    for (auto &nb : all)
    {
      if (matches(*nb.node, filters))
        out.push_back(std::move(nb));
    }
    return out;
  }

} // namespace quasar
