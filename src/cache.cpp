#include "cache.hpp"
#include "codec.hpp"
#include <algorithm>

namespace quasar
{

  ObjectCache::ObjectCache(Schema &schema) : schema_(schema) {}

  std::shared_ptr<Entity> ObjectCache::peek(EntityId id)
  {
    auto it = live_.find(id);
    if (it == live_.end())
      return nullptr;
    auto e = it->second.lock();
    if (!e)
      live_.erase(it);
    return e;
  }

  std::shared_ptr<Entity> ObjectCache::revive(EntityId id, EntityKind kind, PropertyMap props)
  {
    auto it = retired_.find(id);
    if (it == retired_.end())
      return nullptr;
    auto e = it->second.lock();
    retired_.erase(it);
    if (!e || e->kind() != kind)
      return nullptr;
    e->props_ = std::move(props);
    e->detached_ = false;
    live_[id] = e;
    return e;
  }

  std::shared_ptr<Node> ObjectCache::node(EntityId id)
  {
    if (auto e = peek(id))
      return e->isNode() ? std::static_pointer_cast<Node>(e) : nullptr;

    auto row = schema_.getNodeRow(id);
    if (!row)
      return nullptr;
    auto props = decodeProperties(row->props);
    if (auto e = revive(id, EntityKind::Node, props))
      return std::static_pointer_cast<Node>(e);

    auto n = std::make_shared<Node>(id, std::move(props));
    adopt(n);
    return n;
  }

  std::shared_ptr<Edge> ObjectCache::edge(EntityId id)
  {
    if (auto e = peek(id))
      return e->isEdge() ? std::static_pointer_cast<Edge>(e) : nullptr;

    auto row = schema_.getEdgeRow(id);
    if (!row)
      return nullptr;
    auto props = decodeProperties(row->props);
    if (auto e = revive(id, EntityKind::Edge, props))
      return std::static_pointer_cast<Edge>(e);

    auto ed = std::make_shared<Edge>(row->ref, std::move(props));
    adopt(ed);
    return ed;
  }

  std::shared_ptr<Entity> ObjectCache::entity(EntityId id)
  {
    if (auto e = peek(id))
      return e;
    auto kind = schema_.kindOf(id);
    if (!kind)
      return nullptr;
    if (*kind == EntityKind::Node)
      return node(id);
    return edge(id);
  }

  void ObjectCache::adopt(const std::shared_ptr<Entity> &e)
  {
    if (live_.size() >= pruneAt_)
      prune();
    retired_.erase(e->id());
    e->detached_ = false;
    live_[e->id()] = e;
  }

  void ObjectCache::evict(EntityId id)
  {
    auto it = live_.find(id);
    if (it == live_.end())
      return;
    if (auto e = it->second.lock())
    {
      e->detached_ = true;
      retired_[id] = e;
    }
    live_.erase(it);
  }

  bool ObjectCache::refresh(const std::shared_ptr<Entity> &e)
  {
    std::optional<std::vector<PropertyRow>> rows;
    if (e->isNode())
    {
      if (auto row = schema_.getNodeRow(e->id()))
        rows = std::move(row->props);
    }
    else if (auto row = schema_.getEdgeRow(e->id()))
    {
      rows = std::move(row->props);
    }

    if (!rows)
    {
      live_.erase(e->id());
      e->detached_ = true;
      retired_[e->id()] = e;
      return false;
    }
    e->props_ = decodeProperties(*rows);
    adopt(e);
    return true;
  }

  void ObjectCache::invalidateAll()
  {
    live_.clear();
    retired_.clear();
    pruneAt_ = 1024;
  }

  size_t ObjectCache::liveCount() const
  {
    return static_cast<size_t>(std::count_if(live_.begin(), live_.end(), [](const auto &kv)
                                             { return !kv.second.expired(); }));
  }

  void ObjectCache::prune()
  {
    for (auto *map : {&live_, &retired_})
    {
      for (auto it = map->begin(); it != map->end();)
      {
        if (it->second.expired())
          it = map->erase(it);
        else
          ++it;
      }
    }
    pruneAt_ = std::max<size_t>(1024, live_.size() * 2);
  }

} // namespace quasar
