#pragma once
#include "model.hpp"
#include "schema.hpp"
#include <cstddef>
#include <memory>
#include <unordered_map>

namespace quasar
{

  // Identity map from id to the live Node/Edge object. Entries are weak: the
  // cache never keeps an object alive, it only guarantees that while some
  // holder has one, every lookup of that id returns the same instance.
  class ObjectCache
  {
  public:
    explicit ObjectCache(Schema &schema);

    // get_or_load; nullptr when no row of that kind exists
    std::shared_ptr<Node> node(EntityId id);
    std::shared_ptr<Edge> edge(EntityId id);
    std::shared_ptr<Entity> entity(EntityId id);

    // live instance without touching storage
    std::shared_ptr<Entity> peek(EntityId id);

    void adopt(const std::shared_ptr<Entity> &e);
    // drop from the live set and mark detached; the instance is remembered so
    // that a row restored later (rollback, undo) revives the same object
    void evict(EntityId id);
    // reload state from the rows into the existing instance, re-registering or
    // evicting it; returns whether the row exists
    bool refresh(const std::shared_ptr<Entity> &e);
    void invalidateAll();

    size_t liveCount() const;

  private:
    std::shared_ptr<Entity> revive(EntityId id, EntityKind kind, PropertyMap props);
    void prune();

    Schema &schema_;
    std::unordered_map<EntityId, std::weak_ptr<Entity>> live_;
    std::unordered_map<EntityId, std::weak_ptr<Entity>> retired_;
    size_t pruneAt_{1024};
  };

} // namespace quasar
