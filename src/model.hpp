#pragma once
#include "schema.hpp"
#include "value.hpp"
#include <optional>
#include <string>
#include <utility>

namespace quasar
{

  class Store;
  class ObjectCache;

  // Live, in-memory view of one node or edge. Instances are shared through
  // std::shared_ptr and mutated only by the Store, which writes every change
  // through to the rows first.
  class Entity
  {
  public:
    virtual ~Entity() = default;
    Entity(const Entity &) = delete;
    Entity &operator=(const Entity &) = delete;

    EntityId id() const { return id_; }
    EntityKind kind() const { return kind_; }
    bool isNode() const { return kind_ == EntityKind::Node; }
    bool isEdge() const { return kind_ == EntityKind::Edge; }

    const PropertyMap &properties() const { return props_; }
    std::optional<Value> property(const std::string &key) const;
    bool has(const std::string &key) const { return props_.count(key) != 0; }

    // true once the entity was deleted from the store (or its creation
    // rolled back); a detached object no longer tracks any row
    bool detached() const { return detached_; }

  protected:
    Entity(EntityKind kind, EntityId id, PropertyMap props);

  private:
    friend class Store;
    friend class ObjectCache;

    EntityKind kind_;
    EntityId id_{0};
    PropertyMap props_{};
    bool detached_{false};
  };

  class Node final : public Entity
  {
  public:
    Node(EntityId id, PropertyMap props) : Entity(EntityKind::Node, id, std::move(props)) {}
  };

  class Edge final : public Entity
  {
  public:
    Edge(const EdgeRef &ref, PropertyMap props);

    EntityId src() const { return ref_.src; }
    EntityId dst() const { return ref_.dst; }
    const std::optional<std::string> &label() const { return ref_.label; }
    const EdgeRef &ref() const { return ref_; }

    // endpoint opposite to `node`; src for a self loop
    EntityId other(EntityId node) const { return node == ref_.src ? ref_.dst : ref_.src; }

  private:
    EdgeRef ref_{};
  };

} // namespace quasar
