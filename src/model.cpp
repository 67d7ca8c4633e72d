#include "model.hpp"
#include <utility>

namespace quasar
{

  Entity::Entity(EntityKind kind, EntityId id, PropertyMap props)
      : kind_(kind), id_(id), props_(std::move(props))
  {
  }

  std::optional<Value> Entity::property(const std::string &key) const
  {
    auto it = props_.find(key);
    if (it == props_.end())
      return std::nullopt;
    return it->second;
  }

  Edge::Edge(const EdgeRef &ref, PropertyMap props)
      : Entity(EntityKind::Edge, ref.id, std::move(props)), ref_(ref)
  {
  }

} // namespace quasar
