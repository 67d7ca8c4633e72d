#pragma once
#include "schema.hpp"
#include "value.hpp"

namespace quasar
{

  // Hands out identifiers from one space shared by nodes and edges. The next
  // id is derived at startup from the larger of the highest persisted entity
  // id and the persisted high-water mark, so ids freed by deletes are never
  // issued again, not even after a restart.
  class IdAllocator
  {
  public:
    explicit IdAllocator(Schema &schema);

    // must be called inside a write transaction
    EntityId allocate();

    bool isAllocated(EntityId id) const { return id != 0 && id <= last_; }
    EntityId last() const { return last_; }

  private:
    Schema &schema_;
    EntityId last_{0};
  };

} // namespace quasar
