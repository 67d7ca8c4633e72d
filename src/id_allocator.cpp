#include "id_allocator.hpp"
#include <algorithm>

namespace quasar
{

  IdAllocator::IdAllocator(Schema &schema) : schema_(schema)
  {
    EntityId persisted = schema_.maxEntityId();
    auto seq = schema_.readMeta(kMetaIdSeq);
    if (seq && *seq < 0)
      throw StorageError("corrupt id sequence");
    last_ = std::max<EntityId>(persisted, seq ? static_cast<EntityId>(*seq) : 0);
  }

  EntityId IdAllocator::allocate()
  {
    EntityId next = last_ + 1;
    schema_.writeMeta(kMetaIdSeq, static_cast<int64_t>(next));
    // advance even if the surrounding transaction later rolls back; an id
    // that never reached disk is simply skipped
    last_ = next;
    return next;
  }

} // namespace quasar
