#pragma once
#include "schema.hpp"
#include "value.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace quasar
{

  enum class ChangeOp : uint8_t
  {
    Created = 0,
    Deleted = 1,
    Updated = 2
  };

  struct Change
  {
    ChangeOp op{ChangeOp::Created};
    EntityKind kind{EntityKind::Node};
    // ref.id is the entity id; endpoints and label are set for edges
    EdgeRef ref{};
    // created / deleted: full property image
    PropertyMap props{};
    // updated: values before and after, null marks an absent key
    PropertyMap before{};
    PropertyMap after{};

    EntityId id() const { return ref.id; }
  };

  struct ChangeBatch
  {
    int64_t timestampMs{0};
    std::vector<Change> changes{};
  };

  // Cap'n Proto flat-array message, see schemas/changes.capnp
  std::string encodeChangeBatch(const ChangeBatch &batch);
  ChangeBatch decodeChangeBatch(std::string_view bytes);

} // namespace quasar
