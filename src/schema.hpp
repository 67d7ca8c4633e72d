#pragma once
#include "env.hpp"
#include "codec.hpp"
#include "value.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quasar
{

  inline constexpr uint32_t kSchemaVersion = 1;

  enum class EntityKind : uint8_t
  {
    Node = 0,
    Edge = 1
  };

  enum class Direction : uint8_t
  {
    Out = 0,
    In = 1,
    Both = 2
  };

  // -------------------- rows ---------------------------

  struct NodeRow
  {
    EntityId id{0};
    std::vector<PropertyRow> props{};
  };

  struct EdgeRef
  {
    EntityId id{0};
    EntityId src{0};
    EntityId dst{0};
    std::optional<std::string> label{};
  };

  struct EdgeRow
  {
    EdgeRef ref{};
    std::vector<PropertyRow> props{};
  };

  struct ChangeBatchRow
  {
    int64_t id{0};
    std::string bytes{};
  };

  // -------------------- params ---------------------------

  // every filter is optional; an empty params object matches all edges
  struct FindEdgesParams
  {
    std::optional<EntityId> src{};
    std::optional<EntityId> dst{};
    std::optional<std::string> label{};
    uint32_t limit{0};
  };

  struct PropertyFilter
  {
    std::string key{};
    // nullopt matches any node that has the key
    std::optional<Value> equals{};
  };

  // Owns the relational layout (nodes, edges, properties plus the meta,
  // settings and changes side tables) and the primitive row operations the
  // store composes. Every call runs in whatever transaction is open on the
  // Env; none of them begin one on their own.
  class Schema
  {
  public:
    explicit Schema(Env &e);

    // writes
    void insertNode(EntityId id, const std::vector<PropertyRow> &props);
    void insertEdge(const EdgeRef &ref, const std::vector<PropertyRow> &props);
    void updateProperties(EntityId owner, const PropertyPatch &patch);
    bool deleteNode(EntityId id);
    bool deleteEdge(EntityId id);

    // reads / queries
    std::optional<NodeRow> getNodeRow(EntityId id) const;
    std::optional<EdgeRow> getEdgeRow(EntityId id) const;
    std::vector<PropertyRow> loadProperties(EntityId owner) const;
    std::optional<PropertyRow> loadProperty(EntityId owner, std::string_view key) const;
    std::vector<EdgeRef> findEdges(const FindEdgesParams &params) const;
    std::vector<EntityId> findNodes(const std::vector<PropertyFilter> &filters) const;
    std::optional<EntityKind> kindOf(EntityId id) const;
    bool nodeExists(EntityId id) const;

    // stats
    uint64_t countNodes() const;
    uint64_t countEdges() const;
    std::map<std::string, uint64_t> countEdgesByLabel() const;
    uint64_t countEdgesOf(EntityId node, Direction direction) const;
    EntityId maxEntityId() const;

    // meta bucket
    std::optional<int64_t> readMeta(std::string_view key) const;
    void writeMeta(std::string_view key, int64_t value);

    // settings
    std::optional<PropertyRow> readSetting(std::string_view key) const;
    void writeSetting(const PropertyRow &row);
    bool removeSetting(std::string_view key);

    // change log
    int64_t appendChangeBatch(std::string_view bytes);
    std::optional<ChangeBatchRow> lastChangeBatch() const;
    void removeChangeBatch(int64_t id);
    uint64_t countChangeBatches() const;
    void clearChangeBatches();

  private:
    void ensureTables();
    void insertProperties(EntityId owner, const std::vector<PropertyRow> &props);
    int changes() const;

    Env &env_;
  };

  // meta bucket keys
  inline constexpr std::string_view kMetaSchemaVersion = "schemaVersion";
  inline constexpr std::string_view kMetaIdSeq = "idSeq";

} // namespace quasar
