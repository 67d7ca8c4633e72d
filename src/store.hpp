#pragma once
#include "cache.hpp"
#include "changelog.hpp"
#include "env.hpp"
#include "id_allocator.hpp"
#include "model.hpp"
#include "schema.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quasar
{

  enum class DeletePolicy : uint8_t
  {
    // fail with ReferentialIntegrityError while incident edges exist
    Reject = 0,
    // delete incident edges in both directions, then the node
    Cascade = 1
  };

  struct StoreOptions
  {
    // append one change batch per committed outermost transaction
    bool recordChanges{true};
  };

  // -------------------- results ---------------------------

  struct Neighbor
  {
    std::shared_ptr<Edge> edge{};
    std::shared_ptr<Node> node{};
    // Out: node is the edge target, In: node is the edge source
    Direction direction{Direction::Out};
  };

  struct GraphStats
  {
    uint64_t nodes{0};
    uint64_t edges{0};
    std::map<std::string, uint64_t> edgesByLabel{}; // "" for unlabeled edges
    uint64_t changeBatches{0};
    int64_t schemaVersion{0};
    std::string sqliteVersion{};
    size_t cachedObjects{0};
  };

  class Store
  {
  public:
    explicit Store(Env &e, const StoreOptions &options = StoreOptions{});
    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    // Scoped unit of work. Nested instances map to nested savepoints.
    // Leaving scope without commit() rolls back the rows and reloads every
    // entity touched inside the scope, so live objects match the rows again.
    class Transaction
    {
    public:
      explicit Transaction(Store &store);
      ~Transaction() noexcept;
      Transaction(const Transaction &) = delete;
      Transaction &operator=(const Transaction &) = delete;

      bool active() const { return txn_.active(); }
      void commit();
      void rollback();

    private:
      void finishRollback() noexcept;

      Store &store_;
      Txn txn_;
      size_t level_{0};
    };

    // nodes / edges
    std::shared_ptr<Node> createNode(const PropertyMap &props = {});
    std::shared_ptr<Edge> createEdge(EntityId src, EntityId dst,
                                     const std::optional<std::string> &label = std::nullopt,
                                     const PropertyMap &props = {});
    std::shared_ptr<Node> getNode(EntityId id);
    std::shared_ptr<Edge> getEdge(EntityId id);
    std::shared_ptr<Entity> getEntity(EntityId id);
    bool exists(EntityId id);
    std::optional<EntityKind> kindOf(EntityId id);
    void deleteNode(EntityId id, DeletePolicy policy = DeletePolicy::Reject);
    void deleteEdge(EntityId id);

    // properties, for nodes and edges alike
    void setProperty(EntityId id, const std::string &key, const Value &value);
    std::optional<Value> getProperty(EntityId id, const std::string &key);
    bool removeProperty(EntityId id, const std::string &key);
    // merge; a null value removes the key
    void updateProperties(EntityId id, const PropertyMap &patch);

    void setProperty(const std::shared_ptr<Entity> &e, const std::string &key, const Value &value);
    std::optional<Value> getProperty(const std::shared_ptr<Entity> &e, const std::string &key);
    bool removeProperty(const std::shared_ptr<Entity> &e, const std::string &key);
    void updateProperties(const std::shared_ptr<Entity> &e, const PropertyMap &patch);

    // adjacency / lookup
    std::vector<Neighbor> neighbors(EntityId node, Direction direction = Direction::Out,
                                    const std::optional<std::string> &label = std::nullopt);
    uint64_t degree(EntityId node, Direction direction = Direction::Out);
    std::vector<std::shared_ptr<Node>> findByProperty(const std::string &key, const Value &value);
    std::vector<std::shared_ptr<Node>> findNodes(const std::vector<PropertyFilter> &filters);
    std::vector<std::shared_ptr<Edge>> findEdges(const FindEdgesParams &params);

    GraphStats stats();

    // settings, not part of the change log
    void setSetting(const std::string &key, const Value &value);
    std::optional<Value> setting(const std::string &key);
    bool removeSetting(const std::string &key);

    // change log
    std::vector<Change> undo();
    uint64_t changeCount();
    void clearChanges();

    void invalidateCache();
    // reload the live object of `id` from its rows; nullptr once the row is gone
    std::shared_ptr<Entity> refresh(EntityId id);

    bool inTransaction() const { return !frames_.empty(); }

  private:
    struct Frame
    {
      std::unordered_map<EntityId, std::shared_ptr<Entity>> touched;
      std::vector<Change> changes;
    };

    void touch(const std::shared_ptr<Entity> &e);
    void record(Change change);

    EntityId handleId(const std::shared_ptr<Entity> &e) const;
    void patchEntity(const std::shared_ptr<Entity> &e, const PropertyMap &patch);
    void dropEdge(const std::shared_ptr<Edge> &e);
    std::vector<EntityId> incidentEdges(EntityId node);
    void rejectIncident(EntityId node, const std::vector<EntityId> &incident);
    void dropNode(const std::shared_ptr<Node> &n, const std::vector<EntityId> &incident);
    std::shared_ptr<Node> loadNode(EntityId id);
    std::shared_ptr<Edge> loadEdge(EntityId id);
    void revert(const Change &change);

    Env &env_;
    StoreOptions options_;
    Schema schema_;
    IdAllocator ids_;
    ObjectCache cache_;
    std::vector<Frame> frames_;
  };

  using Transaction = Store::Transaction;

} // namespace quasar
