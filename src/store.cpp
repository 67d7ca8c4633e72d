#include "store.hpp"
#include "codec.hpp"
#include <sqlite3.h>
#include <kj/debug.h>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace quasar
{

  static int64_t now_ms()
  {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }

  static std::string id_str(EntityId id)
  {
    return std::to_string(id);
  }

  // -------------------- Transaction --------------------

  Store::Transaction::Transaction(Store &store) : store_(store), txn_(store.env_)
  {
    store_.frames_.emplace_back();
    level_ = store_.frames_.size();
  }

  Store::Transaction::~Transaction() noexcept
  {
    if (txn_.active())
      finishRollback();
  }

  void Store::Transaction::commit()
  {
    if (!txn_.active())
      throw std::logic_error("transaction already finished");
    if (level_ != store_.frames_.size())
      throw std::logic_error("commit with an inner transaction still open");

    if (level_ == 1)
    {
      Frame &frame = store_.frames_.back();
      if (store_.options_.recordChanges && !frame.changes.empty())
      {
        ChangeBatch batch{};
        batch.timestampMs = now_ms();
        batch.changes = frame.changes;
        store_.schema_.appendChangeBatch(encodeChangeBatch(batch));
      }
      txn_.commit();
      store_.frames_.pop_back();
      return;
    }

    txn_.commit();
    Frame inner = std::move(store_.frames_.back());
    store_.frames_.pop_back();
    Frame &outer = store_.frames_.back();
    outer.touched.merge(inner.touched);
    for (auto &c : inner.changes)
      outer.changes.push_back(std::move(c));
  }

  void Store::Transaction::rollback()
  {
    if (!txn_.active())
      throw std::logic_error("transaction already finished");
    if (level_ != store_.frames_.size())
      throw std::logic_error("rollback with an inner transaction still open");

    txn_.abort();
    Frame frame = std::move(store_.frames_.back());
    store_.frames_.pop_back();
    KJ_LOG(WARNING, "transaction rolled back", level_, frame.touched.size());
    for (auto &[id, e] : frame.touched)
      store_.cache_.refresh(e);
  }

  void Store::Transaction::finishRollback() noexcept
  {
    try
    {
      rollback();
    }
    catch (const std::exception &e)
    {
      // live objects may disagree with the rows now, start over from storage
      KJ_LOG(ERROR, "rollback left the object cache stale", e.what());
      store_.cache_.invalidateAll();
    }
  }

  // -------------------- Store --------------------

  Store::Store(Env &e, const StoreOptions &options)
      : env_(e), options_(options), schema_(e), ids_(schema_), cache_(schema_)
  {
  }

  void Store::touch(const std::shared_ptr<Entity> &e)
  {
    if (frames_.empty())
      throw std::logic_error("mutation outside a transaction");
    frames_.back().touched.emplace(e->id(), e);
  }

  void Store::record(Change change)
  {
    if (!options_.recordChanges)
      return;
    frames_.back().changes.push_back(std::move(change));
  }

  std::shared_ptr<Node> Store::loadNode(EntityId id)
  {
    auto n = cache_.node(id);
    if (!n)
      throw StorageError("node " + id_str(id) + " is referenced but missing");
    return n;
  }

  std::shared_ptr<Edge> Store::loadEdge(EntityId id)
  {
    auto e = cache_.edge(id);
    if (!e)
      throw StorageError("edge " + id_str(id) + " is referenced but missing");
    return e;
  }

  EntityId Store::handleId(const std::shared_ptr<Entity> &e) const
  {
    if (!e)
      throw std::invalid_argument("null entity handle");
    if (e->detached())
      throw NotFoundError("entity " + id_str(e->id()) + " was deleted");
    return e->id();
  }

  // -------------------- create / get --------------------

  std::shared_ptr<Node> Store::createNode(const PropertyMap &props)
  {
    auto rows = encodeProperties(props);

    Transaction tx(*this);
    EntityId id = ids_.allocate();
    schema_.insertNode(id, rows);
    auto n = std::make_shared<Node>(id, props);
    cache_.adopt(n);
    touch(n);
    record(Change{.op = ChangeOp::Created, .kind = EntityKind::Node, .ref = EdgeRef{.id = id}, .props = props});
    tx.commit();
    return n;
  }

  std::shared_ptr<Edge> Store::createEdge(EntityId src, EntityId dst,
                                          const std::optional<std::string> &label,
                                          const PropertyMap &props)
  {
    if (label && (label->empty() || !isValidUtf8(*label)))
      throw TypeError("edge label must be non-empty utf-8");
    auto rows = encodeProperties(props);

    for (EntityId end : {src, dst})
    {
      if (!ids_.isAllocated(end) || !schema_.nodeExists(end))
        throw DanglingReferenceError("edge endpoint " + id_str(end) + " is not an existing node");
    }

    Transaction tx(*this);
    EdgeRef ref{.id = ids_.allocate(), .src = src, .dst = dst, .label = label};
    schema_.insertEdge(ref, rows);
    auto e = std::make_shared<Edge>(ref, props);
    cache_.adopt(e);
    touch(e);
    record(Change{.op = ChangeOp::Created, .kind = EntityKind::Edge, .ref = ref, .props = props});
    tx.commit();
    return e;
  }

  std::shared_ptr<Node> Store::getNode(EntityId id)
  {
    std::shared_ptr<Node> n;
    if (ids_.isAllocated(id))
      n = cache_.node(id);
    if (!n)
      throw NotFoundError("node " + id_str(id) + " not found");
    return n;
  }

  std::shared_ptr<Edge> Store::getEdge(EntityId id)
  {
    std::shared_ptr<Edge> e;
    if (ids_.isAllocated(id))
      e = cache_.edge(id);
    if (!e)
      throw NotFoundError("edge " + id_str(id) + " not found");
    return e;
  }

  std::shared_ptr<Entity> Store::getEntity(EntityId id)
  {
    std::shared_ptr<Entity> e;
    if (ids_.isAllocated(id))
      e = cache_.entity(id);
    if (!e)
      throw NotFoundError("entity " + id_str(id) + " not found");
    return e;
  }

  bool Store::exists(EntityId id)
  {
    return kindOf(id).has_value();
  }

  std::optional<EntityKind> Store::kindOf(EntityId id)
  {
    if (!ids_.isAllocated(id))
      return std::nullopt;
    if (auto e = cache_.peek(id))
      return e->kind();
    return schema_.kindOf(id);
  }

  // -------------------- delete --------------------

  void Store::dropEdge(const std::shared_ptr<Edge> &e)
  {
    touch(e);
    if (!schema_.deleteEdge(e->id()))
      throw StorageError("edge " + id_str(e->id()) + " vanished during delete");
    cache_.evict(e->id());
    record(Change{.op = ChangeOp::Deleted, .kind = EntityKind::Edge, .ref = e->ref(), .props = e->properties()});
  }

  std::vector<EntityId> Store::incidentEdges(EntityId node)
  {
    std::vector<EntityId> incident;
    for (const auto &ref : schema_.findEdges(FindEdgesParams{.src = node}))
      incident.push_back(ref.id);
    for (const auto &ref : schema_.findEdges(FindEdgesParams{.dst = node}))
    {
      // self loops were already listed as outgoing
      if (ref.src != ref.dst)
        incident.push_back(ref.id);
    }
    return incident;
  }

  void Store::rejectIncident(EntityId node, const std::vector<EntityId> &incident)
  {
    if (!incident.empty())
      throw ReferentialIntegrityError("node " + id_str(node) + " still has " +
                                      std::to_string(incident.size()) + " incident edge(s)");
  }

  void Store::dropNode(const std::shared_ptr<Node> &n, const std::vector<EntityId> &incident)
  {
    for (EntityId id : incident)
      dropEdge(loadEdge(id));

    touch(n);
    if (!schema_.deleteNode(n->id()))
      throw StorageError("node " + id_str(n->id()) + " vanished during delete");
    cache_.evict(n->id());
    record(Change{.op = ChangeOp::Deleted, .kind = EntityKind::Node, .ref = EdgeRef{.id = n->id()}, .props = n->properties()});
  }

  void Store::deleteNode(EntityId id, DeletePolicy policy)
  {
    auto n = getNode(id);
    auto incident = incidentEdges(id);
    if (policy == DeletePolicy::Reject)
      rejectIncident(id, incident);

    Transaction tx(*this);
    dropNode(n, incident);
    tx.commit();
  }

  void Store::deleteEdge(EntityId id)
  {
    Transaction tx(*this);
    dropEdge(getEdge(id));
    tx.commit();
  }

  // -------------------- properties --------------------

  void Store::patchEntity(const std::shared_ptr<Entity> &e, const PropertyMap &patch)
  {
    PropertyMap before;
    PropertyMap after;
    for (const auto &[key, val] : patch)
    {
      Value current = e->property(key).value_or(Value{std::monostate{}});
      if (current == val)
        continue;
      before.emplace(key, std::move(current));
      after.emplace(key, val);
    }
    if (after.empty())
      return;
    auto encoded = encodePatch(after);

    Transaction tx(*this);
    touch(e);
    schema_.updateProperties(e->id(), encoded);
    for (const auto &[key, val] : after)
    {
      if (isNull(val))
        e->props_.erase(key);
      else
        e->props_[key] = val;
    }
    record(Change{.op = ChangeOp::Updated,
                  .kind = e->kind(),
                  .ref = EdgeRef{.id = e->id()},
                  .props = {},
                  .before = std::move(before),
                  .after = std::move(after)});
    tx.commit();
  }

  void Store::setProperty(EntityId id, const std::string &key, const Value &value)
  {
    // a patch would read null as removal, a plain set must reject it
    encodeProperty(key, value);
    patchEntity(getEntity(id), PropertyMap{{key, value}});
  }

  std::optional<Value> Store::getProperty(EntityId id, const std::string &key)
  {
    return getEntity(id)->property(key);
  }

  bool Store::removeProperty(EntityId id, const std::string &key)
  {
    auto e = getEntity(id);
    if (!e->has(key))
      return false;
    patchEntity(e, PropertyMap{{key, std::monostate{}}});
    return true;
  }

  void Store::updateProperties(EntityId id, const PropertyMap &patch)
  {
    patchEntity(getEntity(id), patch);
  }

  void Store::setProperty(const std::shared_ptr<Entity> &e, const std::string &key, const Value &value)
  {
    setProperty(handleId(e), key, value);
  }

  std::optional<Value> Store::getProperty(const std::shared_ptr<Entity> &e, const std::string &key)
  {
    return getProperty(handleId(e), key);
  }

  bool Store::removeProperty(const std::shared_ptr<Entity> &e, const std::string &key)
  {
    return removeProperty(handleId(e), key);
  }

  void Store::updateProperties(const std::shared_ptr<Entity> &e, const PropertyMap &patch)
  {
    updateProperties(handleId(e), patch);
  }

  // -------------------- adjacency / lookup --------------------

  std::vector<Neighbor> Store::neighbors(EntityId node, Direction direction,
                                         const std::optional<std::string> &label)
  {
    getNode(node);

    std::vector<Neighbor> out;
    if (direction != Direction::In)
    {
      for (const auto &ref : schema_.findEdges(FindEdgesParams{.src = node, .label = label}))
        out.push_back(Neighbor{loadEdge(ref.id), loadNode(ref.dst), Direction::Out});
    }
    if (direction != Direction::Out)
    {
      for (const auto &ref : schema_.findEdges(FindEdgesParams{.dst = node, .label = label}))
      {
        if (direction == Direction::Both && ref.src == ref.dst)
          continue;
        out.push_back(Neighbor{loadEdge(ref.id), loadNode(ref.src), Direction::In});
      }
    }
    return out;
  }

  uint64_t Store::degree(EntityId node, Direction direction)
  {
    getNode(node);
    return schema_.countEdgesOf(node, direction);
  }

  std::vector<std::shared_ptr<Node>> Store::findByProperty(const std::string &key, const Value &value)
  {
    return findNodes({PropertyFilter{key, value}});
  }

  std::vector<std::shared_ptr<Node>> Store::findNodes(const std::vector<PropertyFilter> &filters)
  {
    std::vector<std::shared_ptr<Node>> out;
    for (EntityId id : schema_.findNodes(filters))
      out.push_back(loadNode(id));
    return out;
  }

  std::vector<std::shared_ptr<Edge>> Store::findEdges(const FindEdgesParams &params)
  {
    std::vector<std::shared_ptr<Edge>> out;
    for (const auto &ref : schema_.findEdges(params))
      out.push_back(loadEdge(ref.id));
    return out;
  }

  GraphStats Store::stats()
  {
    GraphStats s{};
    s.nodes = schema_.countNodes();
    s.edges = schema_.countEdges();
    s.edgesByLabel = schema_.countEdgesByLabel();
    s.changeBatches = schema_.countChangeBatches();
    s.schemaVersion = schema_.readMeta(kMetaSchemaVersion).value_or(0);
    s.sqliteVersion = sqlite3_libversion();
    s.cachedObjects = cache_.liveCount();
    return s;
  }

  // -------------------- settings --------------------

  void Store::setSetting(const std::string &key, const Value &value)
  {
    auto row = encodeProperty(key, value);
    Transaction tx(*this);
    schema_.writeSetting(row);
    tx.commit();
  }

  std::optional<Value> Store::setting(const std::string &key)
  {
    auto row = schema_.readSetting(key);
    if (!row)
      return std::nullopt;
    return decodeProperty(*row);
  }

  bool Store::removeSetting(const std::string &key)
  {
    Transaction tx(*this);
    bool removed = schema_.removeSetting(key);
    tx.commit();
    return removed;
  }

  // -------------------- change log --------------------

  void Store::revert(const Change &change)
  {
    switch (change.op)
    {
    case ChangeOp::Created:
      if (change.kind == EntityKind::Edge)
        dropEdge(loadEdge(change.id()));
      else
      {
        auto incident = incidentEdges(change.id());
        rejectIncident(change.id(), incident);
        dropNode(loadNode(change.id()), incident);
      }
      break;

    case ChangeOp::Deleted:
    {
      auto rows = encodeProperties(change.props);
      if (change.kind == EntityKind::Edge)
      {
        for (EntityId end : {change.ref.src, change.ref.dst})
        {
          if (!schema_.nodeExists(end))
            throw DanglingReferenceError("cannot restore edge " + id_str(change.id()) +
                                         ": endpoint " + id_str(end) + " is gone");
        }
        schema_.insertEdge(change.ref, rows);
      }
      else
      {
        schema_.insertNode(change.id(), rows);
      }
      // revives the instance retired by the delete when a holder still has it
      auto e = cache_.entity(change.id());
      if (!e)
        throw StorageError("restored entity " + id_str(change.id()) + " did not load");
      touch(e);
      break;
    }

    case ChangeOp::Updated:
    {
      auto e = cache_.entity(change.id());
      if (!e)
        throw StorageError("cannot revert update of " + id_str(change.id()) + ": entity is gone");
      patchEntity(e, change.before);
      break;
    }
    }
  }

  std::vector<Change> Store::undo()
  {
    if (inTransaction())
      throw std::logic_error("undo inside an open transaction");

    auto last = schema_.lastChangeBatch();
    if (!last)
      return {};
    auto batch = decodeChangeBatch(last->bytes);

    Transaction tx(*this);
    for (auto it = batch.changes.rbegin(); it != batch.changes.rend(); ++it)
      revert(*it);
    schema_.removeChangeBatch(last->id);
    // the inverse is not itself logged
    frames_.back().changes.clear();
    tx.commit();

    KJ_LOG(INFO, "undid change batch", last->id, batch.changes.size());
    return batch.changes;
  }

  uint64_t Store::changeCount()
  {
    return schema_.countChangeBatches();
  }

  void Store::clearChanges()
  {
    Transaction tx(*this);
    schema_.clearChangeBatches();
    tx.commit();
  }

  // -------------------- cache --------------------

  void Store::invalidateCache()
  {
    if (inTransaction())
      throw std::logic_error("cannot invalidate the cache inside an open transaction");
    cache_.invalidateAll();
  }

  std::shared_ptr<Entity> Store::refresh(EntityId id)
  {
    if (auto e = cache_.peek(id))
      return cache_.refresh(e) ? e : nullptr;
    return cache_.entity(id);
  }

} // namespace quasar
