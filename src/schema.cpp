#include "schema.hpp"
#include <sqlite3.h>
#include <kj/debug.h>

namespace quasar
{

  // -------------------- layout --------------------

  static const char *const kCreateTables = R"sql(
    CREATE TABLE IF NOT EXISTS nodes(
      id INTEGER PRIMARY KEY
    );
    CREATE TABLE IF NOT EXISTS edges(
      id INTEGER PRIMARY KEY,
      src INTEGER NOT NULL REFERENCES nodes(id),
      dst INTEGER NOT NULL REFERENCES nodes(id),
      label TEXT
    );
    CREATE TABLE IF NOT EXISTS properties(
      owner_id INTEGER NOT NULL,
      key TEXT NOT NULL,
      value,
      value_type INTEGER NOT NULL,
      PRIMARY KEY(owner_id, key)
    );
    CREATE INDEX IF NOT EXISTS edges_by_src ON edges(src);
    CREATE INDEX IF NOT EXISTS edges_by_dst ON edges(dst);
    CREATE INDEX IF NOT EXISTS edges_by_label ON edges(label);
    CREATE INDEX IF NOT EXISTS properties_by_value ON properties(key, value_type, value);

    CREATE TABLE IF NOT EXISTS meta(key TEXT PRIMARY KEY, value);
    CREATE TABLE IF NOT EXISTS settings(key TEXT PRIMARY KEY, value, value_type INTEGER NOT NULL);
    CREATE TABLE IF NOT EXISTS changes(id INTEGER PRIMARY KEY AUTOINCREMENT, batch BLOB NOT NULL);
  )sql";

  static const char *const kPropsColumns = "key, value, value_type";

  static PropertyRow read_property_row(const Stmt &st, int firstCol)
  {
    PropertyRow row{};
    row.key = st.text(firstCol);
    row.cell = st.cell(firstCol + 1);
    row.type = static_cast<ValueType>(st.int64(firstCol + 2));
    return row;
  }

  static EdgeRef read_edge_ref(const Stmt &st)
  {
    EdgeRef ref{};
    ref.id = st.id(0);
    ref.src = st.id(1);
    ref.dst = st.id(2);
    if (!st.isNull(3))
      ref.label = st.text(3);
    return ref;
  }

  Schema::Schema(Env &e) : env_(e)
  {
    ensureTables();
  }

  void Schema::ensureTables()
  {
    Txn tx(env_);
    env_.exec(kCreateTables);
    auto version = readMeta(kMetaSchemaVersion);
    if (!version)
    {
      writeMeta(kMetaSchemaVersion, kSchemaVersion);
    }
    else if (*version != kSchemaVersion)
    {
      KJ_LOG(ERROR, "unsupported schema version", *version);
      throw StorageError("unsupported schema version " + std::to_string(*version));
    }
    tx.commit();
  }

  int Schema::changes() const
  {
    return sqlite3_changes(env_.raw());
  }

  // -------------------- writes --------------------

  void Schema::insertProperties(EntityId owner, const std::vector<PropertyRow> &props)
  {
    if (props.empty())
      return;
    auto st = env_.prepare("INSERT INTO properties(owner_id, key, value, value_type) VALUES(?, ?, ?, ?)");
    for (const auto &p : props)
    {
      st.reset();
      st.bind(1, owner).bind(2, std::string_view(p.key)).bindCell(3, p.cell, p.type);
      st.bind(4, int64_t(p.type));
      st.run();
    }
  }

  void Schema::insertNode(EntityId id, const std::vector<PropertyRow> &props)
  {
    auto st = env_.prepare("INSERT INTO nodes(id) VALUES(?)");
    st.bind(1, id).run();
    insertProperties(id, props);
  }

  void Schema::insertEdge(const EdgeRef &ref, const std::vector<PropertyRow> &props)
  {
    auto st = env_.prepare("INSERT INTO edges(id, src, dst, label) VALUES(?, ?, ?, ?)");
    st.bind(1, ref.id).bind(2, ref.src).bind(3, ref.dst);
    if (ref.label)
      st.bind(4, std::string_view(*ref.label));
    else
      st.bindNull(4);
    st.run();
    insertProperties(ref.id, props);
  }

  void Schema::updateProperties(EntityId owner, const PropertyPatch &patch)
  {
    if (!patch.set.empty())
    {
      auto st = env_.prepare(
          "INSERT INTO properties(owner_id, key, value, value_type) VALUES(?, ?, ?, ?) "
          "ON CONFLICT(owner_id, key) DO UPDATE SET value = excluded.value, value_type = excluded.value_type");
      for (const auto &p : patch.set)
      {
        st.reset();
        st.bind(1, owner).bind(2, std::string_view(p.key)).bindCell(3, p.cell, p.type);
        st.bind(4, int64_t(p.type));
        st.run();
      }
    }
    if (!patch.remove.empty())
    {
      auto st = env_.prepare("DELETE FROM properties WHERE owner_id = ? AND key = ?");
      for (const auto &key : patch.remove)
      {
        st.reset();
        st.bind(1, owner).bind(2, std::string_view(key));
        st.run();
      }
    }
  }

  bool Schema::deleteNode(EntityId id)
  {
    auto props = env_.prepare("DELETE FROM properties WHERE owner_id = ?");
    props.bind(1, id).run();
    auto st = env_.prepare("DELETE FROM nodes WHERE id = ?");
    st.bind(1, id).run();
    return changes() > 0;
  }

  bool Schema::deleteEdge(EntityId id)
  {
    auto props = env_.prepare("DELETE FROM properties WHERE owner_id = ?");
    props.bind(1, id).run();
    auto st = env_.prepare("DELETE FROM edges WHERE id = ?");
    st.bind(1, id).run();
    return changes() > 0;
  }

  // -------------------- reads --------------------

  std::optional<NodeRow> Schema::getNodeRow(EntityId id) const
  {
    if (!nodeExists(id))
      return std::nullopt;
    NodeRow row{};
    row.id = id;
    row.props = loadProperties(id);
    return row;
  }

  std::optional<EdgeRow> Schema::getEdgeRow(EntityId id) const
  {
    auto st = env_.prepare("SELECT id, src, dst, label FROM edges WHERE id = ?");
    st.bind(1, id);
    if (!st.step())
      return std::nullopt;
    EdgeRow row{};
    row.ref = read_edge_ref(st);
    row.props = loadProperties(id);
    return row;
  }

  std::vector<PropertyRow> Schema::loadProperties(EntityId owner) const
  {
    auto st = env_.prepare(std::string("SELECT ") + kPropsColumns + " FROM properties WHERE owner_id = ? ORDER BY key");
    st.bind(1, owner);
    std::vector<PropertyRow> out;
    while (st.step())
      out.push_back(read_property_row(st, 0));
    return out;
  }

  std::optional<PropertyRow> Schema::loadProperty(EntityId owner, std::string_view key) const
  {
    auto st = env_.prepare(std::string("SELECT ") + kPropsColumns + " FROM properties WHERE owner_id = ? AND key = ?");
    st.bind(1, owner).bind(2, key);
    if (!st.step())
      return std::nullopt;
    return read_property_row(st, 0);
  }

  std::vector<EdgeRef> Schema::findEdges(const FindEdgesParams &params) const
  {
    std::string sql = "SELECT id, src, dst, label FROM edges WHERE 1";
    if (params.src)
      sql += " AND src = ?";
    if (params.dst)
      sql += " AND dst = ?";
    if (params.label)
      sql += " AND label = ?";
    sql += " ORDER BY id";
    if (params.limit != 0)
      sql += " LIMIT ?";

    auto st = env_.prepare(sql);
    int idx = 1;
    if (params.src)
      st.bind(idx++, *params.src);
    if (params.dst)
      st.bind(idx++, *params.dst);
    if (params.label)
      st.bind(idx++, std::string_view(*params.label));
    if (params.limit != 0)
      st.bind(idx++, int64_t(params.limit));

    std::vector<EdgeRef> out;
    while (st.step())
      out.push_back(read_edge_ref(st));
    return out;
  }

  std::vector<EntityId> Schema::findNodes(const std::vector<PropertyFilter> &filters) const
  {
    if (filters.empty())
    {
      auto st = env_.prepare("SELECT id FROM nodes ORDER BY id");
      std::vector<EntityId> out;
      while (st.step())
        out.push_back(st.id(0));
      return out;
    }

    // encode first so a bad filter value fails before touching storage
    std::vector<std::optional<PropertyRow>> encoded;
    encoded.reserve(filters.size());
    for (const auto &f : filters)
    {
      if (f.equals)
        encoded.push_back(encodeProperty(f.key, *f.equals));
      else
        encoded.push_back(std::nullopt);
    }

    // the first filter drives through properties_by_value, the rest are probes
    std::string sql = "SELECT n.id FROM properties p0 JOIN nodes n ON n.id = p0.owner_id WHERE p0.key = ?";
    if (encoded[0])
      sql += " AND p0.value_type = ? AND p0.value = ?";
    for (size_t i = 1; i < filters.size(); ++i)
    {
      sql += " AND EXISTS (SELECT 1 FROM properties p WHERE p.owner_id = n.id AND p.key = ?";
      if (encoded[i])
        sql += " AND p.value_type = ? AND p.value = ?";
      sql += ")";
    }
    sql += " ORDER BY n.id";

    auto st = env_.prepare(sql);
    int idx = 1;
    for (size_t i = 0; i < filters.size(); ++i)
    {
      st.bind(idx++, std::string_view(filters[i].key));
      if (encoded[i])
      {
        st.bind(idx++, int64_t(encoded[i]->type));
        st.bindCell(idx++, encoded[i]->cell, encoded[i]->type);
      }
    }

    std::vector<EntityId> out;
    while (st.step())
      out.push_back(st.id(0));
    return out;
  }

  std::optional<EntityKind> Schema::kindOf(EntityId id) const
  {
    if (nodeExists(id))
      return EntityKind::Node;
    auto st = env_.prepare("SELECT 1 FROM edges WHERE id = ?");
    st.bind(1, id);
    if (st.step())
      return EntityKind::Edge;
    return std::nullopt;
  }

  bool Schema::nodeExists(EntityId id) const
  {
    auto st = env_.prepare("SELECT 1 FROM nodes WHERE id = ?");
    st.bind(1, id);
    return st.step();
  }

  // -------------------- stats --------------------

  uint64_t Schema::countNodes() const
  {
    auto st = env_.prepare("SELECT COUNT(*) FROM nodes");
    st.step();
    return static_cast<uint64_t>(st.int64(0));
  }

  uint64_t Schema::countEdges() const
  {
    auto st = env_.prepare("SELECT COUNT(*) FROM edges");
    st.step();
    return static_cast<uint64_t>(st.int64(0));
  }

  std::map<std::string, uint64_t> Schema::countEdgesByLabel() const
  {
    // unlabeled edges are reported under ""
    auto st = env_.prepare("SELECT IFNULL(label, ''), COUNT(*) FROM edges GROUP BY IFNULL(label, '')");
    std::map<std::string, uint64_t> out;
    while (st.step())
      out[st.text(0)] = static_cast<uint64_t>(st.int64(1));
    return out;
  }

  uint64_t Schema::countEdgesOf(EntityId node, Direction direction) const
  {
    const char *sql = "SELECT COUNT(*) FROM edges WHERE src = ?1";
    if (direction == Direction::In)
      sql = "SELECT COUNT(*) FROM edges WHERE dst = ?1";
    else if (direction == Direction::Both)
      sql = "SELECT COUNT(*) FROM edges WHERE src = ?1 OR dst = ?1";
    auto st = env_.prepare(sql);
    st.bind(1, node);
    st.step();
    return static_cast<uint64_t>(st.int64(0));
  }

  EntityId Schema::maxEntityId() const
  {
    auto st = env_.prepare("SELECT MAX(IFNULL((SELECT MAX(id) FROM nodes), 0), IFNULL((SELECT MAX(id) FROM edges), 0))");
    st.step();
    return st.id(0);
  }

  // -------------------- meta --------------------

  std::optional<int64_t> Schema::readMeta(std::string_view key) const
  {
    auto st = env_.prepare("SELECT value FROM meta WHERE key = ?");
    st.bind(1, key);
    if (!st.step() || st.isNull(0))
      return std::nullopt;
    return st.int64(0);
  }

  void Schema::writeMeta(std::string_view key, int64_t value)
  {
    auto st = env_.prepare("INSERT INTO meta(key, value) VALUES(?, ?) ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    st.bind(1, key).bind(2, value).run();
  }

  // -------------------- settings --------------------

  std::optional<PropertyRow> Schema::readSetting(std::string_view key) const
  {
    auto st = env_.prepare("SELECT key, value, value_type FROM settings WHERE key = ?");
    st.bind(1, key);
    if (!st.step())
      return std::nullopt;
    return read_property_row(st, 0);
  }

  void Schema::writeSetting(const PropertyRow &row)
  {
    auto st = env_.prepare(
        "INSERT INTO settings(key, value, value_type) VALUES(?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, value_type = excluded.value_type");
    st.bind(1, std::string_view(row.key)).bindCell(2, row.cell, row.type).bind(3, int64_t(row.type));
    st.run();
  }

  bool Schema::removeSetting(std::string_view key)
  {
    auto st = env_.prepare("DELETE FROM settings WHERE key = ?");
    st.bind(1, key).run();
    return changes() > 0;
  }

  // -------------------- change log --------------------

  int64_t Schema::appendChangeBatch(std::string_view bytes)
  {
    auto st = env_.prepare("INSERT INTO changes(batch) VALUES(?)");
    st.bindBlob(1, bytes).run();
    return sqlite3_last_insert_rowid(env_.raw());
  }

  std::optional<ChangeBatchRow> Schema::lastChangeBatch() const
  {
    auto st = env_.prepare("SELECT id, batch FROM changes ORDER BY id DESC LIMIT 1");
    if (!st.step())
      return std::nullopt;
    ChangeBatchRow row{};
    row.id = st.int64(0);
    auto c = st.cell(1);
    if (!std::holds_alternative<std::string>(c))
      throw StorageError("corrupt change batch " + std::to_string(row.id));
    row.bytes = std::move(std::get<std::string>(c));
    return row;
  }

  void Schema::removeChangeBatch(int64_t id)
  {
    auto st = env_.prepare("DELETE FROM changes WHERE id = ?");
    st.bind(1, id).run();
  }

  uint64_t Schema::countChangeBatches() const
  {
    auto st = env_.prepare("SELECT COUNT(*) FROM changes");
    st.step();
    return static_cast<uint64_t>(st.int64(0));
  }

  void Schema::clearChangeBatches()
  {
    env_.exec("DELETE FROM changes;");
  }

} // namespace quasar
