#include "env.hpp"
#include "schema.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace quasar;
using namespace std::string_literals;

class SchemaTest : public ::testing::Test
{
protected:
  Env env{":memory:"};
  Schema schema{env};

  std::vector<PropertyRow> rows(const PropertyMap &props) { return encodeProperties(props); }

  void addNode(EntityId id, const PropertyMap &props = {})
  {
    Txn tx(env);
    schema.insertNode(id, rows(props));
    tx.commit();
  }

  void addEdge(EntityId id, EntityId src, EntityId dst, std::optional<std::string> label = std::nullopt)
  {
    Txn tx(env);
    schema.insertEdge(EdgeRef{.id = id, .src = src, .dst = dst, .label = std::move(label)}, {});
    tx.commit();
  }
};

TEST_F(SchemaTest, RecordsSchemaVersion)
{
  EXPECT_EQ(schema.readMeta(kMetaSchemaVersion), std::optional<int64_t>(kSchemaVersion));
  // opening again over the same connection is a no-op
  Schema again(env);
  EXPECT_EQ(again.countNodes(), 0u);
}

TEST_F(SchemaTest, RejectsUnknownSchemaVersion)
{
  schema.writeMeta(kMetaSchemaVersion, 99);
  EXPECT_THROW(Schema{env}, StorageError);
}

TEST_F(SchemaTest, NodeRowWithProperties)
{
  addNode(1, {{"name", "ada"s}, {"age", int64_t{36}}});
  auto row = schema.getNodeRow(1);
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->id, 1u);
  auto props = decodeProperties(row->props);
  EXPECT_EQ(props.at("name"), Value{"ada"s});
  EXPECT_EQ(props.at("age"), Value{int64_t{36}});

  EXPECT_FALSE(schema.getNodeRow(2).has_value());
  EXPECT_FALSE(schema.getEdgeRow(1).has_value());
  EXPECT_EQ(schema.kindOf(1), std::optional<EntityKind>(EntityKind::Node));
  EXPECT_FALSE(schema.kindOf(2).has_value());
}

TEST_F(SchemaTest, UpdatePropertiesMerges)
{
  addNode(1, {{"a", int64_t{1}}, {"b", int64_t{2}}, {"c", int64_t{3}}});

  Txn tx(env);
  schema.updateProperties(1, encodePatch({{"a", int64_t{10}}, {"b", std::monostate{}}, {"d", true}}));
  tx.commit();

  auto props = decodeProperties(schema.loadProperties(1));
  EXPECT_EQ(props.size(), 3u);
  EXPECT_EQ(props.at("a"), Value{int64_t{10}});
  EXPECT_EQ(props.count("b"), 0u);
  EXPECT_EQ(props.at("c"), Value{int64_t{3}});
  EXPECT_EQ(props.at("d"), Value{true});

  auto one = schema.loadProperty(1, "c");
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(decodeProperty(*one), Value{int64_t{3}});
  EXPECT_FALSE(schema.loadProperty(1, "b").has_value());
}

TEST_F(SchemaTest, DeleteRemovesOwnedProperties)
{
  addNode(1, {{"a", int64_t{1}}});
  Txn tx(env);
  EXPECT_TRUE(schema.deleteNode(1));
  EXPECT_FALSE(schema.deleteNode(1));
  tx.commit();
  EXPECT_TRUE(schema.loadProperties(1).empty());
}

TEST_F(SchemaTest, EdgeForeignKeysAreEnforced)
{
  addNode(1);
  Txn tx(env);
  EXPECT_THROW(schema.insertEdge(EdgeRef{.id = 2, .src = 1, .dst = 99}, {}), StorageError);
}

TEST_F(SchemaTest, FindEdgesFilters)
{
  addNode(1);
  addNode(2);
  addNode(3);
  addEdge(10, 1, 2, "knows"s);
  addEdge(11, 1, 3, "likes"s);
  addEdge(12, 2, 3, "knows"s);
  addEdge(13, 3, 1);

  auto ids = [](const std::vector<EdgeRef> &refs)
  {
    std::vector<EntityId> out;
    for (const auto &r : refs)
      out.push_back(r.id);
    return out;
  };

  EXPECT_EQ(ids(schema.findEdges({})), (std::vector<EntityId>{10, 11, 12, 13}));
  EXPECT_EQ(ids(schema.findEdges({.src = 1})), (std::vector<EntityId>{10, 11}));
  EXPECT_EQ(ids(schema.findEdges({.dst = 3})), (std::vector<EntityId>{11, 12}));
  EXPECT_EQ(ids(schema.findEdges({.label = "knows"s})), (std::vector<EntityId>{10, 12}));
  EXPECT_EQ(ids(schema.findEdges({.src = 1, .label = "knows"s})), (std::vector<EntityId>{10}));
  EXPECT_EQ(ids(schema.findEdges({.limit = 2})), (std::vector<EntityId>{10, 11}));

  auto unlabeled = schema.findEdges({.src = 3});
  ASSERT_EQ(unlabeled.size(), 1u);
  EXPECT_FALSE(unlabeled[0].label.has_value());
  EXPECT_EQ(unlabeled[0].dst, 1u);
}

TEST_F(SchemaTest, FindNodesCombinesFiltersWithAnd)
{
  addNode(1, {{"kind", "person"s}, {"active", true}});
  addNode(2, {{"kind", "person"s}, {"active", int64_t{1}}});
  addNode(3, {{"kind", "place"s}, {"active", true}});
  addNode(4, {{"kind", "person"s}});

  EXPECT_EQ(schema.findNodes({{"kind", Value{"person"s}}}), (std::vector<EntityId>{1, 2, 4}));
  EXPECT_EQ(schema.findNodes({{"kind", Value{"person"s}}, {"active", Value{true}}}), (std::vector<EntityId>{1}));
  EXPECT_EQ(schema.findNodes({{"active", Value{int64_t{1}}}}), (std::vector<EntityId>{2}));
  EXPECT_EQ(schema.findNodes({{"kind", Value{"person"s}}, {"active", std::nullopt}}), (std::vector<EntityId>{1, 2}));
  EXPECT_EQ(schema.findNodes({}), (std::vector<EntityId>{1, 2, 3, 4}));
  EXPECT_TRUE(schema.findNodes({{"missing", std::nullopt}}).empty());
}

TEST_F(SchemaTest, Counts)
{
  addNode(1);
  addNode(2);
  addEdge(3, 1, 2, "a"s);
  addEdge(4, 1, 2, "a"s);
  addEdge(5, 2, 2);

  EXPECT_EQ(schema.countNodes(), 2u);
  EXPECT_EQ(schema.countEdges(), 3u);
  auto byLabel = schema.countEdgesByLabel();
  EXPECT_EQ(byLabel.at("a"), 2u);
  EXPECT_EQ(byLabel.at(""), 1u);

  EXPECT_EQ(schema.countEdgesOf(1, Direction::Out), 2u);
  EXPECT_EQ(schema.countEdgesOf(2, Direction::In), 3u);
  EXPECT_EQ(schema.countEdgesOf(2, Direction::Both), 3u);
  EXPECT_EQ(schema.maxEntityId(), 5u);
}

TEST_F(SchemaTest, SettingsKeepTheirType)
{
  Txn tx(env);
  schema.writeSetting(encodeProperty("ratio", 0.5));
  schema.writeSetting(encodeProperty("name", "g"s));
  schema.writeSetting(encodeProperty("name", "h"s));
  tx.commit();

  auto ratio = schema.readSetting("ratio");
  ASSERT_TRUE(ratio.has_value());
  EXPECT_EQ(decodeProperty(*ratio), Value{0.5});
  EXPECT_EQ(decodeProperty(*schema.readSetting("name")), Value{"h"s});
  EXPECT_TRUE(schema.removeSetting("name"));
  EXPECT_FALSE(schema.removeSetting("name"));
  EXPECT_FALSE(schema.readSetting("name").has_value());
}

TEST_F(SchemaTest, ChangeBatchesAreAStack)
{
  EXPECT_FALSE(schema.lastChangeBatch().has_value());
  auto first = schema.appendChangeBatch("one");
  auto second = schema.appendChangeBatch("two");
  EXPECT_LT(first, second);
  EXPECT_EQ(schema.countChangeBatches(), 2u);

  auto last = schema.lastChangeBatch();
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->id, second);
  EXPECT_EQ(last->bytes, "two");

  schema.removeChangeBatch(second);
  EXPECT_EQ(schema.lastChangeBatch()->bytes, "one");
  schema.clearChangeBatches();
  EXPECT_EQ(schema.countChangeBatches(), 0u);
}

TEST(SchemaFile, SurvivesReopen)
{
  quasar_test::TempDbFile file;
  {
    Env env{file.path};
    Schema schema{env};
    Txn tx(env);
    schema.insertNode(7, encodeProperties({{"x", int64_t{1}}}));
    tx.commit();
  }
  Env env{file.path};
  Schema schema{env};
  EXPECT_TRUE(schema.nodeExists(7));
  EXPECT_EQ(schema.maxEntityId(), 7u);
}
