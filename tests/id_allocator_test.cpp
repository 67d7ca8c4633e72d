#include "env.hpp"
#include "id_allocator.hpp"
#include "schema.hpp"
#include "store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace quasar;

TEST(IdAllocator, StartsAfterPersistedMaximum)
{
  Env env{":memory:"};
  Schema schema{env};
  {
    Txn tx(env);
    schema.insertNode(41, {});
    tx.commit();
  }

  IdAllocator ids{schema};
  EXPECT_EQ(ids.last(), 41u);
  EXPECT_FALSE(ids.isAllocated(0));
  EXPECT_TRUE(ids.isAllocated(41));
  EXPECT_FALSE(ids.isAllocated(42));

  Txn tx(env);
  EXPECT_EQ(ids.allocate(), 42u);
  EXPECT_EQ(ids.allocate(), 43u);
  tx.commit();
  EXPECT_EQ(schema.readMeta(kMetaIdSeq), std::optional<int64_t>(43));
}

TEST(IdAllocator, HighWaterMarkWinsOverRows)
{
  Env env{":memory:"};
  Schema schema{env};
  schema.writeMeta(kMetaIdSeq, 100);
  IdAllocator ids{schema};
  Txn tx(env);
  EXPECT_EQ(ids.allocate(), 101u);
}

TEST(IdAllocator, RejectsNegativeSequence)
{
  Env env{":memory:"};
  Schema schema{env};
  schema.writeMeta(kMetaIdSeq, -5);
  EXPECT_THROW(IdAllocator{schema}, StorageError);
}

TEST(IdAllocator, NodesAndEdgesShareOneSpace)
{
  Env env{":memory:"};
  Store store{env};
  auto a = store.createNode();
  auto b = store.createNode();
  auto e = store.createEdge(a->id(), b->id());
  auto c = store.createNode();
  EXPECT_EQ(b->id(), a->id() + 1);
  EXPECT_EQ(e->id(), b->id() + 1);
  EXPECT_EQ(c->id(), e->id() + 1);
}

TEST(IdAllocator, DeletedMaximumIsNotReissuedAfterRestart)
{
  quasar_test::TempDbFile file;
  EntityId deleted = 0;
  {
    Env env{file.path};
    Store store{env};
    store.createNode();
    deleted = store.createNode()->id();
    store.deleteNode(deleted);
  }
  Env env{file.path};
  Store store{env};
  auto fresh = store.createNode();
  EXPECT_GT(fresh->id(), deleted);
  EXPECT_THROW(store.getNode(deleted), NotFoundError);
}
