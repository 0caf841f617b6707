#include "graph.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using rebac::Node;
using rebac::PermissionSet;
using rebac::RelationGraph;

namespace
{

  Node user(const char *id) { return Node("users", id); }
  PermissionSet file(const char *id, const char *rel = "read") { return PermissionSet{"files", id, rel}; }

} // namespace

class RelationGraphTest : public ::testing::Test
{
protected:
  RelationGraph g;
};

// ---- tuple store ----

TEST_F(RelationGraphTest, GrantThenExistsAndPermitted)
{
  g.grant(user("alice"), file("foo.pdf"));
  EXPECT_TRUE(g.exists(user("alice"), file("foo.pdf")));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("foo.pdf")));
  EXPECT_FALSE(g.exists(user("bob"), file("foo.pdf")));
  EXPECT_FALSE(g.isPermitted(user("bob"), file("foo.pdf")));
}

TEST_F(RelationGraphTest, DuplicateGrantIsNoOp)
{
  g.grant(user("alice"), file("foo.pdf"));
  g.grant(user("alice"), file("foo.pdf"));
  EXPECT_EQ(g.edgeCount(), 1u);
  EXPECT_EQ(g.vertexCount(), 2u);
}

TEST_F(RelationGraphTest, RevokeRemovesEdgeAndIsolatedVertices)
{
  g.grant(user("alice"), file("foo.pdf"));
  g.revoke(user("alice"), file("foo.pdf"));
  EXPECT_FALSE(g.exists(user("alice"), file("foo.pdf")));
  EXPECT_FALSE(g.isPermitted(user("alice"), file("foo.pdf")));
  EXPECT_EQ(g.edgeCount(), 0u);
  EXPECT_EQ(g.vertexCount(), 0u);
}

TEST_F(RelationGraphTest, RevokeAbsentEdgeIsNoOp)
{
  g.grant(user("alice"), file("foo.pdf"));
  EXPECT_NO_THROW(g.revoke(user("bob"), file("foo.pdf")));
  EXPECT_NO_THROW(g.revoke(user("alice"), file("bar.pdf")));
  EXPECT_EQ(g.edgeCount(), 1u);
  EXPECT_TRUE(g.exists(user("alice"), file("foo.pdf")));
}

TEST_F(RelationGraphTest, ExistsIsLiteral)
{
  g.grant(user("alice"), file("*"));
  EXPECT_TRUE(g.exists(user("alice"), file("*")));
  EXPECT_FALSE(g.exists(user("alice"), file("random.pdf")));
  EXPECT_FALSE(g.exists(Node("users", "*"), file("*")));
}

TEST_F(RelationGraphTest, EdgesListsStoredTuples)
{
  g.grant(user("alice"), file("foo.pdf"));
  g.grant(Node(file("foo.pdf")), file("bar.pdf"));
  g.grant(user("alice"), file("foo.pdf"));

  auto edges = g.edges();
  ASSERT_EQ(edges.size(), 2u);
  auto has = [&](const rebac::Edge &e)
  {
    for (const auto &x : edges)
      if (x == e)
        return true;
    return false;
  };
  EXPECT_TRUE(has(rebac::Edge{user("alice"), file("foo.pdf")}));
  EXPECT_TRUE(has(rebac::Edge{Node(file("foo.pdf")), file("bar.pdf")}));

  g.revoke(user("alice"), file("foo.pdf"));
  edges = g.edges();
  ASSERT_EQ(edges.size(), 1u);
  EXPECT_EQ(edges[0].src, Node(file("foo.pdf")));
  EXPECT_EQ(edges[0].dst, file("bar.pdf"));
}

TEST_F(RelationGraphTest, InvalidArgumentsAreRejectedBeforeAnyChange)
{
  EXPECT_THROW(g.grant(Node("", "alice"), file("foo.pdf")), rebac::InvalidArgument);
  EXPECT_THROW(g.grant(user("alice"), PermissionSet{"files", "foo.pdf", ""}), rebac::InvalidArgument);
  EXPECT_THROW(g.grant(Node("*", "alice"), file("foo.pdf")), rebac::InvalidArgument);
  EXPECT_THROW(g.exists(user(""), file("foo.pdf")), rebac::InvalidArgument);
  EXPECT_THROW(g.isPermitted(user("alice"), PermissionSet{"", "x", "read"}), rebac::InvalidArgument);
  EXPECT_THROW(g.expand(PermissionSet{"files", "", "read"}), rebac::InvalidArgument);
  EXPECT_EQ(g.edgeCount(), 0u);

  try
  {
    g.revoke(Node("", ""), file("foo.pdf"));
    FAIL() << "expected InvalidArgument";
  }
  catch (const rebac::InvalidArgument &e)
  {
    EXPECT_STREQ(e.what(), "src.namespace must be set");
  }
}

// ---- reachability ----

TEST_F(RelationGraphTest, SetToSetGrantIsTransitive)
{
  g.grant(user("alice"), file("foo.pdf"));
  g.grant(Node(file("foo.pdf")), file("bar.pdf"));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("bar.pdf")));
  EXPECT_FALSE(g.exists(user("alice"), file("bar.pdf")));
  EXPECT_TRUE(g.isPermitted(Node(file("foo.pdf")), file("bar.pdf")));
  EXPECT_FALSE(g.isPermitted(Node(file("bar.pdf")), file("foo.pdf")));
}

TEST_F(RelationGraphTest, StartVertexIsNotReachedByItself)
{
  g.grant(user("alice"), file("foo.pdf"));
  EXPECT_FALSE(g.isPermitted(Node(file("foo.pdf")), file("foo.pdf")));
}

TEST_F(RelationGraphTest, MaxDepthBoundsPathLength)
{
  g.grant(user("alice"), file("a"));
  g.grant(Node(file("a")), file("b"));
  g.grant(Node(file("b")), file("c"));

  EXPECT_FALSE(g.isPermitted(user("alice"), file("c"), 1));
  EXPECT_FALSE(g.isPermitted(user("alice"), file("c"), 2));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("c"), 3));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("c"), 0));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("a"), 1));
}

TEST_F(RelationGraphTest, CyclesTerminate)
{
  Node a("groups", "a", "member");
  Node b("groups", "b", "member");
  g.grant(a, b.permissionSet());
  g.grant(b, a.permissionSet());

  EXPECT_TRUE(g.isPermitted(a, b.permissionSet()));
  EXPECT_TRUE(g.isPermitted(b, a.permissionSet()));
  EXPECT_TRUE(g.isPermitted(a, a.permissionSet()));
  EXPECT_FALSE(g.isPermitted(a, PermissionSet{"groups", "c", "member"}));
}

// ---- wildcards ----

TEST_F(RelationGraphTest, WildcardDestinationCoversEveryId)
{
  g.grant(user("alice"), file("*"));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("random.pdf")));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("other.pdf")));
  EXPECT_FALSE(g.isPermitted(user("alice"), file("random.pdf", "write")));
  EXPECT_FALSE(g.isPermitted(user("alice"), PermissionSet{"folders", "x", "read"}));
  EXPECT_FALSE(g.isPermitted(user("bob"), file("random.pdf")));
}

TEST_F(RelationGraphTest, RevokeKeepsWildcardPermission)
{
  g.grant(user("alice"), file("foo.pdf"));
  g.grant(user("alice"), file("*"));
  g.revoke(user("alice"), file("foo.pdf"));

  EXPECT_FALSE(g.exists(user("alice"), file("foo.pdf")));
  EXPECT_TRUE(g.isPermitted(user("alice"), file("foo.pdf")));
}

TEST_F(RelationGraphTest, WildcardEntityCoversEveryUser)
{
  g.grant(Node("users", "*"), PermissionSet{"docs", "handbook", "read"});
  EXPECT_TRUE(g.isPermitted(user("bob"), PermissionSet{"docs", "handbook", "read"}));
  EXPECT_TRUE(g.isPermitted(user("charlie"), PermissionSet{"docs", "handbook", "read"}));
  EXPECT_FALSE(g.isPermitted(Node("groups", "ops"), PermissionSet{"docs", "handbook", "read"}));
}

TEST_F(RelationGraphTest, WildcardEntityDoesNotInheritMemberGrants)
{
  g.grant(user("alice"), file("foo.pdf"));
  EXPECT_FALSE(g.isPermitted(Node("users", "*"), file("foo.pdf")));
}

TEST_F(RelationGraphTest, WildcardSourcedEdgeIsFollowedFromConcreteSet)
{
  g.grant(Node(file("*")), PermissionSet{"folders", "shared", "view"});
  g.grant(user("alice"), file("foo.pdf"));

  EXPECT_TRUE(g.isPermitted(user("alice"), PermissionSet{"folders", "shared", "view"}));
  EXPECT_FALSE(g.isPermitted(user("alice"), PermissionSet{"folders", "other", "view"}));
}

TEST_F(RelationGraphTest, WildcardSetFollowsConcreteMembersOfItsSlot)
{
  g.grant(Node(file("foo.pdf")), PermissionSet{"folders", "shared", "view"});
  EXPECT_TRUE(g.isPermitted(Node(file("*")), PermissionSet{"folders", "shared", "view"}));
  EXPECT_FALSE(g.isPermitted(Node(file("*", "write")), PermissionSet{"folders", "shared", "view"}));
}

TEST_F(RelationGraphTest, OneIdDoesNotGrantTheWholeSlot)
{
  g.grant(user("alice"), file("foo.pdf"));
  EXPECT_FALSE(g.isPermitted(user("alice"), file("*")));
  EXPECT_TRUE(g.expand(file("*")).empty());

  g.grant(user("bob"), file("*"));
  EXPECT_TRUE(g.isPermitted(user("bob"), file("*")));
  EXPECT_FALSE(g.isPermitted(user("alice"), file("*")));
}

// ---- expand ----

TEST_F(RelationGraphTest, ExpandDirectGrant)
{
  g.grant(user("alice"), file("foo.pdf"));
  auto rows = g.expand(file("foo.pdf"));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].src, (rebac::Entity{"users", "alice"}));
  ASSERT_EQ(rows[0].path.size(), 1u);
  EXPECT_EQ(rows[0].path[0], file("foo.pdf"));
}

TEST_F(RelationGraphTest, ExpandEmptyGraph)
{
  EXPECT_TRUE(g.expand(file("foo.pdf")).empty());
}

TEST_F(RelationGraphTest, ExpandPathRunsFromEntityToDst)
{
  g.grant(user("alice"), file("a"));
  g.grant(Node(file("a")), file("b"));
  g.grant(Node(file("b")), file("c"));

  auto rows = g.expand(file("c"));
  ASSERT_EQ(rows.size(), 1u);
  ASSERT_EQ(rows[0].path.size(), 3u);
  EXPECT_EQ(rows[0].path[0], file("a"));
  EXPECT_EQ(rows[0].path[1], file("b"));
  EXPECT_EQ(rows[0].path[2], file("c"));
}

TEST_F(RelationGraphTest, ExpandReportsEachEntityOnceWithShortestPath)
{
  g.grant(user("alice"), file("a"));
  g.grant(Node(file("a")), file("b"));
  g.grant(Node(file("b")), file("c"));
  g.grant(user("alice"), file("c"));
  g.grant(user("bob"), file("b"));

  auto rows = g.expand(file("c"));
  ASSERT_EQ(rows.size(), 2u);
  for (const auto &row : rows)
  {
    if (row.src.id == "alice")
    {
      ASSERT_EQ(row.path.size(), 1u);
      EXPECT_EQ(row.path[0], file("c"));
    }
    else
    {
      EXPECT_EQ(row.src.id, "bob");
      ASSERT_EQ(row.path.size(), 2u);
      EXPECT_EQ(row.path[0], file("b"));
      EXPECT_EQ(row.path[1], file("c"));
    }
  }
}

TEST_F(RelationGraphTest, ExpandFollowsWildcardDestination)
{
  g.grant(user("alice"), file("*"));
  auto rows = g.expand(file("foo.pdf"));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].src.id, "alice");
  ASSERT_EQ(rows[0].path.size(), 1u);
  EXPECT_EQ(rows[0].path.back(), file("foo.pdf"));
}

TEST_F(RelationGraphTest, ExpandTerminatesOnCycles)
{
  PermissionSet a{"groups", "a", "member"};
  PermissionSet b{"groups", "b", "member"};
  g.grant(Node(a), b);
  g.grant(Node(b), a);
  g.grant(user("alice"), a);

  auto rows = g.expand(b);
  ASSERT_EQ(rows.size(), 1u);
  ASSERT_EQ(rows[0].path.size(), 2u);
  EXPECT_EQ(rows[0].path[0], a);
  EXPECT_EQ(rows[0].path[1], b);
}

TEST_F(RelationGraphTest, ExpandThroughWildcardSourceNamesConcreteMember)
{
  PermissionSet view{"docs", "x", "view"};
  g.grant(Node(file("*")), view);
  g.grant(user("alice"), file("foo.pdf"));

  EXPECT_TRUE(g.isPermitted(user("alice"), view));

  auto rows = g.expand(view);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].src, (rebac::Entity{"users", "alice"}));
  ASSERT_EQ(rows[0].path.size(), 2u);
  EXPECT_EQ(rows[0].path[0], file("foo.pdf"));
  EXPECT_EQ(rows[0].path[1], view);
}

TEST_F(RelationGraphTest, ExpandWildcardRootListsOnlyWildcardHolders)
{
  g.grant(Node(file("*")), PermissionSet{"docs", "x", "view"});
  g.grant(user("alice"), file("foo.pdf"));
  EXPECT_FALSE(g.isPermitted(user("alice"), file("*")));
  EXPECT_TRUE(g.expand(file("*")).empty());

  g.grant(user("bob"), file("*"));
  auto rows = g.expand(file("*"));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].src.id, "bob");
  ASSERT_EQ(rows[0].path.size(), 1u);
  EXPECT_EQ(rows[0].path[0], file("*"));
}

TEST_F(RelationGraphTest, ExpandThroughWildcardSourceKeepsEveryPathReal)
{
  PermissionSet view{"docs", "x", "view"};
  g.grant(Node(file("*")), view);
  g.grant(user("alice"), file("*"));
  g.grant(user("bob"), file("baz.pdf"));
  g.grant(Node(file("bar.pdf")), file("baz.pdf"));
  g.grant(user("carol"), file("bar.pdf"));

  auto rows = g.expand(view);
  ASSERT_EQ(rows.size(), 3u);
  for (const auto &row : rows)
  {
    ASSERT_FALSE(row.path.empty());
    EXPECT_EQ(row.path.back(), view);
    // the first hop is an edge the entity actually holds
    EXPECT_TRUE(g.exists(Node(row.src), row.path.front())) << row.src.id;
    EXPECT_TRUE(g.isPermitted(Node(row.src), view)) << row.src.id;
    if (row.src.id == "carol")
      EXPECT_EQ(row.path[0], file("bar.pdf"));
  }
}

// ---- concurrency ----

TEST_F(RelationGraphTest, ReadersNeverSeeHalfAppliedWrites)
{
  g.grant(user("alice"), file("foo.pdf"));
  g.grant(Node(file("foo.pdf")), file("bar.pdf"));

  std::atomic<bool> stop{false};
  std::atomic<int> failures{0};

  std::thread writer([&]()
                     {
    for (int i = 0; i < 2000; ++i) {
      g.grant(user("bob"), file("foo.pdf"));
      g.revoke(user("bob"), file("foo.pdf"));
    }
    stop = true; });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r)
  {
    readers.emplace_back([&]()
                         {
      while (!stop) {
        if (!g.isPermitted(user("alice"), file("bar.pdf")))
          ++failures;
        (void)g.exists(user("bob"), file("foo.pdf"));
        if (g.expand(file("bar.pdf")).empty())
          ++failures;
      } });
  }

  writer.join();
  for (auto &t : readers)
    t.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(g.edgeCount(), 2u);
  EXPECT_FALSE(g.exists(user("bob"), file("foo.pdf")));
}
