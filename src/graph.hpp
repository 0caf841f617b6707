#pragma once
#include "node.hpp"
#include "wildcard.hpp"
#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rebac
{

  // -------------------- results ---------------------------

  struct ExpandEntry
  {
    Entity src{};
    std::vector<PermissionSet> path{}; // entity side first, dst last
  };

  // In-memory tuple store plus the wildcard-aware graph searches.
  //
  // grant/revoke take the lock exclusively and do O(1) work under it.
  // Queries take it shared for the whole traversal, so every query sees one
  // consistent edge set. Arguments are validated before any lock is taken.
  class RelationGraph
  {
  public:
    RelationGraph() = default;
    RelationGraph(const RelationGraph &) = delete;
    RelationGraph &operator=(const RelationGraph &) = delete;

    // writes
    void grant(const Node &src, const PermissionSet &dst);
    void revoke(const Node &src, const PermissionSet &dst);

    // reads / queries
    bool exists(const Node &src, const PermissionSet &dst) const;
    bool isPermitted(const Node &src, const PermissionSet &dst, uint32_t maxDepth = 0) const;
    std::vector<ExpandEntry> expand(const PermissionSet &dst) const;

    size_t edgeCount() const;
    size_t vertexCount() const;
    std::vector<Edge> edges() const; // unordered snapshot of every stored tuple

  private:
    using NodeSet = std::unordered_set<Node, NodeHash>;
    using Adjacency = std::unordered_map<Node, NodeSet, NodeHash>;

    struct SlotMembers
    {
      NodeSet sources{}; // vertices with at least one outgoing edge
      NodeSet targets{}; // vertices with at least one incoming edge
    };

    void dropSlotMember(const Node &n, NodeSet SlotMembers::*side);

    // Call fn(node) for every vertex one step away; fn returns true to stop.
    // Both require mutex_ held (shared is enough).
    template <typename Fn>
    bool forEachSuccessor(const Node &n, Fn &&fn) const;
    template <typename Fn>
    bool forEachPredecessor(const Node &n, bool fanOut, Fn &&fn) const;

    mutable std::shared_mutex mutex_;
    Adjacency out_;                                     // src -> dsts
    Adjacency in_;                                      // dst -> srcs
    std::unordered_map<Slot, SlotMembers, SlotHash> slots_;
    size_t edges_{0};
  };

} // namespace rebac
