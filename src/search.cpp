#include "graph.hpp"
#include <mutex>
#include <utility>

namespace rebac
{

  namespace
  {
    using ParentMap = std::unordered_map<Node, Node, NodeHash>;

    // Walk back-pointers from `from` to the root; the root points at itself.
    std::vector<PermissionSet> witness_path(const ParentMap &parent, const Node &from)
    {
      std::vector<PermissionSet> path;
      const Node *cur = &from;
      for (;;)
      {
        path.push_back(cur->permissionSet());
        const Node &up = parent.at(*cur);
        if (up == *cur)
          break;
        cur = &up;
      }
      return path;
    }
  } // namespace

  // -------------------- one-step neighbourhoods --------------------

  // Successors of n are the destinations of every edge whose source matches n.
  // A concrete vertex matches itself and its wildcard sibling; a wildcard
  // permission set matches every vertex in its slot. A wildcard entity only
  // follows its own edges: "every user" does not inherit one user's grants.
  template <typename Fn>
  bool RelationGraph::forEachSuccessor(const Node &n, Fn &&fn) const
  {
    auto follow = [&](const Node &source)
    {
      auto it = out_.find(source);
      if (it == out_.end())
        return false;
      for (const auto &d : it->second)
        if (fn(d))
          return true;
      return false;
    };

    if (!n.isWildcard())
      return follow(n) || follow(n.wildcardSibling());
    if (n.isEntity())
      return follow(n);

    auto slot = slots_.find(slotOf(n));
    if (slot == slots_.end())
      return false;
    for (const auto &source : slot->second.sources)
      if (follow(source))
        return true;
    return false;
  }

  // Predecessors of n are the sources of every edge whose destination matches n.
  // fn(pred, via) also gets the vertex whose edge was used: n itself, or the
  // concrete slot member when a wildcard n fans out. A concrete n reports
  // itself for edges into its wildcard sibling.
  template <typename Fn>
  bool RelationGraph::forEachPredecessor(const Node &n, bool fanOut, Fn &&fn) const
  {
    auto follow = [&](const Node &target, const Node &via)
    {
      auto it = in_.find(target);
      if (it == in_.end())
        return false;
      for (const auto &s : it->second)
        if (fn(s, via))
          return true;
      return false;
    };

    if (!n.isWildcard())
      return follow(n, n) || follow(n.wildcardSibling(), n);
    if (follow(n, n))
      return true;
    if (!fanOut)
      return false;

    auto slot = slots_.find(slotOf(n));
    if (slot == slots_.end())
      return false;
    for (const auto &target : slot->second.targets)
      if (!(target == n) && follow(target, target))
        return true;
    return false;
  }

  // -------------------- isPermitted --------------------

  bool RelationGraph::isPermitted(const Node &src, const PermissionSet &dst, uint32_t maxDepth) const
  {
    validateSubject(src, "src");
    validatePermissionSet(dst, "dst");
    const Node target(dst);

    std::shared_lock lock(mutex_);

    // The start vertex itself is not "reached"; at least one edge must be followed.
    NodeSet visited{src};
    std::vector<Node> frontier{src};
    uint32_t depth = 0;
    while (!frontier.empty())
    {
      ++depth;
      if (maxDepth != 0 && depth > maxDepth)
        return false;

      std::vector<Node> next;
      for (const auto &n : frontier)
      {
        bool reached = forEachSuccessor(n, [&](const Node &succ)
                                        {
          if (covers(succ, target))
            return true;
          if (visited.insert(succ).second)
            next.push_back(succ);
          return false; });
        if (reached)
          return true;
      }
      frontier = std::move(next);
    }
    return false;
  }

  // -------------------- expand --------------------

  std::vector<ExpandEntry> RelationGraph::expand(const PermissionSet &dst) const
  {
    validatePermissionSet(dst, "dst");
    const Node root(dst);

    std::shared_lock lock(mutex_);

    // First discovery wins; BFS order makes that the shortest path.
    // A wildcard root is only reached through its own vertex: holding one id
    // of a slot does not grant the whole slot.
    ParentMap parent;
    parent.emplace(root, root);

    std::vector<ExpandEntry> out;
    std::vector<Node> frontier{root};
    while (!frontier.empty())
    {
      std::vector<Node> next;
      for (const auto &n : frontier)
      {
        forEachPredecessor(n, !(n == root), [&](const Node &pred, const Node &via)
                           {
          if (parent.count(pred) != 0)
            return false;
          // through a concrete member of a wildcard slot: the path names the member
          Node hop = via;
          if (!(via == n))
          {
            Node up = parent.at(n);
            if (via == pred)
              hop = std::move(up);
            else
              parent.try_emplace(via, std::move(up));
          }
          parent.emplace(pred, hop);
          if (pred.isEntity())
            out.push_back(ExpandEntry{pred.entity(), witness_path(parent, hop)});
          else
            next.push_back(pred);
          return false; });
      }
      frontier = std::move(next);
    }
    return out;
  }

} // namespace rebac
