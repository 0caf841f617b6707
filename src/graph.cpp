#include "graph.hpp"
#include <mutex>
#include <kj/debug.h>

namespace rebac
{

  // -------------------- writes --------------------

  void RelationGraph::grant(const Node &src, const PermissionSet &dst)
  {
    validateSubject(src, "src");
    validatePermissionSet(dst, "dst");
    Node target(dst);

    {
      std::unique_lock lock(mutex_);
      if (!out_[src].insert(target).second)
        return; // already granted
      in_[target].insert(src);
      slots_[slotOf(src)].sources.insert(src);
      slots_[slotOf(target)].targets.insert(target);
      ++edges_;
    }

    KJ_LOG(INFO, "granted", formatNode(target), formatNode(src));
  }

  void RelationGraph::revoke(const Node &src, const PermissionSet &dst)
  {
    validateSubject(src, "src");
    validatePermissionSet(dst, "dst");
    Node target(dst);

    {
      std::unique_lock lock(mutex_);
      auto it = out_.find(src);
      if (it == out_.end() || it->second.erase(target) == 0)
        return; // nothing to revoke
      if (it->second.empty())
      {
        out_.erase(it);
        dropSlotMember(src, &SlotMembers::sources);
      }

      auto jt = in_.find(target);
      if (jt != in_.end())
      {
        jt->second.erase(src);
        if (jt->second.empty())
        {
          in_.erase(jt);
          dropSlotMember(target, &SlotMembers::targets);
        }
      }
      --edges_;
    }

    KJ_LOG(INFO, "revoked", formatNode(target), formatNode(src));
  }

  void RelationGraph::dropSlotMember(const Node &n, NodeSet SlotMembers::*side)
  {
    auto it = slots_.find(slotOf(n));
    if (it == slots_.end())
      return;
    (it->second.*side).erase(n);
    if (it->second.sources.empty() && it->second.targets.empty())
      slots_.erase(it);
  }

  // -------------------- reads --------------------

  bool RelationGraph::exists(const Node &src, const PermissionSet &dst) const
  {
    validateSubject(src, "src");
    validatePermissionSet(dst, "dst");
    Node target(dst);

    std::shared_lock lock(mutex_);
    auto it = out_.find(src);
    return it != out_.end() && it->second.count(target) != 0;
  }

  size_t RelationGraph::edgeCount() const
  {
    std::shared_lock lock(mutex_);
    return edges_;
  }

  std::vector<Edge> RelationGraph::edges() const
  {
    std::shared_lock lock(mutex_);
    std::vector<Edge> out;
    out.reserve(edges_);
    for (const auto &[src, dsts] : out_)
      for (const auto &dst : dsts)
        out.push_back(Edge{src, dst.permissionSet()});
    return out;
  }

  size_t RelationGraph::vertexCount() const
  {
    std::shared_lock lock(mutex_);
    size_t count = out_.size();
    for (const auto &[n, srcs] : in_)
    {
      (void)srcs;
      if (out_.find(n) == out_.end())
        ++count;
    }
    return count;
  }

} // namespace rebac
