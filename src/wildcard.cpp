#include "wildcard.hpp"
#include <functional>

namespace rebac
{

  bool matches(const Node &a, const Node &b)
  {
    if (a.isPermissionSet() != b.isPermissionSet())
      return false;
    if (a.nameSpace() != b.nameSpace() || a.relation() != b.relation())
      return false;
    return a.id() == b.id() || a.isWildcard() || b.isWildcard();
  }

  bool covers(const Node &held, const Node &wanted)
  {
    return matches(held, wanted) && (held.id() == wanted.id() || held.isWildcard());
  }

  size_t SlotHash::operator()(const Slot &s) const noexcept
  {
    std::hash<std::string> h;
    size_t seed = s.permissionSet ? 1 : 0;
    hash_combine(seed, h(s.nameSpace));
    hash_combine(seed, h(s.relation));
    return seed;
  }

  Slot slotOf(const Node &n)
  {
    return Slot{n.isPermissionSet(), n.nameSpace(), n.relation()};
  }

} // namespace rebac
