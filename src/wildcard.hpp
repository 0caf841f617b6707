#pragma once
#include "node.hpp"
#include <cstddef>
#include <string>

namespace rebac
{

  // True iff a and b are the same kind in the same namespace (and relation),
  // and their ids are equal or at least one of them is the wildcard id.
  // Relations never generalise.
  bool matches(const Node &a, const Node &b);

  // One-directional form used to decide whether a search reached its goal:
  // holding `held` grants `wanted`. A wildcard covers every id of its slot,
  // but no concrete vertex covers the wildcard.
  bool covers(const Node &held, const Node &wanted);

  // A slot groups every vertex that differs only by id: (kind, namespace, relation).
  // The wildcard vertex of a slot matches all of its members.
  struct Slot
  {
    bool permissionSet{false};
    std::string nameSpace{};
    std::string relation{};

    bool operator==(const Slot &) const = default;
  };

  struct SlotHash
  {
    size_t operator()(const Slot &s) const noexcept;
  };

  Slot slotOf(const Node &n);

} // namespace rebac
