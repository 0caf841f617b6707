#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace rebac
{

  // Reserved id: a vertex with this id stands for every id in its namespace.
  inline constexpr std::string_view kWildcardId = "*";

  struct InvalidArgument : std::invalid_argument
  {
    using std::invalid_argument::invalid_argument;
  };

  // -------------------- vertices ---------------------------

  struct Entity
  {
    std::string nameSpace{};
    std::string id{};

    bool operator==(const Entity &) const = default;
  };

  struct PermissionSet
  {
    std::string nameSpace{};
    std::string id{};
    std::string relation{};

    bool operator==(const PermissionSet &) const = default;
  };

  class Node
  {
  public:
    Node() = default;
    Node(Entity e) : value_(std::move(e)) {}
    Node(PermissionSet s) : value_(std::move(s)) {}
    Node(std::string nameSpace, std::string id);
    Node(std::string nameSpace, std::string id, std::string relation);

    bool isEntity() const { return std::holds_alternative<Entity>(value_); }
    bool isPermissionSet() const { return std::holds_alternative<PermissionSet>(value_); }

    const std::string &nameSpace() const;
    const std::string &id() const;
    const std::string &relation() const; // empty for entities

    bool isWildcard() const { return id() == kWildcardId; }
    Node wildcardSibling() const;

    // throw std::bad_variant_access on the wrong kind
    const Entity &entity() const { return std::get<Entity>(value_); }
    const PermissionSet &permissionSet() const { return std::get<PermissionSet>(value_); }

    bool operator==(const Node &) const = default;

  private:
    std::variant<Entity, PermissionSet> value_{};
  };

  struct NodeHash
  {
    size_t operator()(const Node &n) const noexcept;
  };

  inline void hash_combine(size_t &seed, size_t h)
  {
    seed ^= h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
  }

  // -------------------- edges ---------------------------

  struct Edge
  {
    Node src{};
    PermissionSet dst{};

    bool operator==(const Edge &) const = default;
  };

  // -------------------- notation / validation ---------------------------

  // "namespace:id" for entities, "namespace:id#relation" for permission sets
  std::string formatNode(const Node &n);
  Node parseNode(std::string_view text);

  // `field` prefixes the error message, e.g. "src.namespace must be set"
  void validateSubject(const Node &n, std::string_view field);
  void validatePermissionSet(const PermissionSet &s, std::string_view field);

} // namespace rebac
