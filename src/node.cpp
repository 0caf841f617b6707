#include "node.hpp"
#include <functional>

namespace rebac
{

  namespace
  {
    const std::string kNoRelation{};

    void require_field(std::string_view value, std::string_view field, const char *name)
    {
      if (value.empty())
        throw InvalidArgument(std::string(field) + "." + name + " must be set");
    }

    void reject_wildcard(std::string_view value, std::string_view field, const char *name)
    {
      if (value == kWildcardId)
        throw InvalidArgument(std::string(field) + "." + name + " must not be a wildcard");
    }
  } // namespace

  Node::Node(std::string nameSpace, std::string id)
      : value_(Entity{std::move(nameSpace), std::move(id)})
  {
  }

  Node::Node(std::string nameSpace, std::string id, std::string relation)
      : value_(PermissionSet{std::move(nameSpace), std::move(id), std::move(relation)})
  {
  }

  const std::string &Node::nameSpace() const
  {
    return std::visit([](const auto &v) -> const std::string & { return v.nameSpace; }, value_);
  }

  const std::string &Node::id() const
  {
    return std::visit([](const auto &v) -> const std::string & { return v.id; }, value_);
  }

  const std::string &Node::relation() const
  {
    if (const auto *s = std::get_if<PermissionSet>(&value_))
      return s->relation;
    return kNoRelation;
  }

  Node Node::wildcardSibling() const
  {
    if (const auto *s = std::get_if<PermissionSet>(&value_))
      return Node(PermissionSet{s->nameSpace, std::string(kWildcardId), s->relation});
    return Node(Entity{nameSpace(), std::string(kWildcardId)});
  }

  size_t NodeHash::operator()(const Node &n) const noexcept
  {
    std::hash<std::string> h;
    size_t seed = n.isPermissionSet() ? 1 : 0;
    hash_combine(seed, h(n.nameSpace()));
    hash_combine(seed, h(n.id()));
    hash_combine(seed, h(n.relation()));
    return seed;
  }

  std::string formatNode(const Node &n)
  {
    std::string out;
    out.reserve(n.nameSpace().size() + n.id().size() + n.relation().size() + 2);
    out.append(n.nameSpace());
    out.push_back(':');
    out.append(n.id());
    if (n.isPermissionSet())
    {
      out.push_back('#');
      out.append(n.relation());
    }
    return out;
  }

  Node parseNode(std::string_view text)
  {
    auto colon = text.find(':');
    if (colon == std::string_view::npos)
      throw InvalidArgument("expected namespace:id or namespace:id#relation, got '" + std::string(text) + "'");
    std::string_view ns = text.substr(0, colon);
    std::string_view rest = text.substr(colon + 1);

    auto hash = rest.rfind('#');
    if (hash == std::string_view::npos)
      return Node(std::string(ns), std::string(rest));
    return Node(std::string(ns), std::string(rest.substr(0, hash)), std::string(rest.substr(hash + 1)));
  }

  void validateSubject(const Node &n, std::string_view field)
  {
    require_field(n.nameSpace(), field, "namespace");
    reject_wildcard(n.nameSpace(), field, "namespace");
    require_field(n.id(), field, "id");
    if (n.isPermissionSet())
    {
      require_field(n.relation(), field, "relation");
      reject_wildcard(n.relation(), field, "relation");
    }
  }

  void validatePermissionSet(const PermissionSet &s, std::string_view field)
  {
    validateSubject(Node(s), field);
  }

} // namespace rebac
