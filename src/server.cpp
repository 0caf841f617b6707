#include "server.hpp"
#include <kj/debug.h>
#include <string>

namespace rebac::rpc
{

  namespace
  {

    std::string fromRpcText(capnp::Text::Reader t)
    {
      return std::string(t.cStr(), t.size());
    }

    rebac::Entity fromRpcEntity(Entity::Reader e)
    {
      return rebac::Entity{fromRpcText(e.getNamespace()), fromRpcText(e.getId())};
    }

    rebac::PermissionSet fromRpcPermissionSet(PermissionSet::Reader s)
    {
      return rebac::PermissionSet{fromRpcText(s.getNamespace()), fromRpcText(s.getId()), fromRpcText(s.getRelation())};
    }

    // An unset union reads as an empty srcObj, which validation rejects.
    rebac::Node fromRpcSubject(TupleRequest::Reader req)
    {
      auto src = req.getSrc();
      switch (src.which())
      {
      case TupleRequest::Src::SRC_SET:
        return rebac::Node(fromRpcPermissionSet(src.getSrcSet()));
      case TupleRequest::Src::SRC_OBJ:
      default:
        return rebac::Node(fromRpcEntity(src.getSrcObj()));
      }
    }

    void toRpcEntity(Entity::Builder b, const rebac::Entity &e)
    {
      b.setNamespace(e.nameSpace);
      b.setId(e.id);
    }

    void toRpcPermissionSet(PermissionSet::Builder b, const rebac::PermissionSet &s)
    {
      b.setNamespace(s.nameSpace);
      b.setId(s.id);
      b.setRelation(s.relation);
    }

  } // namespace

  RebacServiceImpl::RebacServiceImpl(rebac::RelationGraph &g) : graph_(g) {}

  kj::Promise<void> RebacServiceImpl::grant(GrantContext ctx)
  {
    auto req = ctx.getParams().getReq();
    graph_.grant(fromRpcSubject(req), fromRpcPermissionSet(req.getDst()));
    return kj::READY_NOW;
  }

  kj::Promise<void> RebacServiceImpl::revoke(RevokeContext ctx)
  {
    auto req = ctx.getParams().getReq();
    graph_.revoke(fromRpcSubject(req), fromRpcPermissionSet(req.getDst()));
    return kj::READY_NOW;
  }

  kj::Promise<void> RebacServiceImpl::exists(ExistsContext ctx)
  {
    auto req = ctx.getParams().getReq();
    bool found = graph_.exists(fromRpcSubject(req), fromRpcPermissionSet(req.getDst()));
    ctx.getResults().setExists(found);
    return kj::READY_NOW;
  }

  kj::Promise<void> RebacServiceImpl::isPermitted(IsPermittedContext ctx)
  {
    auto p = ctx.getParams();
    auto req = p.getReq();
    bool permitted = graph_.isPermitted(fromRpcSubject(req), fromRpcPermissionSet(req.getDst()), p.getMaxDepth());
    ctx.getResults().setPermitted(permitted);
    return kj::READY_NOW;
  }

  kj::Promise<void> RebacServiceImpl::expand(ExpandContext ctx)
  {
    auto dst = fromRpcPermissionSet(ctx.getParams().getDst());
    auto entries = graph_.expand(dst);

    auto res = ctx.getResults();
    auto items = res.initExpanded(entries.size());
    for (uint32_t i = 0; i < entries.size(); ++i)
    {
      const auto &e = entries[i];
      auto row = items[i];
      toRpcEntity(row.initSrc(), e.src);
      auto path = row.initPath(e.path.size());
      for (uint32_t j = 0; j < e.path.size(); ++j)
        toRpcPermissionSet(path[j], e.path[j]);
    }
    KJ_LOG(INFO, "expand", formatNode(rebac::Node(dst)), entries.size());
    return kj::READY_NOW;
  }

} // namespace rebac::rpc
