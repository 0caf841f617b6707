#pragma once
#include "graph.hpp"
#include "schemas/rebac.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>

namespace rebac::rpc
{

  class RebacServiceImpl final : public RebacService::Server
  {
  public:
    explicit RebacServiceImpl(rebac::RelationGraph &g);

    kj::Promise<void> grant(GrantContext ctx) override;
    kj::Promise<void> revoke(RevokeContext ctx) override;
    kj::Promise<void> exists(ExistsContext ctx) override;
    kj::Promise<void> isPermitted(IsPermittedContext ctx) override;
    kj::Promise<void> expand(ExpandContext ctx) override;

  private:
    rebac::RelationGraph &graph_;
  };

} // namespace rebac::rpc
