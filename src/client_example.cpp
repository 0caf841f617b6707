#include "schemas/rebac.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <iostream>
#include <string>

namespace
{

  using rebac::rpc::RebacService;

  void setEntity(rebac::rpc::Entity::Builder b, const char *ns, const char *id)
  {
    b.setNamespace(ns);
    b.setId(id);
  }

  void setPermissionSet(rebac::rpc::PermissionSet::Builder b, const char *ns, const char *id, const char *rel)
  {
    b.setNamespace(ns);
    b.setId(id);
    b.setRelation(rel);
  }

  std::string describe(rebac::rpc::PermissionSet::Reader s)
  {
    return std::string(s.getNamespace().cStr()) + ":" + s.getId().cStr() + "#" + s.getRelation().cStr();
  }

} // namespace

int main(int argc, char **argv)
{
  const char *addr = (argc > 1) ? argv[1] : "unix:/tmp/rebacd.sock";
  capnp::EzRpcClient client(addr);
  auto &ws = client.getWaitScope();
  auto cap = client.getMain<RebacService>();

  // alice may read foo.pdf
  {
    auto req = cap.grantRequest();
    auto r = req.initReq();
    setEntity(r.getSrc().initSrcObj(), "users", "alice");
    setPermissionSet(r.initDst(), "files", "foo.pdf", "read");
    req.send().wait(ws);
  }
  // readers of foo.pdf may read bar.pdf
  {
    auto req = cap.grantRequest();
    auto r = req.initReq();
    setPermissionSet(r.getSrc().initSrcSet(), "files", "foo.pdf", "read");
    setPermissionSet(r.initDst(), "files", "bar.pdf", "read");
    req.send().wait(ws);
  }

  {
    auto req = cap.existsRequest();
    auto r = req.initReq();
    setEntity(r.getSrc().initSrcObj(), "users", "alice");
    setPermissionSet(r.initDst(), "files", "bar.pdf", "read");
    auto resp = req.send().wait(ws);
    std::cout << "exists users:alice -> files:bar.pdf#read: " << std::boolalpha << resp.getExists() << "\n";
  }
  {
    auto req = cap.isPermittedRequest();
    auto r = req.initReq();
    setEntity(r.getSrc().initSrcObj(), "users", "alice");
    setPermissionSet(r.initDst(), "files", "bar.pdf", "read");
    auto resp = req.send().wait(ws);
    std::cout << "isPermitted users:alice -> files:bar.pdf#read: " << std::boolalpha << resp.getPermitted() << "\n";
  }

  // who may read bar.pdf, and why
  {
    auto req = cap.expandRequest();
    setPermissionSet(req.initDst(), "files", "bar.pdf", "read");
    auto resp = req.send().wait(ws);
    for (auto item : resp.getExpanded())
    {
      std::cout << item.getSrc().getNamespace().cStr() << ":" << item.getSrc().getId().cStr() << "\n";
      for (auto hop : item.getPath())
        std::cout << "\tvia " << describe(hop) << "\n";
    }
  }
}
