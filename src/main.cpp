#include "graph.hpp"
#include "server.hpp"
#include "http_server.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <cstring>
#include <string>
#include <unistd.h>

class RebacdApp
{
public:
  explicit RebacdApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "In-memory relationship-based access control server using capnproto RPC")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "bind", "bind address (e.g., unix:/tmp/rebacd.sock or 0.0.0.0:50051)")
        .addOptionWithArg({'H', "http"}, KJ_BIND_METHOD(*this, optHttp),
                          "http", "HTTP bind (e.g., http://0.0.0.0:8080, default: disabled)")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String bind_ = kj::heapString("unix:/tmp/rebacd.sock");
  kj::String httpBind_ = kj::heapString("");

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    bind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optHttp(kj::StringPtr value)
  {
    httpBind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity run()
  {
    try
    {
      // the single graph instance, shared by both front ends
      rebac::RelationGraph graph;

      const char *bindC = bind_.cStr();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        const char *path = bindC + 5;
        ::unlink(path);
      }

      if (httpBind_.size() > 0)
      {
        rebac::http::startHttpServer(graph, std::string(httpBind_.cStr()));
        KJ_LOG(INFO, "http server listening on ", httpBind_);
      }

      capnp::EzRpcServer server(kj::heap<rebac::rpc::RebacServiceImpl>(graph), bindC);
      auto &waitScope = server.getWaitScope();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        KJ_LOG(INFO, "rebacd listening on ", bindC);
      }
      else
      {
        auto port = server.getPort().wait(waitScope);
        KJ_LOG(INFO, "rebacd listening on ", bindC, " (port ", port, ")");
      }
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }
};

KJ_MAIN(RebacdApp);
