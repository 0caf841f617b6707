#pragma once
#include "graph.hpp"
#include <string>

namespace rebac::http
{

  // Starts a Mongoose HTTP server in a background thread.
  // Nodes are written as ns:id (entity) or ns:id#relation (permission set).
  // - POST /api/grant?src=..&dst=..                 -> { "ok": true }
  // - POST /api/revoke?src=..&dst=..                -> { "ok": true }
  // - GET  /api/exists?src=..&dst=..                -> { "exists": bool }
  // - GET  /api/isPermitted?src=..&dst=..&maxDepth= -> { "permitted": bool }
  // - GET  /api/expand?dst=..                       -> { "expanded": [ { "src": "..", "path": [..] } ] }
  // - GET  /api/tuples                              -> { "tuples": [ { "src": "..", "dst": ".." } ] }
  // - GET  /api/stats                               -> { "edges": n, "vertices": n }
  // - GET  /api/health                              -> { "ok": true }
  // bind must be like "http://0.0.0.0:8080" or "http://127.0.0.1:0" (0 means ephemeral)
  void startHttpServer(rebac::RelationGraph &graph, const std::string &bind);

} // namespace rebac::http
