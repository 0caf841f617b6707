#include "http_server.hpp"

#include <mongoose.h>

#include <thread>
#include <charconv>
#include <cstring>
#include <exception>
#include <vector>
#include <string>
#include <string_view>
#include <utility>
#include <kj/debug.h>

namespace rebac::http
{

  namespace
  {
    struct ServerState
    {
      rebac::RelationGraph *graph{nullptr};
    };

    // helpers -----------------------------------------------------------------
    static bool parseUint32(const mg_str &s, uint32_t &out)
    {
      out = 0;
      if (s.len == 0)
        return false;
      const char *b = s.buf;
      const char *e = s.buf + s.len;
      auto res = std::from_chars(b, e, out);
      return res.ec == std::errc{} && res.ptr == e;
    }

    static bool strEquals(const mg_str &s, const char *lit)
    {
      size_t n = strlen(lit);
      return s.len == n && memcmp(s.buf, lit, n) == 0;
    }

    // Reads a required ns:id[#relation] query var; throws InvalidArgument.
    static rebac::Node requireNode(struct mg_http_message *hm, const char *name)
    {
      char buf[1024];
      int n = mg_http_get_var(&hm->query, name, buf, sizeof(buf));
      if (n <= 0)
        throw rebac::InvalidArgument(std::string("missing ") + name);
      return rebac::parseNode(std::string_view(buf, (size_t)n));
    }

    static rebac::PermissionSet requirePermissionSet(struct mg_http_message *hm, const char *name)
    {
      auto node = requireNode(hm, name);
      if (!node.isPermissionSet())
        throw rebac::InvalidArgument(std::string(name) + " must be ns:id#relation");
      return node.permissionSet();
    }

    // JSON helpers -----------------------------------------------------------------
    static int print_expand_items(mg_pfn_t out, void *arg, va_list *ap)
    {
      const rebac::ExpandEntry *rows = va_arg(*ap, const rebac::ExpandEntry *);
      size_t count = va_arg(*ap, size_t);
      for (size_t i = 0; i < count; ++i)
      {
        const auto &r = rows[i];
        std::string src = rebac::formatNode(rebac::Node(r.src));
        mg_xprintf(out, arg, "%s{%m:%m,%m:[", i ? "," : "",
                   MG_ESC("src"), MG_ESC(src.c_str()),
                   MG_ESC("path"));
        for (size_t j = 0; j < r.path.size(); ++j)
        {
          std::string hop = rebac::formatNode(rebac::Node(r.path[j]));
          mg_xprintf(out, arg, "%s%m", j ? "," : "", MG_ESC(hop.c_str()));
        }
        mg_xprintf(out, arg, "]}");
      }
      return 0;
    }

    static int print_tuples(mg_pfn_t out, void *arg, va_list *ap)
    {
      const rebac::Edge *rows = va_arg(*ap, const rebac::Edge *);
      size_t count = va_arg(*ap, size_t);
      for (size_t i = 0; i < count; ++i)
      {
        std::string src = rebac::formatNode(rows[i].src);
        std::string dst = rebac::formatNode(rebac::Node(rows[i].dst));
        mg_xprintf(out, arg, "%s{%m:%m,%m:%m}", i ? "," : "",
                   MG_ESC("src"), MG_ESC(src.c_str()),
                   MG_ESC("dst"), MG_ESC(dst.c_str()));
      }
      return 0;
    }

    // Common reply helper that adds CORS headers to JSON responses
    template <typename... Args>
    static void reply_json(struct mg_connection *c, int code, const char *fmt, Args &&...args)
    {
      mg_http_reply(c, code,
                    "Content-Type: application/json\r\n"
                    "Access-Control-Allow-Origin: *\r\n"
                    "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
                    "Access-Control-Allow-Headers: Content-Type, Authorization, X-Requested-With\r\n",
                    fmt, std::forward<Args>(args)...);
    }

    // HTTP handlers -----------------------------------------------------------------
    static void handle_health(struct mg_connection *c)
    {
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_grant(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto src = requireNode(hm, "src");
      auto dst = requirePermissionSet(hm, "dst");
      st->graph->grant(src, dst);
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_revoke(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto src = requireNode(hm, "src");
      auto dst = requirePermissionSet(hm, "dst");
      st->graph->revoke(src, dst);
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_exists(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto src = requireNode(hm, "src");
      auto dst = requirePermissionSet(hm, "dst");
      bool found = st->graph->exists(src, dst);
      reply_json(c, 200, "{%m:%s}\n", MG_ESC("exists"), found ? "true" : "false");
    }

    static void handle_is_permitted(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto src = requireNode(hm, "src");
      auto dst = requirePermissionSet(hm, "dst");
      uint32_t maxDepth = 0;
      char depthBuf[32];
      int nd = mg_http_get_var(&hm->query, "maxDepth", depthBuf, sizeof(depthBuf));
      if (nd > 0 && !parseUint32(mg_str_n(depthBuf, (size_t)nd), maxDepth))
        throw rebac::InvalidArgument("invalid maxDepth");
      bool permitted = st->graph->isPermitted(src, dst, maxDepth);
      reply_json(c, 200, "{%m:%s}\n", MG_ESC("permitted"), permitted ? "true" : "false");
    }

    static void handle_expand(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto dst = requirePermissionSet(hm, "dst");
      auto rows = st->graph->expand(dst);
      reply_json(c, 200, "{%m:[%M]}\n", MG_ESC("expanded"), print_expand_items, rows.data(), rows.size());
    }

    static void handle_stats(struct mg_connection *c, ServerState *st)
    {
      reply_json(c, 200, "{%m:%llu,%m:%llu}\n",
                 MG_ESC("edges"), (unsigned long long)st->graph->edgeCount(),
                 MG_ESC("vertices"), (unsigned long long)st->graph->vertexCount());
    }

    static void handle_tuples(struct mg_connection *c, ServerState *st)
    {
      auto rows = st->graph->edges();
      reply_json(c, 200, "{%m:[%M]}\n", MG_ESC("tuples"), print_tuples, rows.data(), rows.size());
    }

    static void dispatch(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      if (mg_match(hm->uri, mg_str("/api/health"), NULL))
      {
        handle_health(c);
        return;
      }
      if (strEquals(hm->method, "POST") && mg_match(hm->uri, mg_str("/api/grant"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/grant POST");
        handle_grant(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "POST") && mg_match(hm->uri, mg_str("/api/revoke"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/revoke POST");
        handle_revoke(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/exists"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/exists GET");
        handle_exists(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/isPermitted"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/isPermitted GET");
        handle_is_permitted(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/expand"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/expand GET");
        handle_expand(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/stats"), NULL))
      {
        handle_stats(c, st);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/tuples"), NULL))
      {
        handle_tuples(c, st);
        return;
      }
      KJ_LOG(WARNING, "dispatch: not found");
      reply_json(c, 404, "{\"error\":\"not found\"}\n");
    }

    static void ev_handler(struct mg_connection *c, int ev, void *ev_data)
    {
      if (ev != MG_EV_HTTP_MSG)
        return;
      auto *hm = (struct mg_http_message *)ev_data;
      auto *st = (ServerState *)c->fn_data;

      KJ_LOG(INFO, "ev_handler",
             std::string(hm->method.buf, (size_t)hm->method.len),
             std::string(hm->uri.buf, (size_t)hm->uri.len));

      // Handle CORS preflight
      if (strEquals(hm->method, "OPTIONS"))
      {
        mg_http_reply(c, 204,
                      "Access-Control-Allow-Origin: *\r\n"
                      "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
                      "Access-Control-Allow-Headers: Content-Type, Authorization, X-Requested-With\r\n"
                      "Access-Control-Max-Age: 86400\r\n",
                      "");
        return;
      }

      try
      {
        dispatch(c, st, hm);
      }
      catch (const rebac::InvalidArgument &e)
      {
        KJ_LOG(WARNING, "invalid request", e.what());
        reply_json(c, 400, "{%m:%m}\n", MG_ESC("error"), MG_ESC(e.what()));
      }
      catch (const std::exception &e)
      {
        KJ_LOG(ERROR, "request failed", e.what());
        reply_json(c, 500, "{%m:%m}\n", MG_ESC("error"), MG_ESC(e.what()));
      }
    }

    void run_loop(struct mg_mgr *mgr)
    {
      for (;;)
      {
        mg_mgr_poll(mgr, 250);
      }
    }
  } // namespace

  void startHttpServer(rebac::RelationGraph &graph, const std::string &bind)
  {
    std::thread([&graph, bind]()
                {
      struct mg_mgr mgr{};
      mg_mgr_init(&mgr);

      ServerState st{.graph = &graph};
      struct mg_connection *c = mg_http_listen(&mgr, bind.c_str(), ev_handler, &st);
      if (c == nullptr)
      {
        KJ_LOG(ERROR, "http listen failed", bind);
        mg_mgr_free(&mgr);
        return;
      }
      run_loop(&mgr);
      mg_mgr_free(&mgr); })
        .detach();
  }

} // namespace rebac::http
