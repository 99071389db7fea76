#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace vrm {
namespace http {

namespace {
constexpr const char *kDocsPage = R"(<!DOCTYPE html>
<html>
<head><meta charset="utf-8"><title>UK VRM Lookup</title></head>
<body>
<h1>UK VRM Lookup</h1>
<p>UK vehicle registration lookup backed by the DVLA Vehicle Enquiry Service.</p>
<ul>
<li><code>GET /</code> service metadata</li>
<li><code>GET /health</code> liveness check</li>
<li><code>POST /lookup</code> with <code>{"plate": "AB12CDE"}</code></li>
</ul>
<p>Machine-readable description: <a href="/openapi.json">/openapi.json</a></p>
</body>
</html>
)";
}  // namespace

//=============================================================================
// GET /
//=============================================================================
void HttpServer::handle_get_root(const httplib::Request &, httplib::Response &res) {
    send_json(res, StatusCode::OK, encode_service_info());
}

//=============================================================================
// GET /health
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    send_json(res, StatusCode::OK, {{"ok", true}});
}

//=============================================================================
// GET /openapi.json
//=============================================================================
void HttpServer::handle_get_openapi(const httplib::Request &, httplib::Response &res) {
    static const nlohmann::json document = build_openapi_document();
    send_json(res, StatusCode::OK, document);
}

//=============================================================================
// GET /docs
//=============================================================================
void HttpServer::handle_get_docs(const httplib::Request &, httplib::Response &res) {
    res.status = status_code_to_http(StatusCode::OK);
    res.set_content(kDocsPage, "text/html; charset=utf-8");
}

}  // namespace http
}  // namespace vrm
