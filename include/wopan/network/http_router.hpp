#pragma once

#include "wopan/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wopan {
namespace network {

/**
 * @brief Request plus the parameters captured by the matched route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/// Returns false to stop processing and send @p response as is
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   ///< e.g. "/api/video/:action"
    std::vector<std::string> param_names;  ///< Filled while compiling regex
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;
    bool matches(HttpMethod method, const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path dispatch for the relay API
 *
 * Routes are matched against the request path without its query string, in
 * registration order. A path that matches only under another method yields
 * 405, an unknown path 404; both bodies are JSON {"detail": ...}.
 *
 * Groups share the parent's route table:
 * @code
 * HttpRouter router;
 * auto video = router.group("/api/video");
 * video->post("/download", handle_download);   // POST /api/video/download
 * router.get("/healthy", handle_health);
 * @endcode
 *
 * A handler that throws gets a JSON 500 response; the exception is logged.
 */
class HttpRouter {
public:
    HttpRouter();

    // ────────────────────────────────────────────────────────────
    // Route Registration
    // ────────────────────────────────────────────────────────────

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /// Router that registers into this router's table under @p prefix
    std::shared_ptr<HttpRouter> group(const std::string& prefix);

    // ────────────────────────────────────────────────────────────
    // Middleware
    // ────────────────────────────────────────────────────────────

    /// Runs before every route, in the order added
    void use(Middleware middleware);

    // ────────────────────────────────────────────────────────────
    // Dispatch
    // ────────────────────────────────────────────────────────────

    HttpResponse handle_request(const HttpRequest& request);

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_->size(); }

private:
    struct GroupTag {};
    HttpRouter(GroupTag, std::shared_ptr<std::vector<Route>> routes, std::string prefix);

    std::shared_ptr<std::vector<Route>> routes_;
    std::vector<Middleware> middlewares_;
    std::string prefix_;

    static HttpResponse not_found(const HttpContext& ctx);
    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_known(const std::string& path) const;
};

/**
 * @brief Convert a route pattern into an anchored regex
 *
 *   "/files/:id"  -> "^/files/([^/]+)$"
 *   "/static/*"   -> "^/static/(.*)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/// Response with a JSON body and Content-Type: application/json
HttpResponse make_json_response(HttpStatus status, const std::string& json_body);

} // namespace network
} // namespace wopan
