#include "wopan/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <string_view>

namespace wopan {
namespace network {

// ────────────────────────────────────────────────────────────
// Pattern compilation
// ────────────────────────────────────────────────────────────

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        const char c = pattern[i];
        if (c == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }
            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
            continue;
        }

        if (c == '*') {
            regex_pattern += "(.*)";
        } else {
            if (std::string_view(".+?^$()[]{}|\\").find(c) != std::string_view::npos) {
                regex_pattern += '\\';
            }
            regex_pattern += c;
        }
        ++i;
    }

    regex_pattern += "$";
    return regex_pattern;
}

HttpResponse make_json_response(HttpStatus status, const std::string& json_body) {
    HttpResponse response(status);
    response.set_body(json_body);
    response.set_header("Content-Type", "application/json");
    return response;
}

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), param_names(), regex(pattern_to_regex(pat, param_names)), handler(std::move(h)) {
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    return method == req_method && matches_path(path);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }
    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : routes_(std::make_shared<std::vector<Route>>()) {
}

HttpRouter::HttpRouter(GroupTag, std::shared_ptr<std::vector<Route>> routes, std::string prefix)
    : routes_(std::move(routes))
    , prefix_(std::move(prefix)) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    const std::string full_pattern = prefix_ + pattern;
    routes_->emplace_back(method, full_pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), full_pattern);
}

std::shared_ptr<HttpRouter> HttpRouter::group(const std::string& prefix) {
    return std::shared_ptr<HttpRouter>(new HttpRouter(GroupTag{}, routes_, prefix_ + prefix));
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const std::string path = request.path();
    const Route* route = find_route(request.method, path);

    if (!route) {
        if (path_known(path)) {
            return make_json_response(HttpStatus::METHOD_NOT_ALLOWED,
                nlohmann::json{{"detail", "Method Not Allowed"}}.dump());
        }
        return not_found(ctx);
    }

    ctx.params = route->extract_params(path);
    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route {} threw: {}", route->pattern, e.what());
        response = make_json_response(HttpStatus::INTERNAL_SERVER_ERROR,
            nlohmann::json{{"detail", "Internal Server Error"}, {"kind", "internal"}}.dump());
    }
    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    route_list.reserve(routes_->size());
    for (const auto& route : *routes_) {
        route_list.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return route_list;
}

HttpResponse HttpRouter::not_found(const HttpContext& ctx) {
    return make_json_response(HttpStatus::NOT_FOUND,
        nlohmann::json{{"detail", "Not Found: " + ctx.request.path()}}.dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace));
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : *routes_) {
        if (route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

bool HttpRouter::path_known(const std::string& path) const {
    for (const auto& route : *routes_) {
        if (route.matches_path(path)) {
            return true;
        }
    }
    return false;
}

} // namespace network
} // namespace wopan
