#pragma once

#include "fullsync/net/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fullsync::net {

/**
 * @brief Request plus the URL parameters captured by the matched route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :id

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

/// Returns false to short-circuit with the response it filled in.
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                    // Original pattern like "/api/sync/:id"
    std::vector<std::string> param_names;   // Filled while regex is built
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& url) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& url) const;
};

/**
 * @brief Method and pattern based dispatch
 *
 * Routes are tried in registration order, so a literal route such as
 * "/api/sync/active" must be registered before "/api/sync/:id".
 *
 * @code
 * HttpRouter router;
 * router.get("/api/sync/:id", [](const HttpContext& ctx) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_json({{"id", ctx.get_param("id")}});
 *     return res;
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    void use(Middleware middleware);
    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Runs middleware, then the first matching route or the 404 handler
     *
     * A URL that matches a route under a different method answers 405.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& url) const;
    bool url_known(const std::string& url) const;
};

/**
 * @brief Converts a URL pattern to a regex
 *
 *   "/api/sync/:id"         → "^/api/sync/([^/]+)$"
 *   "/api/sync/:id/cancel"  → "^/api/sync/([^/]+)/cancel$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/// JSON error body {"error": code, "message": message}.
HttpResponse json_error(HttpStatus status, const std::string& code, const std::string& message);

} // namespace fullsync::net
