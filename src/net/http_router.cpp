#include "fullsync/net/http_router.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace fullsync::net {

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
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
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' || c == '*' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

HttpResponse json_error(HttpStatus status, const std::string& code, const std::string& message) {
    HttpResponse response(status);
    response.set_json({{"error", code}, {"message", message}});
    return response;
}

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), regex(pattern_to_regex(pat, param_names)), handler(std::move(h)) {}

bool Route::matches(HttpMethod req_method, const std::string& url) const {
    return method == req_method && std::regex_match(url, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& url) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;
    if (std::regex_match(url, match, regex)) {
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
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const Route* route = find_route(request.method, request.url);
    if (route == nullptr) {
        if (url_known(request.url)) {
            return json_error(HttpStatus::METHOD_NOT_ALLOWED, "MethodNotAllowed",
                HttpMethodUtils::to_string(request.method) + " is not allowed on " + request.url);
        }
        return not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(request.url);
    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} threw: {}", route->pattern, e.what());
        response = json_error(HttpStatus::INTERNAL_SERVER_ERROR, "InternalError", "internal server error");
    }
    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        route_list.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return json_error(HttpStatus::NOT_FOUND, "NotFound", "no route for " + ctx.request.url);
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& url) const {
    for (const auto& route : routes_) {
        if (route.matches(method, url)) {
            return &route;
        }
    }
    return nullptr;
}

bool HttpRouter::url_known(const std::string& url) const {
    for (const auto& route : routes_) {
        if (std::regex_match(url, route.regex)) {
            return true;
        }
    }
    return false;
}

} // namespace fullsync::net
