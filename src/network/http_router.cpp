#include "orca/network/http_router.hpp"

#include "orca/core/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>

namespace orca {
namespace network {

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
            static const std::string kSpecial = ".+*?^$()[]{}|\\";
            const char c = pattern[i++];
            if (kSpecial.find(c) != std::string::npos) {
                regex_pattern += '\\';
            }
            regex_pattern += c;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

HttpResponse json_response(HttpStatus status, const std::string& body) {
    HttpResponse response(status);
    response.set_body(body);
    response.set_header("Content-Type", "application/json");
    return response;
}

HttpResponse error_response(HttpStatus status, const std::string& message) {
    nlohmann::json body = {{"detail", message}};
    return json_response(status, body.dump());
}

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {
    std::string regex_str = pattern_to_regex(pattern, param_names);

    try {
        regex = std::regex(regex_str);
    } catch (const std::regex_error& e) {
        spdlog::error("Invalid route pattern '{}': {}", pattern, e.what());
        throw;
    }
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    return method == req_method && matches_path(path);
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        // Automation ids and countables arrive percent-encoded like any path segment
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = url_decode(match[i + 1].str());
        }
    }

    return params;
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("[Router] {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const std::string path = request.path();
    bool path_known = false;
    const Route* route = find_route(request.method, path, path_known);
    if (!route) {
        if (path_known) {
            return error_response(HttpStatus::METHOD_NOT_ALLOWED,
                HttpMethodUtils::to_string(request.method) + " is not allowed on " + path);
        }
        return error_response(HttpStatus::NOT_FOUND, "Not Found: " + path);
    }

    ctx.params = route->extract_params(path);
    try {
        return route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("[Router] {} {} failed: {}", HttpMethodUtils::to_string(request.method), path, e.what());
        return error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal Server Error");
    }
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    route_list.reserve(routes_.size());
    for (const auto& route : routes_) {
        route_list.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return route_list;
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path, bool& path_known) const {
    path_known = false;
    for (const auto& route : routes_) {
        if (!route.matches_path(path)) {
            continue;
        }
        if (route.method == method) {
            return &route;
        }
        path_known = true;
    }
    return nullptr;
}

} // namespace network
} // namespace orca
