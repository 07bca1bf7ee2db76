#pragma once

#include "orca/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace orca {
namespace network {

// A request plus the decoded path parameters of the route that matched it
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

// Returns false to short-circuit with the response it filled in
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // e.g. "/automations/:id"
    std::regex regex;
    std::vector<std::string> param_names;  // e.g. ["id"]
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;
    bool matches_path(const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path router
 *
 * Routes are matched against the request path with the query string
 * stripped, in registration order. A path that matches a route under a
 * different method answers 405 rather than 404.
 *
 * @code
 * HttpRouter router;
 * router.get("/automations/:id", [](const HttpContext& ctx) {
 *     std::string id = ctx.get_param("id");
 *     ...
 * });
 * @endcode
 */
class HttpRouter {
public:
    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    void use(Middleware middleware);

    /**
     * @brief Dispatch to the first matching route
     *
     * A handler that throws produces a 500 response.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;

    // path_known is set when some route accepts the path under another method
    const Route* find_route(HttpMethod method, const std::string& path, bool& path_known) const;
};

/**
 * @brief Convert URL pattern to regex
 *
 *   "/automations/:id"      -> "^/automations/([^/]+)$"
 *   "/events/count-by/:by"  -> "^/events/count-by/([^/]+)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

// JSON response with the given status and body
HttpResponse json_response(HttpStatus status, const std::string& body);

// {"detail": message} with the given status
HttpResponse error_response(HttpStatus status, const std::string& message);

} // namespace network
} // namespace orca
