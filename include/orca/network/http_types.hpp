#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace orca {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a macro on some platforms
    HEAD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1
};

/**
 * @brief Status codes answered by the event and automation routes
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    FORBIDDEN = 403,             // Page token rejected
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    UNPROCESSABLE_ENTITY = 422,  // Valid JSON, invalid content
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

// Case-insensitive lookup (RFC 7230); empty when absent
inline std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

/**
 * @brief An HTTP request as handed to the router
 *
 * `url` is the raw request target including any query string; path() and
 * query_param() split it on demand.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    std::string path() const { return url.substr(0, url.find('?')); }

    std::string query_string() const {
        const auto mark = url.find('?');
        return mark == std::string::npos ? std::string() : url.substr(mark + 1);
    }

    /**
     * @brief Raw (still percent-encoded) value of a query parameter
     *
     * Returns an empty string when the parameter is absent. page-token
     * values are decoded by the route that reads them.
     */
    std::string query_param(const std::string& name) const {
        const std::string query = query_string();
        const std::string prefix = name + "=";
        size_t start = 0;
        while (start < query.size()) {
            size_t end = query.find('&', start);
            if (end == std::string::npos) {
                end = query.size();
            }
            if (query.compare(start, prefix.size(), prefix) == 0) {
                return query.substr(start + prefix.size(), end - start - prefix.size());
            }
            start = end + 1;
        }
        return "";
    }

    // True for a GET carrying "Upgrade: websocket"
    bool is_websocket_upgrade() const {
        return method == HttpMethod::GET &&
               strcasecmp(get_header("Upgrade").c_str(), "websocket") == 0;
    }
};

/**
 * @brief An HTTP response; the API always answers with JSON bodies
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(reason_for(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    // Status line, headers, blank line, body
    std::vector<uint8_t> serialize() const {
        std::string head = version == HttpVersion::HTTP_1_0 ? "HTTP/1.0 " : "HTTP/1.1 ";
        head += std::to_string(status_code) + " " + reason_phrase + "\r\n";
        for (const auto& [name, value] : headers) {
            head += name + ": " + value + "\r\n";
        }
        if (find_header(headers, "Content-Length").empty()) {
            head += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        head += "\r\n";

        std::vector<uint8_t> wire(head.begin(), head.end());
        wire.insert(wire.end(), body.begin(), body.end());
        return wire;
    }

    static std::string reason_for(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::UNPROCESSABLE_ENTITY: return "Unprocessable Entity";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }
};

struct HttpMethodUtils {
    static HttpMethod from_string(const std::string& name) {
        static const std::unordered_map<std::string, HttpMethod> kMethods = {
            {"GET", HttpMethod::GET},
            {"POST", HttpMethod::POST},
            {"PUT", HttpMethod::PUT},
            {"DELETE", HttpMethod::DELETE_METHOD},
            {"HEAD", HttpMethod::HEAD},
        };
        const auto it = kMethods.find(name);
        return it == kMethods.end() ? HttpMethod::UNKNOWN : it->second;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::UNKNOWN: break;
        }
        return "UNKNOWN";
    }
};

} // namespace network
} // namespace orca
