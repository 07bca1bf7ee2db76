#pragma once

#include "orca/core/result.hpp"
#include "orca/network/http_types.hpp"

#include <string>

namespace orca {
namespace network {

// Largest request body accepted; bigger batches are rejected while parsing
constexpr size_t kMaxBodySize = 16 * 1024 * 1024;

// Request line plus headers; anything longer is treated as garbage
constexpr size_t kMaxHeadSize = 64 * 1024;

enum class ParseState {
    HEAD,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Bytes are buffered until the blank line that ends the head, which is
 * then parsed in one go. The body is collected up to Content-Length.
 * Data may arrive in any number of chunks.
 *
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(buf, n);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser {
public:
    HttpParser() { reset(); }

    /**
     * @return true when the request is complete, false when more data is
     *         needed, or an error describing the malformed input
     */
    Result<bool> parse(const char* data, size_t len);

    HttpRequest get_request() const { return request_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset();

private:
    ParseState state_;
    HttpRequest request_;
    std::string head_;
    size_t content_length_;

    Result<bool> fail(std::string message);

    Result<void> parse_head();
    Result<void> parse_request_line(const std::string& line);
    Result<void> parse_header_line(const std::string& line);
    Result<void> read_content_length();
};

} // namespace network
} // namespace orca
