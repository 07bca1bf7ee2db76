#include "orca/network/http_parser.hpp"

#include <algorithm>
#include <cctype>

namespace orca {
namespace network {

namespace {

constexpr const char* kHeadEnd = "\r\n\r\n";

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

} // namespace

void HttpParser::reset() {
    state_ = ParseState::HEAD;
    request_ = HttpRequest();
    head_.clear();
    content_length_ = 0;
}

Result<bool> HttpParser::fail(std::string message) {
    state_ = ParseState::PARSE_ERROR;
    return Err<bool>(std::move(message));
}

Result<bool> HttpParser::parse(const char* data, size_t len) {
    if (state_ == ParseState::PARSE_ERROR) {
        return Err<bool>(std::string("Parser in error state"));
    }

    size_t offset = 0;
    if (state_ == ParseState::HEAD) {
        // The terminator may straddle two chunks, so search from just before the new bytes
        const size_t search_from = head_.size() >= 3 ? head_.size() - 3 : 0;
        head_.append(data, len);

        const auto end = head_.find(kHeadEnd, search_from);
        if (end == std::string::npos) {
            if (head_.size() > kMaxHeadSize) {
                return fail("Request head exceeds " + std::to_string(kMaxHeadSize) + " bytes");
            }
            return Ok(false);
        }

        const size_t head_bytes = end + 4;
        const size_t consumed_before = head_.size() - len;
        offset = head_bytes - consumed_before;
        head_.resize(end);

        auto parsed = parse_head();
        if (parsed.is_error()) {
            return fail(parsed.error());
        }

        if (content_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return Ok(true);
        }
        request_.body.reserve(content_length_);
        state_ = ParseState::BODY;
    }

    if (state_ == ParseState::BODY) {
        const size_t wanted = content_length_ - request_.body.size();
        const size_t available = std::min(wanted, len - offset);
        request_.body.insert(request_.body.end(), data + offset, data + offset + available);
        if (request_.body.size() == content_length_) {
            state_ = ParseState::COMPLETE;
        }
    }

    return Ok(state_ == ParseState::COMPLETE);
}

Result<void> HttpParser::parse_head() {
    size_t line_start = 0;
    size_t line_number = 1;
    while (line_start <= head_.size()) {
        auto line_end = head_.find("\r\n", line_start);
        if (line_end == std::string::npos) {
            line_end = head_.size();
        }
        const std::string line = head_.substr(line_start, line_end - line_start);

        auto parsed = line_number == 1 ? parse_request_line(line) : parse_header_line(line);
        if (parsed.is_error()) {
            return Err<void>(parsed.error() + " at line " + std::to_string(line_number));
        }

        line_start = line_end + 2;
        ++line_number;
    }
    return read_content_length();
}

Result<void> HttpParser::parse_request_line(const std::string& line) {
    const auto first_space = line.find(' ');
    const auto last_space = line.rfind(' ');
    if (first_space == std::string::npos || first_space == last_space) {
        return Err<void>(std::string("Malformed request line"));
    }

    const std::string method = line.substr(0, first_space);
    request_.method = HttpMethodUtils::from_string(method);
    if (request_.method == HttpMethod::UNKNOWN) {
        return Err<void>("Unsupported HTTP method '" + method + "'");
    }

    request_.url = line.substr(first_space + 1, last_space - first_space - 1);
    const bool printable = std::all_of(request_.url.begin(), request_.url.end(),
        [](char c) { return std::isgraph(static_cast<unsigned char>(c)) != 0; });
    if (request_.url.empty() || !printable) {
        return Err<void>(std::string("Malformed request target"));
    }

    const std::string version = line.substr(last_space + 1);
    if (version == "HTTP/1.1") {
        request_.version = HttpVersion::HTTP_1_1;
    } else if (version == "HTTP/1.0") {
        request_.version = HttpVersion::HTTP_1_0;
    } else {
        return Err<void>("Unsupported HTTP version '" + version + "'");
    }
    return Ok();
}

Result<void> HttpParser::parse_header_line(const std::string& line) {
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return Err<void>(std::string("Malformed header"));
    }

    const std::string name = line.substr(0, colon);
    if (!std::all_of(name.begin(), name.end(), is_token_char)) {
        return Err<void>("Invalid header name '" + name + "'");
    }
    request_.headers[name] = trim(line.substr(colon + 1));
    return Ok();
}

Result<void> HttpParser::read_content_length() {
    const std::string text = request_.get_header("Content-Length");
    if (text.empty()) {
        content_length_ = 0;
        return Ok();
    }

    size_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Err<void>("Invalid Content-Length '" + text + "'");
        }
        value = value * 10 + static_cast<size_t>(c - '0');
        if (value > kMaxBodySize) {
            return Err<void>("Request body exceeds " + std::to_string(kMaxBodySize) + " bytes");
        }
    }
    content_length_ = value;
    return Ok();
}

} // namespace network
} // namespace orca
