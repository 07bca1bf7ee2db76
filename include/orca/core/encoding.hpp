#pragma once

#include <optional>
#include <string>

namespace orca {

std::string base64_encode(const std::string& data);

// Strict decoder: returns nullopt on any character outside the alphabet,
// on bad padding, or on a length that is not a multiple of four.
std::optional<std::string> base64_decode(const std::string& encoded);

// Percent-encoding for query-string values (RFC 3986 unreserved set kept)
std::string url_encode(const std::string& text);

// Percent-decoding; '+' is kept literally so raw base64 survives
std::string url_decode(const std::string& text);

} // namespace orca
