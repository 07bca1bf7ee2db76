#include "orca/core/encoding.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace orca {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string base64_encode(const std::string& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < data.size()) {
        const std::uint32_t triple = (static_cast<std::uint8_t>(data[i]) << 16) |
                                     (static_cast<std::uint8_t>(data[i + 1]) << 8) |
                                     static_cast<std::uint8_t>(data[i + 2]);
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += kAlphabet[triple & 0x3F];
        i += 3;
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t value = static_cast<std::uint8_t>(data[i]) << 16;
        out += kAlphabet[(value >> 18) & 0x3F];
        out += kAlphabet[(value >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t value = (static_cast<std::uint8_t>(data[i]) << 16) |
                                    (static_cast<std::uint8_t>(data[i + 1]) << 8);
        out += kAlphabet[(value >> 18) & 0x3F];
        out += kAlphabet[(value >> 12) & 0x3F];
        out += kAlphabet[(value >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::optional<std::string> base64_decode(const std::string& encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(encoded.size() / 4 * 3);

    for (std::size_t i = 0; i < encoded.size(); i += 4) {
        std::array<int, 4> quad{};
        int padding = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = encoded[i + j];
            if (c == '=') {
                // Padding is only legal in the last two positions of the final quad
                if (i + 4 != encoded.size() || j < 2) {
                    return std::nullopt;
                }
                ++padding;
                quad[j] = 0;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            quad[j] = decode_char(c);
            if (quad[j] < 0) {
                return std::nullopt;
            }
        }

        const std::uint32_t triple = (quad[0] << 18) | (quad[1] << 12) | (quad[2] << 6) | quad[3];
        out += static_cast<char>((triple >> 16) & 0xFF);
        if (padding < 2) {
            out += static_cast<char>((triple >> 8) & 0xFF);
        }
        if (padding < 1) {
            out += static_cast<char>(triple & 0xFF);
        }
    }
    return out;
}

std::string url_encode(const std::string& text) {
    std::ostringstream oss;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace orca
