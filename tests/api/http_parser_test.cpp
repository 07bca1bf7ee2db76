#include <gtest/gtest.h>
#include "orca/network/http_parser.hpp"

#include <string>

using namespace orca::network;

TEST(HttpParser, ParsesRequestWithBody) {
    const std::string raw =
        "POST /events?source=ci HTTP/1.1\r\n"
        "Host: localhost:4200\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "[]";

    HttpParser parser;
    auto result = parser.parse(raw.data(), raw.size());

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.is_complete());

    auto request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.path(), "/events");
    EXPECT_EQ(request.query_param("source"), "ci");
    EXPECT_EQ(request.get_header("content-type"), "application/json");
    EXPECT_EQ(request.body_as_string(), "[]");
}

TEST(HttpParser, AcceptsDataInChunks) {
    const std::string raw =
        "GET /automations HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "\r\n";

    HttpParser parser;
    for (size_t i = 0; i + 1 < raw.size(); ++i) {
        auto partial = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(partial.is_ok());
        EXPECT_FALSE(partial.value());
    }
    auto last = parser.parse(raw.data() + raw.size() - 1, 1);

    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.get_request().url, "/automations");
}

TEST(HttpParser, RejectsUnknownMethod) {
    const std::string raw = "BREW /pot HTTP/1.1\r\n\r\n";

    HttpParser parser;
    auto result = parser.parse(raw.data(), raw.size());

    ASSERT_TRUE(result.is_error());
    EXPECT_FALSE(parser.is_complete());
}

TEST(HttpParser, RejectsOversizedBody) {
    const std::string raw =
        "POST /events HTTP/1.1\r\n"
        "Content-Length: 999999999\r\n"
        "\r\n";

    HttpParser parser;
    auto result = parser.parse(raw.data(), raw.size());

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("exceeds"), std::string::npos);
}

TEST(HttpParser, ResetAllowsReuse) {
    const std::string bad = "get / HTTP/1.1\r\n\r\n";
    const std::string good = "DELETE /automations/a-1 HTTP/1.1\r\n\r\n";

    HttpParser parser;
    EXPECT_TRUE(parser.parse(bad.data(), bad.size()).is_error());

    parser.reset();
    auto result = parser.parse(good.data(), good.size());
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_request().method, HttpMethod::DELETE_METHOD);
}
