#include "fts/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using fts::network::HttpMethod;
using fts::network::HttpRequestParser;
using fts::network::HttpResponseParser;
using fts::network::ParseState;

namespace {

template<typename Parser>
fts::Result<bool> feed(Parser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpParserTest, ParsesRequestAcrossChunks) {
    HttpRequestParser parser;
    const std::string message =
        "POST /api/v1/time-actions HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "idempotency-key: item-1\r\n"
        "Content-Length: 13\r\n"
        "\r\n"
        "{\"ok\": true}\n";

    // One byte at a time is the worst case for chunking.
    for (std::size_t i = 0; i + 1 < message.size(); ++i) {
        auto partial = parser.parse(&message[i], 1);
        ASSERT_TRUE(partial.is_ok());
        EXPECT_FALSE(partial.value());
    }
    auto done = parser.parse(&message.back(), 1);
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());

    const auto& request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.url, "/api/v1/time-actions");
    EXPECT_EQ(request.get_header("Idempotency-Key"), "item-1");
    EXPECT_EQ(request.body_as_string(), "{\"ok\": true}\n");
}

TEST(HttpParserTest, RequestWithoutBodyCompletesAtBlankLine) {
    HttpRequestParser parser;
    auto done = feed(parser, "GET /health HTTP/1.0\r\nHost: x\r\n\r\n");
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());
    EXPECT_TRUE(parser.get_request().body.empty());
}

TEST(HttpParserTest, RejectsMalformedRequestLine) {
    HttpRequestParser parser;
    EXPECT_TRUE(feed(parser, "BREW /pot HTTP/1.1\r\n").is_error());
    EXPECT_EQ(parser.state(), ParseState::PARSE_ERROR);

    parser.reset();
    EXPECT_TRUE(feed(parser, "GET /x SPDY/3\r\n").is_error());

    parser.reset();
    EXPECT_TRUE(feed(parser, "GET /x HTTP/1.1\r\nBad Header: y\r\n").is_error());
}

TEST(HttpParserTest, RejectsInvalidContentLength) {
    HttpRequestParser parser;
    EXPECT_TRUE(feed(parser, "POST /x HTTP/1.1\r\nContent-Length: -5\r\n\r\n").is_error());

    parser.reset();
    EXPECT_TRUE(feed(parser, "POST /x HTTP/1.1\r\nContent-Length: 99999999999\r\n\r\n").is_error());
}

TEST(HttpParserTest, RejectsOversizedHeaders) {
    HttpRequestParser parser;
    std::string message = "GET /x HTTP/1.1\r\nX-Filler: ";
    message.append(HttpRequestParser::kMaxHeaderBytes, 'a');
    EXPECT_TRUE(feed(parser, message).is_error());
}

TEST(HttpParserTest, ParsesResponseWithContentLength) {
    HttpResponseParser parser;
    auto done = feed(parser, "HTTP/1.1 422 Unprocessable Entity\r\nContent-Length: 2\r\n\r\n{}");
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());
    EXPECT_EQ(parser.get_response().status_code, 422);
    EXPECT_EQ(parser.get_response().reason_phrase, "Unprocessable Entity");
    EXPECT_EQ(parser.get_response().body_as_string(), "{}");
}

TEST(HttpParserTest, ResponseBodyUntilClose) {
    HttpResponseParser parser;
    auto partial = feed(parser, "HTTP/1.0 200 OK\r\n\r\n{\"remote_id\":");
    ASSERT_TRUE(partial.is_ok());
    EXPECT_FALSE(partial.value());
    ASSERT_TRUE(feed(parser, "\"R1\"}").is_ok());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.get_response().body_as_string(), "{\"remote_id\":\"R1\"}");
}

TEST(HttpParserTest, TruncatedResponseIsAnError) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc").is_ok());
    EXPECT_TRUE(parser.finish().is_error());
}

TEST(HttpParserTest, RejectsBadStatusLine) {
    HttpResponseParser parser;
    EXPECT_TRUE(feed(parser, "HTTP/1.1 2OO OK\r\n").is_error());
}
