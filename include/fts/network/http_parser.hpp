#pragma once

#include "fts/core/result.hpp"
#include "fts/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace fts::network {

/**
 * @brief Parser states, one character at a time
 *
 * Network data arrives in arbitrary chunks, so the parser keeps its place
 * between parse() calls instead of buffering the whole message first.
 *
 * START-LINE CRLF                  <- request line or status line
 * Header-Name: Header-Value CRLF   <- headers (multiple)
 * CRLF                             <- empty line
 * [Body]                           <- Content-Length bytes, or until close
 */
enum class ParseState {
    START_LINE,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    BODY_UNTIL_CLOSE,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x message parser shared by requests and responses
 */
class HttpMessageParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
    static constexpr std::size_t kMaxBodyBytes = 4 * 1024 * 1024;

    virtual ~HttpMessageParser() = default;

    /**
     * @brief Feed the next chunk
     * @return true once a complete message has been parsed, false if more data is needed
     */
    Result<bool> parse(const char* data, std::size_t len);

    /**
     * @brief The peer closed the connection
     *
     * Completes a message whose body runs until close; anything else still
     * unfinished is a truncated message.
     */
    Result<bool> finish();

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

protected:
    HttpMessageParser() = default;

    void reset_state();

    virtual bool on_start_line(const std::string& line) = 0;
    virtual HeaderMap& headers() = 0;
    virtual std::vector<uint8_t>& body() = 0;

    /// Whether a message without Content-Length carries a body up to connection close.
    virtual bool body_until_close() const = 0;

private:
    bool step(char c);
    bool on_headers_complete();

    ParseState state_ = ParseState::START_LINE;
    std::string buffer_;
    std::string current_header_name_;
    std::size_t header_bytes_ = 0;
    std::size_t expected_body_ = 0;
    std::size_t line_ = 1;
    bool last_char_was_cr_ = false;
};

/**
 * @brief Server side: parses requests (authority stub)
 */
class HttpRequestParser final : public HttpMessageParser {
public:
    HttpRequestParser() { reset(); }

    const HttpRequest& get_request() const { return request_; }

    void reset() {
        reset_state();
        request_ = HttpRequest();
    }

protected:
    bool on_start_line(const std::string& line) override;
    HeaderMap& headers() override { return request_.headers; }
    std::vector<uint8_t>& body() override { return request_.body; }
    bool body_until_close() const override { return false; }

private:
    HttpRequest request_;
};

/**
 * @brief Client side: parses responses (remote endpoint)
 */
class HttpResponseParser final : public HttpMessageParser {
public:
    HttpResponseParser() { reset(); }

    const HttpResponse& get_response() const { return response_; }

    void reset() {
        reset_state();
        response_ = HttpResponse();
    }

protected:
    bool on_start_line(const std::string& line) override;
    HeaderMap& headers() override { return response_.headers; }
    std::vector<uint8_t>& body() override { return response_.body; }
    bool body_until_close() const override { return true; }

private:
    HttpResponse response_;
};

} // namespace fts::network
