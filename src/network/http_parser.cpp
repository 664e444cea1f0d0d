#include "fts/network/http_parser.hpp"

#include <cctype>
#include <limits>

namespace fts::network {
namespace {

bool parse_version(const std::string& text, HttpVersion& out) {
    if (text == "HTTP/1.1") {
        out = HttpVersion::HTTP_1_1;
        return true;
    }
    if (text == "HTTP/1.0") {
        out = HttpVersion::HTTP_1_0;
        return true;
    }
    return false;
}

bool parse_content_length(const std::string& text, std::size_t& out) {
    if (text.empty()) {
        return false;
    }
    std::size_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        if (value > (std::numeric_limits<std::size_t>::max() - 9) / 10) {
            return false;
        }
        value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    out = value;
    return true;
}

} // namespace

void HttpMessageParser::reset_state() {
    state_ = ParseState::START_LINE;
    buffer_.clear();
    current_header_name_.clear();
    header_bytes_ = 0;
    expected_body_ = 0;
    line_ = 1;
    last_char_was_cr_ = false;
}

Result<bool> HttpMessageParser::parse(const char* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::PARSE_ERROR) {
            return Err<bool>(Error::invalid_argument("Parser in error state"));
        }

        const char c = data[i];
        if (state_ != ParseState::BODY && state_ != ParseState::BODY_UNTIL_CLOSE) {
            if (++header_bytes_ > kMaxHeaderBytes) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(Error::invalid_argument("HTTP header section too large"));
            }
        }

        if (!step(c)) {
            const std::size_t line = line_;
            state_ = ParseState::PARSE_ERROR;
            return Err<bool>(Error::invalid_argument("Malformed HTTP message at line " + std::to_string(line)));
        }
        if (c == '\n') {
            line_++;
        }
    }
    return Ok(state_ == ParseState::COMPLETE);
}

Result<bool> HttpMessageParser::finish() {
    if (state_ == ParseState::BODY_UNTIL_CLOSE) {
        state_ = ParseState::COMPLETE;
    }
    if (state_ == ParseState::COMPLETE) {
        return Ok(true);
    }
    return Err<bool>(Error::invalid_argument("Connection closed before the HTTP message was complete"));
}

bool HttpMessageParser::step(char c) {
    switch (state_) {
        case ParseState::START_LINE:
            if (c == '\r') {
                last_char_was_cr_ = true;
                return true;
            }
            if (c == '\n' && last_char_was_cr_) {
                last_char_was_cr_ = false;
                if (!on_start_line(buffer_)) {
                    return false;
                }
                buffer_.clear();
                state_ = ParseState::HEADER_NAME;
                return true;
            }
            last_char_was_cr_ = false;
            buffer_ += c;
            return true;

        case ParseState::HEADER_NAME:
            if (c == '\r') {
                last_char_was_cr_ = true;
                return true;
            }
            if (c == '\n' && last_char_was_cr_) {
                last_char_was_cr_ = false;
                if (!buffer_.empty()) {
                    return false;
                }
                return on_headers_complete();
            }
            last_char_was_cr_ = false;
            if (c == ':') {
                if (buffer_.empty()) {
                    return false;
                }
                current_header_name_ = buffer_;
                buffer_.clear();
                state_ = ParseState::HEADER_VALUE;
                return true;
            }
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
                return false;
            }
            buffer_ += c;
            return true;

        case ParseState::HEADER_VALUE:
            if (buffer_.empty() && (c == ' ' || c == '\t')) {
                return true;
            }
            if (c == '\r') {
                last_char_was_cr_ = true;
                return true;
            }
            if (c == '\n' && last_char_was_cr_) {
                while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                    buffer_.pop_back();
                }
                headers()[current_header_name_] = buffer_;
                buffer_.clear();
                current_header_name_.clear();
                last_char_was_cr_ = false;
                state_ = ParseState::HEADER_NAME;
                return true;
            }
            last_char_was_cr_ = false;
            buffer_ += c;
            return true;

        case ParseState::BODY:
            body().push_back(static_cast<uint8_t>(c));
            if (body().size() >= expected_body_) {
                state_ = ParseState::COMPLETE;
            }
            return true;

        case ParseState::BODY_UNTIL_CLOSE:
            if (body().size() >= kMaxBodyBytes) {
                return false;
            }
            body().push_back(static_cast<uint8_t>(c));
            return true;

        case ParseState::COMPLETE:
        case ParseState::PARSE_ERROR:
            return false;
    }
    return false;
}

bool HttpMessageParser::on_headers_complete() {
    const std::string content_length = find_header(headers(), "Content-Length");
    if (!content_length.empty()) {
        if (!parse_content_length(content_length, expected_body_) || expected_body_ > kMaxBodyBytes) {
            return false;
        }
        if (expected_body_ > 0) {
            body().reserve(expected_body_);
            state_ = ParseState::BODY;
            return true;
        }
        state_ = ParseState::COMPLETE;
        return true;
    }

    state_ = body_until_close() ? ParseState::BODY_UNTIL_CLOSE : ParseState::COMPLETE;
    return true;
}

bool HttpRequestParser::on_start_line(const std::string& line) {
    // METHOD SP URL SP VERSION
    const auto first = line.find(' ');
    if (first == std::string::npos || first == 0) {
        return false;
    }
    const auto second = line.find(' ', first + 1);
    if (second == std::string::npos || second == first + 1) {
        return false;
    }

    request_.method = HttpMethodUtils::from_string(line.substr(0, first));
    if (request_.method == HttpMethod::UNKNOWN) {
        return false;
    }
    request_.url = line.substr(first + 1, second - first - 1);
    for (char c : request_.url) {
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return parse_version(line.substr(second + 1), request_.version);
}

bool HttpResponseParser::on_start_line(const std::string& line) {
    // VERSION SP STATUS [SP REASON]
    const auto first = line.find(' ');
    if (first == std::string::npos) {
        return false;
    }
    if (!parse_version(line.substr(0, first), response_.version)) {
        return false;
    }

    const auto second = line.find(' ', first + 1);
    const std::string code = line.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
    if (code.size() != 3 || !std::isdigit(static_cast<unsigned char>(code[0])) ||
        !std::isdigit(static_cast<unsigned char>(code[1])) || !std::isdigit(static_cast<unsigned char>(code[2]))) {
        return false;
    }
    response_.status_code = std::stoi(code);
    response_.reason_phrase = second == std::string::npos ? std::string() : line.substr(second + 1);
    return true;
}

} // namespace fts::network
