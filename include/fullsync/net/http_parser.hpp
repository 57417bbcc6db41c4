#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/net/http_types.hpp"

#include <cctype>
#include <cstddef>
#include <string>

namespace fullsync::net {

/**
 * @brief State machine states for HTTP request parsing
 *
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data may arrive in any number of pieces; parse() returns true once a
 * whole request, body included, has been seen.
 *
 * Usage:
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(data, size);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kDefaultMaxBody = 16 * 1024 * 1024;

    explicit HttpParser(std::size_t max_body = kDefaultMaxBody) : max_body_(max_body) { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool accepted = true;
            switch (state_) {
                case ParseState::METHOD:
                    accepted = parse_method(c);
                    break;
                case ParseState::URL:
                    accepted = parse_url(c);
                    break;
                case ParseState::VERSION:
                    accepted = parse_version(c);
                    break;
                case ParseState::HEADER_NAME:
                    accepted = parse_header_name(c);
                    break;
                case ParseState::HEADER_VALUE:
                    accepted = parse_header_value(c);
                    break;
                case ParseState::BODY:
                    parse_body(c);
                    break;
                case ParseState::COMPLETE:
                    return Ok(true);
                case ParseState::PARSE_ERROR:
                    return Err<bool>(ErrorCode::Validation, "parser in error state");
            }

            if (!accepted) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(ErrorCode::Validation, error_ + " at line " + std::to_string(line_));
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    HttpRequest get_request() const {
        return request_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        body_expected_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    std::size_t body_expected_;
    std::size_t max_body_;
    std::size_t line_;
    bool last_char_was_cr_;

    bool fail(const char* message) {
        error_ = message;
        return false;
    }

    bool parse_method(char c) {
        if (c == ' ') {
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return fail("unsupported HTTP method");
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return fail("malformed HTTP method");
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return fail("empty URL");
            }
            split_target(buffer_);
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return fail("malformed URL");
        }
        buffer_ += c;
        return true;
    }

    /// "/api/sync?x=1&y" → url "/api/sync", query {x: 1, y: ""}.
    void split_target(const std::string& target) {
        const auto question = target.find('?');
        request_.url = target.substr(0, question);
        if (question == std::string::npos) {
            return;
        }
        std::size_t start = question + 1;
        while (start <= target.size()) {
            auto end = target.find('&', start);
            if (end == std::string::npos) {
                end = target.size();
            }
            const auto pair = target.substr(start, end - start);
            if (!pair.empty()) {
                const auto equals = pair.find('=');
                if (equals == std::string::npos) {
                    request_.query[pair] = "";
                } else {
                    request_.query[pair.substr(0, equals)] = pair.substr(equals + 1);
                }
            }
            start = end + 1;
        }
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return fail("unsupported HTTP version");
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return end_of_headers();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return fail("malformed header name");
        }
        buffer_ += c;
        return true;
    }

    bool end_of_headers() {
        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        std::size_t length = 0;
        for (char digit : content_length) {
            if (!std::isdigit(static_cast<unsigned char>(digit))) {
                return fail("malformed Content-Length");
            }
            length = length * 10 + static_cast<std::size_t>(digit - '0');
            if (length > max_body_) {
                return fail("request body too large");
            }
        }
        if (length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        body_expected_ = length;
        request_.body.reserve(length);
        state_ = ParseState::BODY;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    void parse_body(char c) {
        request_.body.push_back(static_cast<uint8_t>(c));
        if (request_.body.size() >= body_expected_) {
            state_ = ParseState::COMPLETE;
        }
    }
};

} // namespace fullsync::net
