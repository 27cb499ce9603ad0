#pragma once

#include "wopan/core/result.hpp"
#include "wopan/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <limits>
#include <string>

namespace wopan {
namespace network {

/**
 * @brief Where the parser is inside the request
 *
 * METHOD SP URL SP VERSION CRLF
 * *(Header-Name: Header-Value CRLF)
 * CRLF
 * [Body, exactly Content-Length bytes]
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
 * Feed it whatever the socket delivered; parse() returns true once a full
 * request (including its body) has been seen. The request line and headers
 * are parsed byte by byte, the body is copied in bulk so multi-megabyte
 * uploads do not go through the state machine.
 *
 * Bodies are limited to max_body_size bytes. A larger Content-Length fails
 * before any body byte is buffered, with error_status() == PAYLOAD_TOO_LARGE.
 *
 * Usage:
 * ```cpp
 * HttpParser parser(64 * 1024 * 1024);
 * auto result = parser.parse(buffer.data(), bytes_read);
 * if (result.is_error()) {
 *     respond(parser.error_status(), result.error());
 * } else if (result.value()) {
 *     handle(parser.get_request());
 * }
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(std::size_t max_body_size = std::numeric_limits<std::size_t>::max())
        : max_body_size_(max_body_size) {
        reset();
    }

    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool, std::string>("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const size_t wanted = expected_body_ - request_.body.size();
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() == expected_body_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (++header_bytes_ > kMaxHeaderBytes) {
                return fail("Request head exceeds " + std::to_string(kMaxHeaderBytes) + " bytes");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }
            if (!ok) {
                if (state_ == ParseState::PARSE_ERROR) {
                    return Err<bool, std::string>(error_message_);
                }
                return fail("Malformed request at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    /// Moves the parsed request out; the parser must be reset() before reuse
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /// Status to answer with after parse() failed
    HttpStatus error_status() const {
        return error_status_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_message_.clear();
        error_status_ = HttpStatus::BAD_REQUEST;
        expected_body_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_message_;
    HttpStatus error_status_;
    size_t max_body_size_;
    size_t expected_body_;
    size_t header_bytes_;
    size_t line_;
    bool last_char_was_cr_;

    Result<bool> fail(std::string message, HttpStatus status = HttpStatus::BAD_REQUEST) {
        state_ = ParseState::PARSE_ERROR;
        error_status_ = status;
        error_message_ = std::move(message);
        return Err<bool, std::string>(error_message_);
    }

    bool parse_method(char c) {
        if (c == ' ') {
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = std::move(buffer_);
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
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
                return false;
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
            return finish_headers();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = std::move(buffer_);
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = std::move(buffer_);
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

    bool finish_headers() {
        if (!request_.get_header("Transfer-Encoding").empty()) {
            fail("Transfer-Encoding is not supported, send Content-Length", HttpStatus::BAD_REQUEST);
            return false;
        }

        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        size_t length = 0;
        for (char digit : content_length) {
            if (!std::isdigit(static_cast<unsigned char>(digit))) {
                fail("Invalid Content-Length: " + content_length);
                return false;
            }
            const auto value = static_cast<size_t>(digit - '0');
            if (length > (std::numeric_limits<size_t>::max() - value) / 10) {
                fail("Invalid Content-Length: " + content_length);
                return false;
            }
            length = length * 10 + value;
        }

        if (length > max_body_size_) {
            fail("Request body of " + std::to_string(length) + " bytes exceeds the limit of " +
                 std::to_string(max_body_size_) + " bytes", HttpStatus::PAYLOAD_TOO_LARGE);
            return false;
        }

        if (length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        expected_body_ = length;
        request_.body.reserve(length);
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace network
} // namespace wopan
