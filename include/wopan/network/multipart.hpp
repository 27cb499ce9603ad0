#pragma once

#include "wopan/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wopan {
namespace network {

/**
 * @brief One part of a multipart/form-data body
 *
 * A part with a filename is a file upload; without one it is a plain field.
 */
struct MultipartPart {
    std::string name;
    std::optional<std::string> filename;
    std::string content_type;
    std::vector<uint8_t> data;

    bool is_file() const { return filename.has_value(); }
    std::string data_as_string() const { return std::string(data.begin(), data.end()); }
};

struct MultipartForm {
    std::vector<MultipartPart> parts;

    const MultipartPart* find(const std::string& name) const;

    /// Text value of field @p name, or @p default_value when absent
    std::string get_field(const std::string& name, const std::string& default_value = "") const;
};

/**
 * @brief Builds a multipart/form-data body
 *
 * Fields are written in the order they are added.
 *
 * Example:
 * @code
 * MultipartWriter writer;
 * writer.add_field("partIndex", "1");
 * writer.add_file("file", "clip.mp4", "application/octet-stream", bytes);
 * request.set(http::field::content_type, writer.content_type());
 * request.body() = writer.finish();
 * @endcode
 */
class MultipartWriter {
public:
    MultipartWriter();
    explicit MultipartWriter(std::string boundary);

    void add_field(const std::string& name, const std::string& value);
    void add_file(const std::string& name, const std::string& filename,
                  const std::string& content_type, const std::vector<uint8_t>& data);

    /// Closes the body; no parts may be added afterwards
    std::string finish();

    const std::string& boundary() const { return boundary_; }
    std::string content_type() const { return "multipart/form-data; boundary=" + boundary_; }

private:
    std::string boundary_;
    std::string body_;
    bool finished_ = false;
};

/**
 * @brief Extract the boundary parameter from a Content-Type header value
 */
Result<std::string> boundary_from_content_type(const std::string& content_type);

/**
 * @brief Parse a complete multipart/form-data body
 */
Result<MultipartForm> parse_multipart(std::string_view body, const std::string& boundary);

} // namespace network
} // namespace wopan
