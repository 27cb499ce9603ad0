#include "wopan/network/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace wopan {
namespace network {

namespace {

std::string make_boundary() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << "----WopanFormBoundary" << std::hex << std::setw(16) << std::setfill('0') << gen();
    return oss.str();
}

std::string trim(std::string_view text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(begin, end - begin + 1));
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

// Parses: form-data; name="file"; filename="clip.mp4"
bool parse_disposition(const std::string& value, MultipartPart& part) {
    std::istringstream stream(value);
    std::string token;
    bool is_form_data = false;
    bool has_name = false;

    while (std::getline(stream, token, ';')) {
        token = trim(token);
        const auto eq = token.find('=');
        if (eq == std::string::npos) {
            is_form_data = is_form_data || to_lower(token) == "form-data";
            continue;
        }
        const auto key = to_lower(trim(std::string_view(token).substr(0, eq)));
        const auto param = unquote(trim(std::string_view(token).substr(eq + 1)));
        if (key == "name") {
            part.name = param;
            has_name = true;
        } else if (key == "filename") {
            part.filename = param;
        }
    }
    return is_form_data && has_name;
}

Result<MultipartPart> parse_part_headers(std::string_view headers) {
    MultipartPart part;
    bool has_disposition = false;

    std::size_t pos = 0;
    while (pos < headers.size()) {
        auto eol = headers.find("\r\n", pos);
        if (eol == std::string_view::npos) {
            eol = headers.size();
        }
        const auto line = headers.substr(pos, eol - pos);
        pos = eol + 2;
        if (line.empty()) {
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return Err<MultipartPart, std::string>("Malformed part header: " + std::string(line));
        }
        const auto name = to_lower(trim(line.substr(0, colon)));
        const auto value = trim(line.substr(colon + 1));

        if (name == "content-disposition") {
            if (!parse_disposition(value, part)) {
                return Err<MultipartPart, std::string>("Unsupported Content-Disposition: " + value);
            }
            has_disposition = true;
        } else if (name == "content-type") {
            part.content_type = value;
        }
    }

    if (!has_disposition) {
        return Err<MultipartPart, std::string>("Part without Content-Disposition");
    }
    return Ok(std::move(part));
}

} // namespace

// ────────────────────────────────────────────────────────────
// MultipartForm
// ────────────────────────────────────────────────────────────

const MultipartPart* MultipartForm::find(const std::string& name) const {
    for (const auto& part : parts) {
        if (part.name == name) {
            return &part;
        }
    }
    return nullptr;
}

std::string MultipartForm::get_field(const std::string& name, const std::string& default_value) const {
    const auto* part = find(name);
    return part ? part->data_as_string() : default_value;
}

// ────────────────────────────────────────────────────────────
// MultipartWriter
// ────────────────────────────────────────────────────────────

MultipartWriter::MultipartWriter() : MultipartWriter(make_boundary()) {}

MultipartWriter::MultipartWriter(std::string boundary) : boundary_(std::move(boundary)) {}

void MultipartWriter::add_field(const std::string& name, const std::string& value) {
    body_ += "--" + boundary_ + "\r\n";
    body_ += "Content-Disposition: form-data; name=" + quote(name) + "\r\n\r\n";
    body_ += value;
    body_ += "\r\n";
}

void MultipartWriter::add_file(const std::string& name, const std::string& filename,
                               const std::string& content_type, const std::vector<uint8_t>& data) {
    body_ += "--" + boundary_ + "\r\n";
    body_ += "Content-Disposition: form-data; name=" + quote(name) + "; filename=" + quote(filename) + "\r\n";
    body_ += "Content-Type: " + content_type + "\r\n\r\n";
    body_.append(data.begin(), data.end());
    body_ += "\r\n";
}

std::string MultipartWriter::finish() {
    if (!finished_) {
        body_ += "--" + boundary_ + "--\r\n";
        finished_ = true;
    }
    return body_;
}

// ────────────────────────────────────────────────────────────
// Parsing
// ────────────────────────────────────────────────────────────

Result<std::string> boundary_from_content_type(const std::string& content_type) {
    if (to_lower(content_type).rfind("multipart/form-data", 0) != 0) {
        return Err<std::string, std::string>("Expected multipart/form-data, got: " + content_type);
    }

    std::istringstream stream(content_type);
    std::string token;
    while (std::getline(stream, token, ';')) {
        token = trim(token);
        const auto eq = token.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (to_lower(trim(std::string_view(token).substr(0, eq))) == "boundary") {
            auto boundary = unquote(trim(std::string_view(token).substr(eq + 1)));
            if (!boundary.empty()) {
                return Ok(std::move(boundary));
            }
        }
    }
    return Err<std::string, std::string>("Missing multipart boundary");
}

Result<MultipartForm> parse_multipart(std::string_view body, const std::string& boundary) {
    const std::string delimiter = "--" + boundary;
    const std::string part_end = "\r\n" + delimiter;

    auto pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        return Err<MultipartForm, std::string>("Multipart boundary not found in body");
    }

    MultipartForm form;
    while (true) {
        pos += delimiter.size();
        if (body.substr(pos, 2) == "--") {
            return Ok(std::move(form));
        }
        if (body.substr(pos, 2) != "\r\n") {
            return Err<MultipartForm, std::string>("Malformed multipart delimiter line");
        }
        pos += 2;

        const auto headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string_view::npos) {
            return Err<MultipartForm, std::string>("Unterminated part headers");
        }

        auto part = parse_part_headers(body.substr(pos, headers_end - pos));
        if (part.is_error()) {
            return Err<MultipartForm, std::string>(part.error());
        }

        const auto data_begin = headers_end + 4;
        const auto data_end = body.find(part_end, data_begin);
        if (data_end == std::string_view::npos) {
            return Err<MultipartForm, std::string>("Unterminated part: " + part.value().name);
        }

        const auto data = body.substr(data_begin, data_end - data_begin);
        part.value().data.assign(data.begin(), data.end());
        form.parts.push_back(std::move(part.value()));

        pos = data_end + 2;  // now at the delimiter
    }
}

} // namespace network
} // namespace wopan
