#include "wopan/upload/envelope.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>

namespace wopan::upload {
namespace {

struct ExtensionGroup {
    FileType type;
    std::array<std::string_view, 5> extensions;
};

constexpr std::array<ExtensionGroup, 4> kGroups{{
    {FileType::Image, {"jpg", "jpeg", "png", "bmp", "gif"}},
    {FileType::Video, {"mp4", "mkv", "avi", "mov", "flv"}},
    {FileType::Audio, {"mp3", "wav", "flac", "", ""}},
    {FileType::Document, {"doc", "docx", "pdf", "txt", ""}},
}};

std::string lowercase_extension(std::string_view file_name) {
    std::string ext = std::filesystem::path(std::string(file_name)).extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

FileType classify_file_type(std::string_view file_name) {
    const auto ext = lowercase_extension(file_name);
    if (ext.empty()) {
        return FileType::Other;
    }
    for (const auto& group : kGroups) {
        if (std::find(group.extensions.begin(), group.extensions.end(), ext) != group.extensions.end()) {
            return group.type;
        }
    }
    return FileType::Other;
}

std::string file_type_code(FileType type) {
    return std::to_string(static_cast<int>(type) + 1);
}

FileInfoEnvelope make_envelope(const SessionIdentity& identity,
                               const std::string& directory_id,
                               const std::string& file_name,
                               std::uint64_t file_size) {
    FileInfoEnvelope envelope;
    envelope.directory_id = directory_id;
    envelope.batch_no = identity.batch_no;
    envelope.file_name = file_name;
    envelope.file_size = file_size;
    envelope.file_type = classify_file_type(file_name);
    return envelope;
}

std::string to_valid_utf8(std::string_view text) {
    constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out.push_back(text[i++]);
            continue;
        }

        std::size_t length = 0;
        std::uint32_t code_point = 0;
        std::uint32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
            minimum = 0x10000;
        }

        bool valid = length != 0 && i + length <= text.size();
        for (std::size_t k = 1; valid && k < length; ++k) {
            const auto c = static_cast<unsigned char>(text[i + k]);
            valid = (c & 0xC0) == 0x80;
            code_point = (code_point << 6) | (c & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF are malformed too
        valid = valid && code_point >= minimum && code_point <= 0x10FFFF &&
                (code_point < 0xD800 || code_point > 0xDFFF);

        if (!valid) {
            out.append(kReplacement);
            ++i;
            continue;
        }
        out.append(text.substr(i, length));
        i += length;
    }
    return out;
}

std::string to_canonical_json(const FileInfoEnvelope& envelope) {
    nlohmann::ordered_json j;
    j["spaceType"] = envelope.space_type;
    j["directoryId"] = envelope.directory_id;
    j["batchNo"] = envelope.batch_no;
    j["fileName"] = envelope.file_name;
    j["fileSize"] = envelope.file_size;
    j["fileType"] = file_type_code(envelope.file_type);
    // Compact and ASCII-escaped
    return j.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

} // namespace wopan::upload
