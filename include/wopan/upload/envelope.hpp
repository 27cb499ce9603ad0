#pragma once

#include "wopan/upload/types.hpp"

#include <string>
#include <string_view>

namespace wopan::upload {

/**
 * @brief Classify a file by its extension (case-insensitive)
 *
 * image: jpg jpeg png bmp gif
 * video: mp4 mkv avi mov flv
 * audio: mp3 wav flac
 * document: doc docx pdf txt
 * everything else, including names without an extension: other
 */
FileType classify_file_type(std::string_view file_name);

/**
 * @brief Copy of @p text with every byte that does not start a well-formed
 * UTF-8 sequence replaced by U+FFFD
 *
 * Applied once to the file name so the fileName form field, the envelope and
 * the API response all carry the same text.
 */
std::string to_valid_utf8(std::string_view text);

/// Wire code for @p type ("1".."5")
std::string file_type_code(FileType type);

FileInfoEnvelope make_envelope(const SessionIdentity& identity,
                               const std::string& directory_id,
                               const std::string& file_name,
                               std::uint64_t file_size);

/**
 * @brief Compact JSON with fixed key order and ASCII-only output
 *
 * {"spaceType":"0","directoryId":..,"batchNo":..,"fileName":..,"fileSize":N,"fileType":".."}
 */
std::string to_canonical_json(const FileInfoEnvelope& envelope);

} // namespace wopan::upload
