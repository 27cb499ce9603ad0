#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wopan::upload {

inline constexpr std::size_t kDefaultChunkSize = 8 * 1024 * 1024;
inline constexpr int kMaxAttemptsPerChunk = 3;
inline constexpr const char* kSuccessCode = "0000";
inline constexpr const char* kRootDirectoryId = "0";

/**
 * @brief Closed file classification sent inside the envelope
 *
 * Wire codes are the enum's position + 1 ("1" = image ... "5" = other).
 */
enum class FileType {
    Image,
    Video,
    Audio,
    Document,
    Other
};

/**
 * @brief Session correlation key, generated once per upload()
 */
struct SessionIdentity {
    std::string unique_id;  ///< <epoch-millis>_<6 letters>
    std::string batch_no;   ///< YYYYMMDDHHMMSS, local time
};

/**
 * @brief Plaintext metadata encrypted into the `fileInfo` form field
 */
struct FileInfoEnvelope {
    std::string space_type = "0";
    std::string directory_id = kRootDirectoryId;
    std::string batch_no;
    std::string file_name;
    std::uint64_t file_size = 0;  ///< Whole-file size, never the part size
    FileType file_type = FileType::Other;
};

/**
 * @brief One sequential window of the source file
 */
struct ChunkWindow {
    std::uint32_t part_index = 0;   ///< 1-based
    std::uint64_t offset = 0;
    std::vector<std::uint8_t> data;
};

/**
 * @brief Everything needed to (re)send one part; transient
 */
struct ChunkAttempt {
    std::uint32_t part_index = 0;
    std::size_t part_size = 0;
    std::string encrypted_envelope;
    int attempt_number = 0;         ///< 1-based, <= max attempts
};

/**
 * @brief Decoded body of an upload2C response
 */
struct RemoteResponse {
    std::string code;
    std::string message;
    std::string fid;                ///< Finalization marker, empty until the server finalizes
    nlohmann::json raw = nlohmann::json::object();

    [[nodiscard]] bool accepted() const { return code == kSuccessCode; }
    [[nodiscard]] bool finalized() const { return !fid.empty(); }
};

enum class CompletionStatus {
    Confirmed,                    ///< A fid was observed
    CompletedWithoutConfirmation  ///< Last part accepted, no fid ever seen
};

/**
 * @brief Terminal outcome of a successful upload() call
 */
struct UploadOutcome {
    CompletionStatus status = CompletionStatus::CompletedWithoutConfirmation;
    RemoteResponse response;        ///< Last accepted response
    SessionIdentity identity;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint32_t total_parts = 0;
    std::uint32_t parts_uploaded = 0;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool confirmed() const { return status == CompletionStatus::Confirmed; }
};

} // namespace wopan::upload
