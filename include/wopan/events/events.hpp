/**
 * @file events.hpp
 * @brief Event types emitted by the upload core, the extractor and the HTTP service
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ChunkAcceptedEvent, UploadFailedEvent
 * - Every event carries the session's unique_id when one exists, so a
 *   subscriber can correlate all parts of one logical upload
 */

#pragma once

#include "wopan/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace wopan::events {

// ════════════════════════════════════════════════════════
// Upload Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per session after identity and part count are fixed
 */
struct UploadStartedEvent {
    std::string unique_id;
    std::string batch_no;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint32_t total_parts = 0;
    std::string directory_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted for every failed physical request of a chunk
 */
struct ChunkAttemptFailedEvent {
    std::string unique_id;
    std::uint32_t part_index = 0;
    std::uint32_t total_parts = 0;
    int attempt = 0;        ///< 1-based
    int max_attempts = 0;
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted right before the retry machine sleeps
 */
struct ChunkRetryScheduledEvent {
    std::string unique_id;
    std::uint32_t part_index = 0;
    int next_attempt = 0;   ///< 1-based
    int max_attempts = 0;
    std::chrono::milliseconds delay{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkAcceptedEvent {
    std::string unique_id;
    std::uint32_t part_index = 0;
    std::uint32_t total_parts = 0;
    std::size_t part_size = 0;
    int attempts = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Remote file identifier observed; the session ended successfully
 */
struct UploadConfirmedEvent {
    std::string unique_id;
    std::string file_name;
    std::string fid;
    std::uint64_t file_size = 0;
    std::uint32_t parts_uploaded = 0;
    std::uint32_t total_parts = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Last part accepted but no file identifier was ever returned
 *
 * The remote side may still have dropped the file; subscribers should treat
 * this as suspicious.
 */
struct UploadUnconfirmedEvent {
    std::string unique_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint32_t total_parts = 0;
    std::string last_response;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadFailedEvent {
    std::string unique_id;  ///< Empty when the session failed before identity generation
    std::string file_name;
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Extraction Events
// ════════════════════════════════════════════════════════

struct VideoExtractedEvent {
    std::string url;
    std::string video_type;
    std::string file_path;
    std::uint64_t file_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace wopan::events
