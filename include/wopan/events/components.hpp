/**
 * @file components.hpp
 * @brief Event subscribers that turn upload events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * Uploader uploader(config, transport, cipher, bus);
 */

#pragma once

#include "wopan/events/event_bus.hpp"
#include "wopan/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace wopan::events {

/**
 * @brief Logs every upload, retry and server event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        });

        bus_.subscribe<ChunkAttemptFailedEvent>([this](const ChunkAttemptFailedEvent& e) {
            on_chunk_attempt_failed(e);
        });

        bus_.subscribe<ChunkRetryScheduledEvent>([this](const ChunkRetryScheduledEvent& e) {
            on_chunk_retry_scheduled(e);
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            on_chunk_accepted(e);
        });

        bus_.subscribe<UploadConfirmedEvent>([this](const UploadConfirmedEvent& e) {
            on_upload_confirmed(e);
        });

        bus_.subscribe<UploadUnconfirmedEvent>([this](const UploadUnconfirmedEvent& e) {
            on_upload_unconfirmed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });

        bus_.subscribe<VideoExtractedEvent>([this](const VideoExtractedEvent& e) {
            on_video_extracted(e);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] id={} batch={} file={} bytes={} parts={} dir={}",
                     e.unique_id, e.batch_no, e.file_name, e.file_size, e.total_parts, e.directory_id);
    }

    void on_chunk_attempt_failed(const ChunkAttemptFailedEvent& e) {
        spdlog::warn("[ChunkFailed] id={} part={}/{} attempt={}/{} kind={} error={}",
                     e.unique_id, e.part_index, e.total_parts, e.attempt, e.max_attempts,
                     to_string(e.kind), e.message);
    }

    void on_chunk_retry_scheduled(const ChunkRetryScheduledEvent& e) {
        spdlog::info("[ChunkRetry] id={} part={} attempt={}/{} in {}ms",
                     e.unique_id, e.part_index, e.next_attempt, e.max_attempts, e.delay.count());
    }

    void on_chunk_accepted(const ChunkAcceptedEvent& e) {
        spdlog::info("[ChunkAccepted] id={} part={}/{} bytes={} attempts={}",
                     e.unique_id, e.part_index, e.total_parts, e.part_size, e.attempts);
    }

    void on_upload_confirmed(const UploadConfirmedEvent& e) {
        spdlog::info("[UploadConfirmed] id={} file={} fid={} parts={}/{} duration={}ms",
                     e.unique_id, e.file_name, e.fid, e.parts_uploaded, e.total_parts, e.duration.count());
    }

    void on_upload_unconfirmed(const UploadUnconfirmedEvent& e) {
        spdlog::warn("[UploadUnconfirmed] id={} file={} parts={} no fid returned in last part, response={}",
                     e.unique_id, e.file_name, e.total_parts, e.last_response);
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] id={} file={} kind={} error={}",
                      e.unique_id.empty() ? "-" : e.unique_id, e.file_name, to_string(e.kind), e.message);
    }

    void on_video_extracted(const VideoExtractedEvent& e) {
        spdlog::info("[VideoExtracted] type={} url={} path={} bytes={}",
                     e.video_type, e.url, e.file_path, e.file_size);
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Wopan relay listening on port {}", e.port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Counts sessions, parts and retries for the shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_confirmed{0};
        std::atomic<uint64_t> uploads_unconfirmed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> parts_accepted{0};
        std::atomic<uint64_t> bytes_accepted{0};
        std::atomic<uint64_t> attempts_failed{0};
        std::atomic<uint64_t> retries_scheduled{0};
        std::atomic<uint64_t> videos_extracted{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.parts_accepted++;
            stats_.bytes_accepted += e.part_size;
        });

        bus_.subscribe<ChunkAttemptFailedEvent>([this](const ChunkAttemptFailedEvent&) {
            stats_.attempts_failed++;
        });

        bus_.subscribe<ChunkRetryScheduledEvent>([this](const ChunkRetryScheduledEvent&) {
            stats_.retries_scheduled++;
        });

        bus_.subscribe<UploadConfirmedEvent>([this](const UploadConfirmedEvent&) {
            stats_.uploads_confirmed++;
        });

        bus_.subscribe<UploadUnconfirmedEvent>([this](const UploadUnconfirmedEvent&) {
            stats_.uploads_unconfirmed++;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        bus_.subscribe<VideoExtractedEvent>([this](const VideoExtractedEvent&) {
            stats_.videos_extracted++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads started:     {}", stats_.uploads_started.load());
        spdlog::info("  Uploads confirmed:   {}", stats_.uploads_confirmed.load());
        spdlog::info("  Uploads unconfirmed: {}", stats_.uploads_unconfirmed.load());
        spdlog::info("  Uploads failed:      {}", stats_.uploads_failed.load());
        spdlog::info("  Parts accepted:      {}", stats_.parts_accepted.load());
        spdlog::info("  Bytes accepted:      {}", stats_.bytes_accepted.load());
        spdlog::info("  Failed attempts:     {}", stats_.attempts_failed.load());
        spdlog::info("  Retries scheduled:   {}", stats_.retries_scheduled.load());
        spdlog::info("  Videos extracted:    {}", stats_.videos_extracted.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace wopan::events
