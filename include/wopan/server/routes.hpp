#pragma once

#include "wopan/core/cancellation.hpp"
#include "wopan/core/error.hpp"
#include "wopan/events/event_bus.hpp"
#include "wopan/media/extractor.hpp"
#include "wopan/media/filename.hpp"
#include "wopan/network/http_router.hpp"
#include "wopan/upload/types.hpp"
#include "wopan/upload/uploader.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>

namespace wopan::server {

/**
 * @brief Collaborators shared by every request handler
 *
 * All references must outlive the router. `shutdown` is handed to each
 * upload so a stopping server aborts sessions between parts.
 */
struct ServiceContext {
    upload::Uploader& uploader;
    media::VideoExtractor& extractor;
    const media::TempWorkspace& workspace;
    events::EventBus& bus;
    CancellationToken shutdown;
    std::function<std::chrono::system_clock::time_point()> clock = [] {
        return std::chrono::system_clock::now();
    };
};

/**
 * @brief Register the relay API
 *
 *   GET  /healthy
 *   POST /api/video/download              {"video_url", "type"}
 *   POST /api/video/wopan/upload          {"file_path", "directory_id"?}
 *   POST /api/video/wopan/file-upload     multipart: file, directory_id?
 */
void register_routes(network::HttpRouter& router, ServiceContext& context);

/// HTTP status for an error kind at the API boundary
network::HttpStatus status_for(ErrorKind kind);

/// {"detail": message, "kind": kind} with the mapped status
network::HttpResponse make_error_response(const Error& error);

nlohmann::json outcome_to_json(const upload::UploadOutcome& outcome);

/// Serialize an API body; invalid UTF-8 in any string becomes U+FFFD
std::string dump_json(const nlohmann::json& body, int indent = -1);

/// Local time as YYYY-MM-DDTHH:MM:SS.ffffff
std::string iso_timestamp(std::chrono::system_clock::time_point tp);

} // namespace wopan::server
