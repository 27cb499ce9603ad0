#include "wopan/server/routes.hpp"

#include "wopan/events/events.hpp"
#include "wopan/network/multipart.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace wopan::server {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse make_json(HttpStatus status, const json& body) {
    return network::make_json_response(status, dump_json(body));
}

Expected<json> parse_json_object(const HttpContext& ctx) {
    auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<json>(make_error(ErrorKind::Validation, "Request body must be a JSON object"));
    }
    return Ok<json, Error>(std::move(payload));
}

/// Missing or null fields read as @p fallback; other non-strings are rejected
Expected<std::string> string_field(const json& payload, const std::string& name, const std::string& fallback = "") {
    const auto it = payload.find(name);
    if (it == payload.end() || it->is_null()) {
        return Ok<std::string, Error>(fallback);
    }
    if (!it->is_string()) {
        return Err<std::string>(make_error(ErrorKind::Validation, name + " must be a string"));
    }
    return Ok<std::string, Error>(it->get<std::string>());
}

/// Removes a received file on every exit path of the handler
class ReceivedFile {
public:
    ReceivedFile(const media::TempWorkspace& workspace, std::filesystem::path path)
        : workspace_(workspace), path_(std::move(path)) {}

    ~ReceivedFile() { workspace_.release(path_); }

    ReceivedFile(const ReceivedFile&) = delete;
    ReceivedFile& operator=(const ReceivedFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    const media::TempWorkspace& workspace_;
    std::filesystem::path path_;
};

Expected<void> write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<void>(make_error(ErrorKind::Internal, "Failed to create " + path.string()));
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        return Err<void>(make_error(ErrorKind::Internal, "Failed to write " + path.string()));
    }
    return Ok<Error>();
}

HttpResponse run_upload(ServiceContext& context, const std::filesystem::path& file, const std::string& directory_id) {
    auto outcome = context.uploader.upload(file, directory_id, context.shutdown);
    if (outcome.is_error()) {
        return make_error_response(outcome.error());
    }
    return make_json(HttpStatus::OK, outcome_to_json(outcome.value()));
}

// ════════════════════════════════════════════════════════
// Handlers
// ════════════════════════════════════════════════════════

HttpResponse handle_healthy(ServiceContext& context) {
    return make_json(HttpStatus::OK, json{
        {"status", "ok"},
        {"message", "Service is healthy"},
        {"time", iso_timestamp(context.clock())},
    });
}

HttpResponse handle_download(ServiceContext& context, const HttpContext& ctx) {
    auto payload = parse_json_object(ctx);
    if (payload.is_error()) {
        return make_error_response(payload.error());
    }

    auto url = string_field(payload.value(), "video_url");
    if (url.is_error()) {
        return make_error_response(url.error());
    }
    if (url.value().empty()) {
        return make_error_response(make_error(ErrorKind::Validation, "video_url must not be empty"));
    }

    auto type_name = string_field(payload.value(), "type");
    if (type_name.is_error()) {
        return make_error_response(type_name.error());
    }
    auto type = media::parse_video_type(type_name.value());
    if (type.is_error()) {
        return make_error_response(type.error());
    }

    spdlog::info("Download requested: type={} url={}", media::to_string(type.value()), url.value());

    auto extraction = context.extractor.extract(url.value(), type.value());
    if (extraction.is_error()) {
        return make_error_response(extraction.error());
    }

    const auto& extracted = extraction.value();
    context.bus.emit(events::VideoExtractedEvent{
        url.value(),
        media::to_string(type.value()),
        extracted.file_path.string(),
        extracted.file_size,
    });

    return make_json(HttpStatus::OK, json{
        {"status", "success"},
        {"file_path", extracted.file_path.string()},
        {"extension", extracted.extension},
        {"file_size", extracted.file_size},
        {"message", "Video downloaded successfully"},
    });
}

HttpResponse handle_wopan_upload(ServiceContext& context, const HttpContext& ctx) {
    auto payload = parse_json_object(ctx);
    if (payload.is_error()) {
        return make_error_response(payload.error());
    }

    auto file_path = string_field(payload.value(), "file_path");
    if (file_path.is_error()) {
        return make_error_response(file_path.error());
    }
    if (file_path.value().empty()) {
        return make_error_response(make_error(ErrorKind::Validation, "file_path must not be empty"));
    }

    auto directory_id = string_field(payload.value(), "directory_id", upload::kRootDirectoryId);
    if (directory_id.is_error()) {
        return make_error_response(directory_id.error());
    }

    return run_upload(context, file_path.value(), directory_id.value());
}

HttpResponse handle_wopan_file_upload(ServiceContext& context, const HttpContext& ctx) {
    auto boundary = network::boundary_from_content_type(ctx.request.get_header("Content-Type"));
    if (boundary.is_error()) {
        return make_error_response(make_error(ErrorKind::Validation, boundary.error()));
    }

    const std::string_view body(reinterpret_cast<const char*>(ctx.request.body.data()), ctx.request.body.size());
    auto form = network::parse_multipart(body, boundary.value());
    if (form.is_error()) {
        return make_error_response(make_error(ErrorKind::Validation, form.error()));
    }

    const auto* file = form.value().find("file");
    if (file == nullptr || !file->is_file()) {
        return make_error_response(make_error(ErrorKind::Validation, "Multipart field 'file' is required"));
    }

    auto directory_id = form.value().get_field("directory_id", upload::kRootDirectoryId);
    if (directory_id.empty()) {
        directory_id = upload::kRootDirectoryId;
    }

    auto path = context.workspace.reserve_upload_path(*file->filename);
    if (path.is_error()) {
        return make_error_response(path.error());
    }

    ReceivedFile received(context.workspace, path.value());
    if (auto written = write_file(received.path(), file->data); written.is_error()) {
        return make_error_response(written.error());
    }

    spdlog::info("Received {} ({} bytes) for upload", *file->filename, file->data.size());
    return run_upload(context, received.path(), directory_id);
}

} // namespace

network::HttpStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:
        case ErrorKind::InvalidCredential:
            return HttpStatus::BAD_REQUEST;
        case ErrorKind::NotFound:
            return HttpStatus::NOT_FOUND;
        case ErrorKind::TransientTransport:
        case ErrorKind::ApplicationProtocol:
        case ErrorKind::FatalProtocol:
            return HttpStatus::BAD_GATEWAY;
        case ErrorKind::Cancelled:
            return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorKind::MissingCredential:
        case ErrorKind::Extraction:
        case ErrorKind::Internal:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse make_error_response(const Error& error) {
    const auto status = status_for(error.kind);
    if (static_cast<int>(status) >= 500) {
        spdlog::error("Request failed ({}): {}", to_string(error.kind), error.message);
    } else {
        spdlog::warn("Request rejected ({}): {}", to_string(error.kind), error.message);
    }
    return make_json(status, json{{"detail", error.message}, {"kind", to_string(error.kind)}});
}

json outcome_to_json(const upload::UploadOutcome& outcome) {
    return json{
        {"status", "success"},
        {"confirmed", outcome.confirmed()},
        {"fid", outcome.response.fid},
        {"unique_id", outcome.identity.unique_id},
        {"batch_no", outcome.identity.batch_no},
        {"file_name", outcome.file_name},
        {"file_size", outcome.file_size},
        {"parts_uploaded", outcome.parts_uploaded},
        {"total_parts", outcome.total_parts},
        {"duration_ms", outcome.duration.count()},
        {"message", outcome.confirmed() ? "Upload confirmed" : "Upload finished without a file id"},
        {"response", outcome.response.raw},
    };
}

std::string dump_json(const json& body, int indent) {
    return body.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&seconds, &local);

    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << (micros < 0 ? micros + 1000000 : micros);
    return oss.str();
}

void register_routes(network::HttpRouter& router, ServiceContext& context) {
    router.get("/healthy", [&context](const HttpContext&) {
        return handle_healthy(context);
    });

    auto video = router.group("/api/video");
    video->post("/download", [&context](const HttpContext& ctx) {
        return handle_download(context, ctx);
    });
    video->post("/wopan/upload", [&context](const HttpContext& ctx) {
        return handle_wopan_upload(context, ctx);
    });
    video->post("/wopan/file-upload", [&context](const HttpContext& ctx) {
        return handle_wopan_file_upload(context, ctx);
    });
}

} // namespace wopan::server
