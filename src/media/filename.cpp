#include "wopan/media/filename.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

namespace wopan::media {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kForbidden = "/\\:*?\"<>|";
constexpr const char* kUploadsCategory = "uploads";

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string sanitize_filename(std::string_view title, std::size_t max_length) {
    std::string cleaned;
    cleaned.reserve(title.size());
    for (char c : title) {
        if (kForbidden.find(c) != std::string_view::npos) {
            continue;
        }
        if (c == ' ') {
            c = '_';
        }
        if (c == '_' && !cleaned.empty() && cleaned.back() == '_') {
            continue;
        }
        cleaned.push_back(c);
    }

    std::size_t code_points = 0;
    std::size_t cut = 0;
    while (cut < cleaned.size()) {
        if (!is_continuation_byte(cleaned[cut])) {
            if (code_points == max_length) {
                break;
            }
            ++code_points;
        }
        ++cut;
    }
    cleaned.resize(cut);

    while (!cleaned.empty() && cleaned.back() == '_') {
        cleaned.pop_back();
    }
    return cleaned.empty() ? std::string("video") : cleaned;
}

std::string short_id() {
    static std::mutex mutex;
    static boost::uuids::random_generator generator;

    boost::uuids::uuid id;
    {
        std::lock_guard lock(mutex);
        id = generator();
    }
    return boost::uuids::to_string(id).substr(0, 8);
}

TempWorkspace::TempWorkspace(fs::path root) : root_(std::move(root)) {}

Expected<fs::path> TempWorkspace::directory_for(std::string_view category) const {
    const auto dir = root_ / std::string(category);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Err<fs::path>(make_error(ErrorKind::Internal,
                                        "Failed to create " + dir.string() + ": " + ec.message()));
    }
    return Ok<fs::path, Error>(dir);
}

Expected<fs::path> TempWorkspace::reserve_upload_path(std::string_view original_name) const {
    auto base = fs::path(std::string(original_name)).filename().string();
    if (base.empty() || base == "." || base == "..") {
        return Err<fs::path>(make_error(ErrorKind::Validation, "Uploaded file has no usable name"));
    }

    auto uploads = directory_for(kUploadsCategory);
    if (uploads.is_error()) {
        return uploads;
    }

    const auto dir = uploads.value() / short_id();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Err<fs::path>(make_error(ErrorKind::Internal,
                                        "Failed to create " + dir.string() + ": " + ec.message()));
    }
    return Ok<fs::path, Error>(dir / base);
}

void TempWorkspace::release(const fs::path& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp file {}: {}", path.string(), ec.message());
    }

    // Per-upload directories live directly under <root>/uploads
    const auto parent = path.parent_path();
    if (parent.parent_path() == root_ / kUploadsCategory) {
        fs::remove(parent, ec);
        if (ec) {
            spdlog::warn("Failed to remove temp directory {}: {}", parent.string(), ec.message());
        }
    }
}

} // namespace wopan::media
