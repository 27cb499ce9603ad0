#include "wopan/media/extractor.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <thread>

namespace wopan::media {

namespace bp = boost::process;
namespace fs = std::filesystem;

namespace {

constexpr const char* kYouTubeFormat =
    "bestvideo[height>=1080][ext=mp4]+bestaudio[ext=m4a]/best[height>=1080]/best";

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Last non-empty line of yt-dlp's stdout
std::string last_line(const std::string& out) {
    std::string line;
    std::size_t end = out.size();
    while (end > 0) {
        const auto start = out.rfind('\n', end - 1);
        const auto begin = start == std::string::npos ? 0 : start + 1;
        line = out.substr(begin, end - begin);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            return line;
        }
        if (start == std::string::npos) {
            break;
        }
        end = start;
    }
    return {};
}

std::string failure_text(const ProcessResult& result) {
    auto text = last_line(result.err);
    return text.empty() ? "yt-dlp exited with code " + std::to_string(result.exit_code) : text;
}

} // namespace

Expected<VideoType> parse_video_type(std::string_view name) {
    const auto lowered = to_lower(name);
    if (lowered == "youtube") {
        return Ok<VideoType, Error>(VideoType::YouTube);
    }
    if (lowered == "tiktok") {
        return Ok<VideoType, Error>(VideoType::TikTok);
    }
    if (lowered == "twitter") {
        return Ok<VideoType, Error>(VideoType::Twitter);
    }
    return Err<VideoType>(make_error(ErrorKind::Validation,
                                     "type must be one of: youtube, tiktok, twitter (got '" + std::string(name) + "')"));
}

const char* to_string(VideoType type) {
    switch (type) {
        case VideoType::YouTube: return "youtube";
        case VideoType::TikTok: return "tiktok";
        case VideoType::Twitter: return "twitter";
    }
    return "unknown";
}

// ────────────────────────────────────────────────────────────
// BoostProcessRunner
// ────────────────────────────────────────────────────────────

Expected<ProcessResult> BoostProcessRunner::run(const std::string& program,
                                                const std::vector<std::string>& args) {
    auto executable = bp::search_path(program);
    if (executable.empty()) {
        return Err<ProcessResult>(make_error(ErrorKind::Extraction, program + " not found in PATH"));
    }

    try {
        boost::asio::io_context ioc;
        std::future<std::string> out;
        std::future<std::string> err;

        bp::child child(executable, bp::args(args),
                        bp::std_in.close(),
                        bp::std_out > out,
                        bp::std_err > err,
                        ioc);
        ioc.run();
        child.wait();

        ProcessResult result;
        result.exit_code = child.exit_code();
        result.out = out.get();
        result.err = err.get();
        return Ok<ProcessResult, Error>(std::move(result));
    } catch (const bp::process_error& e) {
        return Err<ProcessResult>(make_error(ErrorKind::Extraction,
                                             "Failed to run " + program + ": " + e.what()));
    }
}

// ────────────────────────────────────────────────────────────
// YtDlpExtractor
// ────────────────────────────────────────────────────────────

YtDlpExtractor::YtDlpExtractor(const TempWorkspace& workspace, ProcessRunner& runner)
    : YtDlpExtractor(workspace, runner, Options{}) {}

YtDlpExtractor::YtDlpExtractor(const TempWorkspace& workspace, ProcessRunner& runner,
                               Options options, SleepFn sleep)
    : workspace_(workspace),
      runner_(runner),
      options_(std::move(options)),
      sleep_(sleep ? std::move(sleep) : SleepFn([](std::chrono::milliseconds d) {
          std::this_thread::sleep_for(d);
      })) {}

bool YtDlpExtractor::is_ssl_failure(std::string_view output) {
    return output.find("SSL") != std::string_view::npos ||
           output.find("UNEXPECTED_EOF") != std::string_view::npos;
}

std::vector<std::string> YtDlpExtractor::common_args() const {
    return {
        "--no-playlist",
        "--socket-timeout", std::to_string(options_.socket_timeout_seconds),
        "--no-check-certificates",
        "--user-agent", options_.user_agent,
    };
}

std::string YtDlpExtractor::fetch_title(const std::string& url) {
    auto args = common_args();
    args.insert(args.end(), {"--retries", "2", "--skip-download", "--print", "title", url});

    for (int attempt = 1; attempt <= options_.title_attempts; ++attempt) {
        auto result = runner_.run(options_.executable, args);
        if (result.is_error()) {
            spdlog::warn("Title lookup failed, using default: {}", result.error().message);
            return "video";
        }

        const auto& process = result.value();
        if (process.exit_code == 0) {
            auto title = last_line(process.out);
            spdlog::info("Video title: {}", title.empty() ? "video" : title);
            return title.empty() ? "video" : title;
        }

        if (is_ssl_failure(process.err) && attempt < options_.title_attempts) {
            spdlog::warn("SSL error during title lookup, retrying: {}", failure_text(process));
            sleep_(std::chrono::seconds(2));
            continue;
        }
        spdlog::warn("Title lookup failed, using default: {}", failure_text(process));
        return "video";
    }
    return "video";
}

std::vector<std::string> YtDlpExtractor::download_args(const std::string& url,
                                                       VideoType type,
                                                       const fs::path& output_template) const {
    auto args = common_args();
    if (type == VideoType::YouTube) {
        args.insert(args.end(), {"-f", kYouTubeFormat, "--merge-output-format", "mp4"});
    } else {
        args.insert(args.end(), {"-f", "best"});
    }
    args.insert(args.end(), {
        "--retries", "3",
        "--fragment-retries", "3",
        "--skip-unavailable-fragments",
        "-o", output_template.string(),
        "--print", "after_move:filepath",
        url,
    });
    return args;
}

Expected<ExtractedMedia> YtDlpExtractor::extract(const std::string& url, VideoType type) {
    if (url.empty()) {
        return Err<ExtractedMedia>(make_error(ErrorKind::Validation, "video_url must not be empty"));
    }

    auto dir = workspace_.directory_for(to_string(type));
    if (dir.is_error()) {
        return Err<ExtractedMedia>(dir.error());
    }

    const auto file_id = sanitize_filename(fetch_title(url)) + "_" + short_id();
    const auto output_template = dir.value() / (file_id + ".%(ext)s");
    const auto args = download_args(url, type, output_template);

    std::string last_error;
    for (int attempt = 1; attempt <= options_.download_attempts; ++attempt) {
        auto result = runner_.run(options_.executable, args);
        if (result.is_error()) {
            return Err<ExtractedMedia>(result.error());
        }

        const auto& process = result.value();
        if (process.exit_code == 0) {
            const fs::path file_path = last_line(process.out);
            std::error_code ec;
            const auto size = file_path.empty() ? 0 : fs::file_size(file_path, ec);
            if (file_path.empty() || ec) {
                return Err<ExtractedMedia>(make_error(ErrorKind::Extraction,
                                                      "Downloaded file not found: " + file_path.string()));
            }

            ExtractedMedia media;
            media.file_path = file_path;
            media.extension = file_path.extension().string();
            if (!media.extension.empty() && media.extension.front() == '.') {
                media.extension.erase(0, 1);
            }
            media.file_size = size;
            return Ok<ExtractedMedia, Error>(std::move(media));
        }

        last_error = failure_text(process);
        if (is_ssl_failure(process.err) && attempt < options_.download_attempts) {
            spdlog::warn("SSL error downloading {} video, retrying in {}s: {}",
                         to_string(type), attempt, last_error);
            sleep_(std::chrono::seconds(attempt));
            continue;
        }
        break;
    }

    return Err<ExtractedMedia>(make_error(ErrorKind::Extraction,
                                          std::string("Failed to download ") + to_string(type) +
                                          " video: " + last_error));
}

} // namespace wopan::media
