#pragma once

#include "wopan/core/error.hpp"
#include "wopan/media/filename.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace wopan::media {

enum class VideoType {
    YouTube,
    TikTok,
    Twitter
};

/// Case-insensitive; anything but youtube/tiktok/twitter is a Validation error
Expected<VideoType> parse_video_type(std::string_view name);
const char* to_string(VideoType type);

struct ExtractedMedia {
    std::filesystem::path file_path;
    std::string extension;          ///< Without the dot, e.g. "mp4"
    std::uint64_t file_size = 0;
};

/**
 * @brief Fetches a remote video into the local temp workspace
 */
class VideoExtractor {
public:
    virtual ~VideoExtractor() = default;

    virtual Expected<ExtractedMedia> extract(const std::string& url, VideoType type) = 0;
};

// ════════════════════════════════════════════════════════
// Process execution
// ════════════════════════════════════════════════════════

struct ProcessResult {
    int exit_code = 0;
    std::string out;
    std::string err;
};

/**
 * @brief Runs an external program to completion and captures its output
 *
 * A non-zero exit code is a normal result; only failing to launch the
 * program is an error.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual Expected<ProcessResult> run(const std::string& program,
                                        const std::vector<std::string>& args) = 0;
};

/// ProcessRunner over Boost.Process, resolving @p program through PATH
class BoostProcessRunner final : public ProcessRunner {
public:
    Expected<ProcessResult> run(const std::string& program,
                                const std::vector<std::string>& args) override;
};

// ════════════════════════════════════════════════════════
// yt-dlp
// ════════════════════════════════════════════════════════

/**
 * @brief VideoExtractor that shells out to yt-dlp
 *
 * FLOW:
 * 1. Look up the title (2 attempts, default "video")
 * 2. Name the output <sanitized title>_<8 hex> under <workspace>/<type>
 * 3. Download with the type's format selection (3 attempts; only SSL and
 *    UNEXPECTED_EOF failures are retried, after 1 s and then 2 s)
 */
class YtDlpExtractor final : public VideoExtractor {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    struct Options {
        std::string executable = "yt-dlp";
        int download_attempts = 3;
        int title_attempts = 2;
        int socket_timeout_seconds = 60;
        std::string user_agent =
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
    };

    YtDlpExtractor(const TempWorkspace& workspace, ProcessRunner& runner);
    YtDlpExtractor(const TempWorkspace& workspace, ProcessRunner& runner, Options options, SleepFn sleep = {});

    Expected<ExtractedMedia> extract(const std::string& url, VideoType type) override;

    std::string fetch_title(const std::string& url);
    std::vector<std::string> download_args(const std::string& url,
                                           VideoType type,
                                           const std::filesystem::path& output_template) const;

    static bool is_ssl_failure(std::string_view output);

private:
    std::vector<std::string> common_args() const;

    const TempWorkspace& workspace_;
    ProcessRunner& runner_;
    Options options_;
    SleepFn sleep_;
};

} // namespace wopan::media
