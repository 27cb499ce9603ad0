#include "wopan/media/extractor.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace wopan;
using namespace wopan::media;

namespace {

fs::path unique_root() {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    return fs::temp_directory_path() / fs::path("wopan_extractor_test_" + std::to_string(id));
}

/// Answers title lookups and downloads from separate scripts
class FakeRunner final : public ProcessRunner {
public:
    std::deque<ProcessResult> titles;
    std::deque<ProcessResult> downloads;
    std::vector<std::vector<std::string>> calls;
    std::string created_extension = "mp4";

    Expected<ProcessResult> run(const std::string& program, const std::vector<std::string>& args) override {
        calls.push_back(args);
        EXPECT_EQ(program, "yt-dlp");

        const bool is_title = std::find(args.begin(), args.end(), "--skip-download") != args.end();
        auto& script = is_title ? titles : downloads;
        if (script.empty()) {
            return Err<ProcessResult>(make_error(ErrorKind::Extraction, "unexpected call"));
        }
        auto result = script.front();
        script.pop_front();

        if (!is_title && result.exit_code == 0 && result.out.empty()) {
            result.out = materialize(args);
        }
        return Ok<ProcessResult, Error>(result);
    }

private:
    // Create the file yt-dlp would have written and print its path
    std::string materialize(const std::vector<std::string>& args) {
        const auto it = std::find(args.begin(), args.end(), "-o");
        std::string path = *(it + 1);
        path.replace(path.find("%(ext)s"), 7, created_extension);
        std::ofstream(path, std::ios::binary) << "0123456789";
        return "[download] 100%\n" + path + "\n";
    }
};

ProcessResult success(std::string out = {}) {
    return ProcessResult{0, std::move(out), {}};
}

ProcessResult failure(std::string err) {
    return ProcessResult{1, {}, std::move(err)};
}

} // namespace

class YtDlpExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = unique_root();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    YtDlpExtractor make_extractor(TempWorkspace& workspace) {
        return YtDlpExtractor(workspace, runner_, YtDlpExtractor::Options{},
                              [this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    fs::path root_;
    FakeRunner runner_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST(VideoTypeTest, ParsesKnownTypesCaseInsensitively) {
    auto youtube = parse_video_type("YouTube");
    ASSERT_TRUE(youtube.is_ok());
    EXPECT_EQ(youtube.value(), VideoType::YouTube);
    EXPECT_EQ(parse_video_type("tiktok").value(), VideoType::TikTok);
    EXPECT_EQ(parse_video_type("TWITTER").value(), VideoType::Twitter);

    auto vimeo = parse_video_type("vimeo");
    ASSERT_TRUE(vimeo.is_error());
    EXPECT_EQ(vimeo.error().kind, ErrorKind::Validation);
}

TEST_F(YtDlpExtractorTest, DownloadsIntoTypeDirectoryWithSanitizedTitle) {
    TempWorkspace workspace(root_);
    runner_.titles.push_back(success("My Great: Video\n"));
    runner_.downloads.push_back(success());
    auto extractor = make_extractor(workspace);

    auto result = extractor.extract("https://youtu.be/abc", VideoType::YouTube);

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const auto& media = result.value();
    EXPECT_EQ(media.extension, "mp4");
    EXPECT_EQ(media.file_size, 10u);
    EXPECT_EQ(media.file_path.parent_path(), root_ / "youtube");

    const auto stem = media.file_path.stem().string();
    ASSERT_EQ(stem.size(), std::string("My_Great_Video_").size() + 8);
    EXPECT_EQ(stem.rfind("My_Great_Video_", 0), 0u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(YtDlpExtractorTest, FormatSelectionDependsOnType) {
    TempWorkspace workspace(root_);
    auto extractor = make_extractor(workspace);

    const auto youtube = extractor.download_args("u", VideoType::YouTube, "out.%(ext)s");
    const auto youtube_format = std::find(youtube.begin(), youtube.end(), "-f");
    ASSERT_NE(youtube_format, youtube.end());
    EXPECT_EQ(*(youtube_format + 1),
              "bestvideo[height>=1080][ext=mp4]+bestaudio[ext=m4a]/best[height>=1080]/best");
    EXPECT_NE(std::find(youtube.begin(), youtube.end(), "--merge-output-format"), youtube.end());
    EXPECT_EQ(youtube.back(), "u");

    const auto tiktok = extractor.download_args("u", VideoType::TikTok, "out.%(ext)s");
    const auto tiktok_format = std::find(tiktok.begin(), tiktok.end(), "-f");
    ASSERT_NE(tiktok_format, tiktok.end());
    EXPECT_EQ(*(tiktok_format + 1), "best");
    EXPECT_EQ(std::find(tiktok.begin(), tiktok.end(), "--merge-output-format"), tiktok.end());
    EXPECT_NE(std::find(tiktok.begin(), tiktok.end(), "--no-playlist"), tiktok.end());
}

TEST_F(YtDlpExtractorTest, TitleFailureFallsBackToVideo) {
    TempWorkspace workspace(root_);
    runner_.titles.push_back(failure("ERROR: SSL: UNEXPECTED_EOF_WHILE_READING"));
    runner_.titles.push_back(failure("ERROR: private video"));
    runner_.downloads.push_back(success());
    auto extractor = make_extractor(workspace);

    auto result = extractor.extract("https://www.tiktok.com/@a/video/1", VideoType::TikTok);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().file_path.stem().string().rfind("video_", 0), 0u);
    EXPECT_EQ(sleeps_, (std::vector<std::chrono::milliseconds>{std::chrono::seconds(2)}));
}

TEST_F(YtDlpExtractorTest, SslFailuresAreRetriedWithGrowingDelay) {
    TempWorkspace workspace(root_);
    runner_.titles.push_back(success("clip"));
    runner_.downloads.push_back(failure("ERROR: [SSL] record layer failure"));
    runner_.downloads.push_back(failure("ERROR: UNEXPECTED_EOF while reading"));
    runner_.downloads.push_back(success());
    auto extractor = make_extractor(workspace);

    auto result = extractor.extract("https://x.com/a/status/1", VideoType::Twitter);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(sleeps_, (std::vector<std::chrono::milliseconds>{std::chrono::seconds(1), std::chrono::seconds(2)}));
}

TEST_F(YtDlpExtractorTest, OtherFailuresAreNotRetried) {
    TempWorkspace workspace(root_);
    runner_.titles.push_back(success("clip"));
    runner_.downloads.push_back(failure("WARNING: something\nERROR: Video unavailable\n"));
    auto extractor = make_extractor(workspace);

    auto result = extractor.extract("https://youtu.be/gone", VideoType::YouTube);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Extraction);
    EXPECT_EQ(result.error().message, "Failed to download youtube video: ERROR: Video unavailable");
    EXPECT_TRUE(runner_.downloads.empty());
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(YtDlpExtractorTest, EmptyUrlIsRejected) {
    TempWorkspace workspace(root_);
    auto extractor = make_extractor(workspace);

    auto result = extractor.extract("", VideoType::YouTube);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST(SslFailureTest, RecognizesSslMarkers) {
    EXPECT_TRUE(YtDlpExtractor::is_ssl_failure("ssl.SSLError: [SSL: WRONG_VERSION_NUMBER]"));
    EXPECT_TRUE(YtDlpExtractor::is_ssl_failure("EOF occurred: UNEXPECTED_EOF_WHILE_READING"));
    EXPECT_FALSE(YtDlpExtractor::is_ssl_failure("HTTP Error 404: Not Found"));
}
