#include "wopan/upload/uploader.hpp"

#include "wopan/crypto/metadata_cipher.hpp"
#include "wopan/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace wopan;
using namespace wopan::upload;

namespace {

const std::string kToken = "abcd1234ABCD5678-session-token";

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto dir = fs::temp_directory_path() / fs::path("wopan_uploader_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

void write_bytes(const fs::path& path, std::size_t size) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << std::string(size, 'x');
}

/**
 * Replays scripted replies in order and records every request it sees.
 * Once the script runs out, every further request is accepted without fid.
 */
class ScriptedTransport final : public transport::TransportGateway {
public:
    struct Captured {
        std::string url;
        transport::FormFields headers;
        transport::FormFields fields;
        std::string file_name;
        std::size_t file_bytes = 0;
    };

    void reply(int status, std::string body) {
        script_.push_back(Ok<transport::TransportResponse, Error>(transport::TransportResponse{status, std::move(body)}));
    }

    void fail(ErrorKind kind, std::string message) {
        script_.push_back(Err<transport::TransportResponse>(make_error(kind, std::move(message))));
    }

    Expected<transport::TransportResponse> post(const transport::ChunkRequest& request) override {
        std::lock_guard lock(mutex_);
        captured_.push_back(Captured{request.url, request.headers, request.fields, request.file_name,
                                     request.file_data ? request.file_data->size() : 0});
        if (script_.empty()) {
            return Ok<transport::TransportResponse, Error>(
                transport::TransportResponse{200, R"({"code":"0000","msg":"ok","data":{}})"});
        }
        auto next = script_.front();
        script_.pop_front();
        return next;
    }

    const std::vector<Captured>& captured() const { return captured_; }

private:
    std::mutex mutex_;
    std::deque<Expected<transport::TransportResponse>> script_;
    std::vector<Captured> captured_;
};

std::string ok_body() {
    return R"({"code":"0000","msg":"ok","data":{}})";
}

std::string fid_body(const std::string& fid) {
    return R"({"code":"0000","msg":"ok","data":{"fid":")" + fid + R"("}})";
}

} // namespace

class UploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();

        config_.access_token = kToken;
        config_.endpoint = "http://127.0.0.1:1/openapi/client/upload2C";
        config_.chunk_size = 10;

        bus_.subscribe<events::ChunkAcceptedEvent>([this](const events::ChunkAcceptedEvent& e) {
            accepted_parts_.push_back(e.part_index);
        });
        bus_.subscribe<events::ChunkRetryScheduledEvent>([this](const events::ChunkRetryScheduledEvent& e) {
            retry_delays_.push_back(e.delay);
        });
        bus_.subscribe<events::UploadFailedEvent>([this](const events::UploadFailedEvent& e) {
            failures_.push_back(e.kind);
        });
        bus_.subscribe<events::UploadUnconfirmedEvent>([this](const events::UploadUnconfirmedEvent&) {
            unconfirmed_++;
        });
        bus_.subscribe<events::UploadConfirmedEvent>([this](const events::UploadConfirmedEvent& e) {
            confirmed_fids_.push_back(e.fid);
        });
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    std::unique_ptr<Uploader> make_uploader() {
        auto uploader = std::make_unique<Uploader>(config_, transport_, cipher_, bus_);
        uploader->set_sleeper([this](std::chrono::milliseconds delay, const CancellationToken&) {
            slept_.push_back(delay);
            return true;
        });
        return uploader;
    }

    fs::path root_;
    UploaderConfig config_;
    ScriptedTransport transport_;
    crypto::AesCbcMetadataCipher cipher_;
    events::EventBus bus_;

    std::vector<std::uint32_t> accepted_parts_;
    std::vector<std::chrono::milliseconds> retry_delays_;
    std::vector<ErrorKind> failures_;
    std::vector<std::string> confirmed_fids_;
    std::vector<std::chrono::milliseconds> slept_;
    int unconfirmed_ = 0;
};

TEST_F(UploaderTest, SinglePartConfirmedByFid) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 7);
    transport_.reply(200, fid_body("fid-1"));

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const auto& outcome = result.value();
    EXPECT_TRUE(outcome.confirmed());
    EXPECT_EQ(outcome.response.fid, "fid-1");
    EXPECT_EQ(outcome.file_name, "clip.mp4");
    EXPECT_EQ(outcome.file_size, 7u);
    EXPECT_EQ(outcome.total_parts, 1u);
    EXPECT_EQ(outcome.parts_uploaded, 1u);
    EXPECT_EQ(confirmed_fids_, (std::vector<std::string>{"fid-1"}));
}

TEST_F(UploaderTest, RequestCarriesFieldsInProtocolOrder) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 25);

    auto uploader = make_uploader();
    auto result = uploader->upload(file, "dir-9");
    ASSERT_TRUE(result.is_ok());

    const auto& requests = transport_.captured();
    ASSERT_EQ(requests.size(), 3u);

    const auto& first = requests.front();
    EXPECT_EQ(first.url, config_.endpoint);
    EXPECT_EQ(first.file_name, "clip.mp4");

    std::vector<std::string> names;
    for (const auto& field : first.fields) {
        names.push_back(field.first);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"uniqueId", "accessToken", "fileName", "psToken", "fileSize",
                                               "totalPart", "channel", "directoryId", "fileInfo", "partSize",
                                               "partIndex"}));

    transport::ChunkRequest sent;
    sent.fields = first.fields;
    EXPECT_EQ(sent.field("accessToken"), kToken);
    EXPECT_EQ(sent.field("psToken"), "undefined");
    EXPECT_EQ(sent.field("channel"), "wocloud");
    EXPECT_EQ(sent.field("fileSize"), "25");
    EXPECT_EQ(sent.field("totalPart"), "3");
    EXPECT_EQ(sent.field("directoryId"), "dir-9");

    bool has_origin = false;
    for (const auto& header : first.headers) {
        if (header.first == "Origin") {
            has_origin = header.second == "https://pan.wo.cn";
        }
    }
    EXPECT_TRUE(has_origin);
}

TEST_F(UploaderTest, EveryPartSharesIdentityAndEnvelope) {
    const auto file = root_ / "report.pdf";
    write_bytes(file, 25);

    auto uploader = make_uploader();
    auto result = uploader->upload(file);
    ASSERT_TRUE(result.is_ok());

    const auto& requests = transport_.captured();
    ASSERT_EQ(requests.size(), 3u);

    std::vector<std::size_t> part_bytes;
    std::string unique_id;
    std::string envelope;
    for (std::size_t i = 0; i < requests.size(); ++i) {
        transport::ChunkRequest sent;
        sent.fields = requests[i].fields;
        EXPECT_EQ(sent.field("partIndex"), std::to_string(i + 1));
        EXPECT_EQ(sent.field("partSize"), std::to_string(requests[i].file_bytes));
        if (i == 0) {
            unique_id = sent.field("uniqueId");
            envelope = sent.field("fileInfo");
        } else {
            EXPECT_EQ(sent.field("uniqueId"), unique_id);
            EXPECT_EQ(sent.field("fileInfo"), envelope);
        }
        part_bytes.push_back(requests[i].file_bytes);
    }
    EXPECT_EQ(part_bytes, (std::vector<std::size_t>{10, 10, 5}));
    EXPECT_EQ(result.value().identity.unique_id, unique_id);

    auto plain = cipher_.decrypt(kToken, envelope);
    ASSERT_TRUE(plain.is_ok());
    EXPECT_NE(plain.value().find(R"("fileSize":25)"), std::string::npos);
    EXPECT_NE(plain.value().find(R"("fileType":"4")"), std::string::npos);
    EXPECT_NE(plain.value().find(R"("batchNo":")" + result.value().identity.batch_no + "\""), std::string::npos);
}

TEST_F(UploaderTest, StopsEarlyWhenFidArrives) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 35);
    transport_.reply(200, ok_body());
    transport_.reply(200, fid_body("early"));

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().confirmed());
    EXPECT_EQ(result.value().parts_uploaded, 2u);
    EXPECT_EQ(result.value().total_parts, 4u);
    EXPECT_EQ(transport_.captured().size(), 2u);
}

TEST_F(UploaderTest, AllPartsAcceptedWithoutFidIsUnconfirmed) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 20);

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().confirmed());
    EXPECT_EQ(result.value().status, CompletionStatus::CompletedWithoutConfirmation);
    EXPECT_EQ(result.value().parts_uploaded, 2u);
    EXPECT_EQ(unconfirmed_, 1);
    EXPECT_EQ(accepted_parts_, (std::vector<std::uint32_t>{1, 2}));
}

TEST_F(UploaderTest, RetriesTransientFailuresWithBackoff) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 5);
    transport_.fail(ErrorKind::TransientTransport, "Connect failed: refused");
    transport_.reply(502, "Bad Gateway");
    transport_.reply(200, fid_body("after-retries"));

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().response.fid, "after-retries");
    EXPECT_EQ(transport_.captured().size(), 3u);
    EXPECT_EQ(slept_, (std::vector<std::chrono::milliseconds>{std::chrono::seconds(1), std::chrono::seconds(2)}));
    EXPECT_EQ(retry_delays_, slept_);
}

TEST_F(UploaderTest, ExhaustedPartAbortsSession) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 30);
    transport_.reply(200, ok_body());
    transport_.reply(200, R"({"code":"5001","msg":"busy"})");
    transport_.reply(200, R"({"code":"5001","msg":"busy"})");
    transport_.reply(200, R"({"code":"5001","msg":"still busy"})");

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::FatalProtocol);
    EXPECT_EQ(result.error().message, "Part 2 failed after 3 attempts: Wopan API Error: still busy");
    // Part 3 is never sent
    EXPECT_EQ(transport_.captured().size(), 4u);
    EXPECT_EQ(slept_.size(), 2u);
    EXPECT_EQ(failures_, (std::vector<ErrorKind>{ErrorKind::FatalProtocol}));
}

TEST_F(UploaderTest, ThreeTransportFailuresAbortBeforeLaterParts) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 30);
    transport_.reply(200, ok_body());
    transport_.fail(ErrorKind::TransientTransport, "Connect failed: refused");
    transport_.fail(ErrorKind::TransientTransport, "TLS handshake failed");
    transport_.fail(ErrorKind::TransientTransport, "Request timed out");

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::FatalProtocol);
    EXPECT_EQ(result.error().message, "Part 2 failed after 3 attempts: Request timed out");

    ASSERT_EQ(transport_.captured().size(), 4u);
    // Part 3 is never sent
    std::vector<std::string> part_indexes;
    for (const auto& request : transport_.captured()) {
        transport::ChunkRequest sent;
        sent.fields = request.fields;
        part_indexes.push_back(sent.field("partIndex"));
    }
    EXPECT_EQ(part_indexes, (std::vector<std::string>{"1", "2", "2", "2"}));
    EXPECT_EQ(slept_, (std::vector<std::chrono::milliseconds>{std::chrono::seconds(1), std::chrono::seconds(2)}));
    EXPECT_EQ(accepted_parts_, (std::vector<std::uint32_t>{1}));
    EXPECT_EQ(failures_, (std::vector<ErrorKind>{ErrorKind::FatalProtocol}));
}

TEST_F(UploaderTest, MissingTokenTouchesNothing) {
    config_.access_token.clear();
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 5);

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::MissingCredential);
    EXPECT_TRUE(transport_.captured().empty());
}

TEST_F(UploaderTest, ShortTokenIsInvalidCredential) {
    config_.access_token = "short";
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 5);

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidCredential);
    EXPECT_TRUE(transport_.captured().empty());
}

TEST_F(UploaderTest, MissingFileIsNotFound) {
    auto uploader = make_uploader();
    auto result = uploader->upload(root_ / "nope.mp4");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
    EXPECT_TRUE(transport_.captured().empty());
    EXPECT_EQ(failures_, (std::vector<ErrorKind>{ErrorKind::NotFound}));
}

TEST_F(UploaderTest, CancelledTokenStopsBeforeNextPart) {
    const auto file = root_ / "clip.mp4";
    write_bytes(file, 30);

    CancellationToken token;
    bus_.subscribe<events::ChunkAcceptedEvent>([&token](const events::ChunkAcceptedEvent&) {
        token.cancel();
    });

    auto uploader = make_uploader();
    auto result = uploader->upload(file, "0", token);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(transport_.captured().size(), 1u);
}

TEST_F(UploaderTest, EmptyFileSendsOneEmptyPart) {
    const auto file = root_ / "empty.txt";
    write_bytes(file, 0);

    auto uploader = make_uploader();
    auto result = uploader->upload(file);

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(transport_.captured().size(), 1u);
    EXPECT_EQ(transport_.captured().front().file_bytes, 0u);

    transport::ChunkRequest sent;
    sent.fields = transport_.captured().front().fields;
    EXPECT_EQ(sent.field("partSize"), "0");
    EXPECT_EQ(sent.field("totalPart"), "1");
}
