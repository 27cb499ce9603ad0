#pragma once

#include "wopan/core/cancellation.hpp"
#include "wopan/core/error.hpp"
#include "wopan/crypto/metadata_cipher.hpp"
#include "wopan/events/event_bus.hpp"
#include "wopan/transport/gateway.hpp"
#include "wopan/upload/chunk_reader.hpp"
#include "wopan/upload/retry.hpp"
#include "wopan/upload/session_identity.hpp"
#include "wopan/upload/types.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace wopan::upload {

inline constexpr const char* kUploadEndpoint = "https://tjupload.pan.wo.cn/openapi/client/upload2C";

/**
 * @brief Protocol constants and credentials for one Uploader
 *
 * Everything except access_token has the value the upload2C endpoint expects;
 * tests shrink chunk_size and point endpoint at a fake.
 */
struct UploaderConfig {
    std::string access_token;
    std::string endpoint = kUploadEndpoint;
    std::size_t chunk_size = kDefaultChunkSize;
    int max_attempts = kMaxAttemptsPerChunk;
    std::string channel = "wocloud";
    std::string ps_token = "undefined";
    std::string origin = "https://pan.wo.cn";
    std::string referer = "https://pan.wo.cn/";
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
    std::chrono::seconds timeout{120};
};

/**
 * @brief Chunked upload client for the upload2C protocol
 *
 * One upload() call is one session: a single (uniqueId, batchNo) identity,
 * parts sent strictly in order, each through its own ChunkRetryMachine.
 * Progress is reported only through events on the bus.
 *
 * THREAD SAFETY:
 * - upload() may be called concurrently from several threads; sessions share
 *   only the transport, the cipher and the event bus
 * - The transport and cipher must therefore be safe for concurrent use
 */
class Uploader {
public:
    Uploader(UploaderConfig config,
             transport::TransportGateway& transport,
             const crypto::MetadataCipher& cipher,
             events::EventBus& bus);

    Uploader(const Uploader&) = delete;
    Uploader& operator=(const Uploader&) = delete;

    /**
     * @brief Upload @p source into remote directory @p directory_id
     *
     * ERRORS:
     * - MissingCredential: no access token, nothing touched
     * - InvalidCredential: token shorter than 16 bytes
     * - NotFound / Validation: source missing, not a regular file, unreadable
     * - FatalProtocol: a part exhausted its attempts; later parts are not sent
     * - Cancelled: @p token was cancelled between parts or during a backoff
     * - Internal: local read or crypto failure
     */
    Expected<UploadOutcome> upload(const std::filesystem::path& source,
                                   const std::string& directory_id = kRootDirectoryId,
                                   const CancellationToken& token = CancellationToken{});

    void set_identity_generator(SessionIdentityGenerator generator);
    void set_backoff(std::shared_ptr<const BackoffStrategy> backoff);
    void set_sleeper(Sleeper sleeper);

    const UploaderConfig& config() const { return config_; }

private:
    struct Session {
        SessionIdentity identity;
        std::string file_name;
        std::string directory_id;
        std::uint64_t file_size = 0;
        std::uint32_t total_parts = 0;
    };

    Expected<UploadOutcome> run_session(const Session& session,
                                        ChunkReader& reader,
                                        const CancellationToken& token,
                                        std::chrono::steady_clock::time_point started);

    Expected<RemoteResponse> send_chunk(const Session& session,
                                        const ChunkWindow& window,
                                        const std::string& encrypted_envelope,
                                        const CancellationToken& token);

    transport::ChunkRequest build_request(const Session& session,
                                          const ChunkAttempt& attempt,
                                          const std::vector<std::uint8_t>& data) const;

    Expected<UploadOutcome> fail(const Session& session, Error error);
    SessionIdentity next_identity();

    UploaderConfig config_;
    transport::TransportGateway& transport_;
    const crypto::MetadataCipher& cipher_;
    events::EventBus& bus_;

    std::mutex identity_mutex_;
    SessionIdentityGenerator identity_generator_;
    std::shared_ptr<const BackoffStrategy> backoff_;
    Sleeper sleeper_;
};

} // namespace wopan::upload
