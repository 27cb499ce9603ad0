#include "wopan/upload/uploader.hpp"

#include "wopan/crypto/metadata_cipher.hpp"
#include "wopan/events/events.hpp"
#include "wopan/upload/envelope.hpp"
#include "wopan/upload/response.hpp"

namespace wopan::upload {

namespace fs = std::filesystem;

Uploader::Uploader(UploaderConfig config,
                   transport::TransportGateway& transport,
                   const crypto::MetadataCipher& cipher,
                   events::EventBus& bus)
    : config_(std::move(config)),
      transport_(transport),
      cipher_(cipher),
      bus_(bus),
      backoff_(std::make_shared<DefaultBackoff>()),
      sleeper_(cancellable_sleeper()) {}

void Uploader::set_identity_generator(SessionIdentityGenerator generator) {
    std::lock_guard lock(identity_mutex_);
    identity_generator_ = std::move(generator);
}

void Uploader::set_backoff(std::shared_ptr<const BackoffStrategy> backoff) {
    if (backoff) {
        backoff_ = std::move(backoff);
    }
}

void Uploader::set_sleeper(Sleeper sleeper) {
    sleeper_ = sleeper ? std::move(sleeper) : cancellable_sleeper();
}

Expected<UploadOutcome> Uploader::upload(const fs::path& source,
                                         const std::string& directory_id,
                                         const CancellationToken& token) {
    Session session;
    session.file_name = to_valid_utf8(source.filename().string());
    session.directory_id = directory_id.empty() ? kRootDirectoryId : directory_id;

    if (config_.access_token.empty()) {
        return fail(session, make_error(ErrorKind::MissingCredential, "Wopan access token is not configured"));
    }
    if (auto key = crypto::AesCbcMetadataCipher::derive_key(config_.access_token); key.is_error()) {
        return fail(session, key.error());
    }

    auto reader = ChunkReader::open(source, config_.chunk_size);
    if (reader.is_error()) {
        return fail(session, reader.error());
    }

    const auto started = std::chrono::steady_clock::now();
    session.identity = next_identity();
    session.file_size = reader.value().file_size();
    session.total_parts = reader.value().total_parts();

    bus_.emit(events::UploadStartedEvent{
        session.identity.unique_id,
        session.identity.batch_no,
        session.file_name,
        session.file_size,
        session.total_parts,
        session.directory_id,
    });

    auto outcome = run_session(session, reader.value(), token, started);
    if (outcome.is_error()) {
        return fail(session, outcome.error());
    }
    return outcome;
}

Expected<UploadOutcome> Uploader::run_session(const Session& session,
                                              ChunkReader& reader,
                                              const CancellationToken& token,
                                              std::chrono::steady_clock::time_point started) {
    // The envelope only carries whole-file values, so it is identical for every part
    const auto envelope = make_envelope(session.identity, session.directory_id,
                                        session.file_name, session.file_size);

    UploadOutcome outcome;
    outcome.identity = session.identity;
    outcome.file_name = session.file_name;
    outcome.file_size = session.file_size;
    outcome.total_parts = session.total_parts;

    while (reader.has_next()) {
        if (token.is_cancelled()) {
            return Err<UploadOutcome>(make_error(ErrorKind::Cancelled,
                "Upload cancelled before part " + std::to_string(outcome.parts_uploaded + 1)));
        }

        auto window = reader.next();
        if (window.is_error()) {
            return Err<UploadOutcome>(window.error());
        }

        auto sealed = cipher_.seal(config_.access_token, envelope);
        if (sealed.is_error()) {
            return Err<UploadOutcome>(sealed.error());
        }

        auto accepted = send_chunk(session, window.value(), sealed.value(), token);
        if (accepted.is_error()) {
            return Err<UploadOutcome>(accepted.error());
        }

        outcome.parts_uploaded = window.value().part_index;
        outcome.response = std::move(accepted.value());
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (outcome.response.finalized()) {
            outcome.status = CompletionStatus::Confirmed;
            bus_.emit(events::UploadConfirmedEvent{
                session.identity.unique_id,
                session.file_name,
                outcome.response.fid,
                session.file_size,
                outcome.parts_uploaded,
                session.total_parts,
                outcome.duration,
            });
            return Ok<UploadOutcome, Error>(std::move(outcome));
        }
    }

    outcome.status = CompletionStatus::CompletedWithoutConfirmation;
    bus_.emit(events::UploadUnconfirmedEvent{
        session.identity.unique_id,
        session.file_name,
        session.file_size,
        session.total_parts,
        outcome.response.raw.dump(),
    });
    return Ok<UploadOutcome, Error>(std::move(outcome));
}

Expected<RemoteResponse> Uploader::send_chunk(const Session& session,
                                              const ChunkWindow& window,
                                              const std::string& encrypted_envelope,
                                              const CancellationToken& token) {
    ChunkAttempt attempt;
    attempt.part_index = window.part_index;
    attempt.part_size = window.data.size();
    attempt.encrypted_envelope = encrypted_envelope;

    ChunkRetryMachine machine(window.part_index, config_.max_attempts, *backoff_, sleeper_);

    ChunkRetryMachine::Hooks hooks;
    hooks.on_failure = [&](int number, const Error& error) {
        bus_.emit(events::ChunkAttemptFailedEvent{
            session.identity.unique_id,
            window.part_index,
            session.total_parts,
            number,
            config_.max_attempts,
            error.kind,
            error.message,
        });
    };
    hooks.on_retry = [&](int next_attempt, std::chrono::milliseconds delay) {
        bus_.emit(events::ChunkRetryScheduledEvent{
            session.identity.unique_id,
            window.part_index,
            next_attempt,
            config_.max_attempts,
            delay,
        });
    };

    auto result = machine.run(
        [&](int number) -> Expected<RemoteResponse> {
            attempt.attempt_number = number;
            auto response = transport_.post(build_request(session, attempt, window.data));
            if (response.is_error()) {
                return Err<RemoteResponse>(response.error());
            }
            return interpret_response(response.value());
        },
        token, hooks);

    if (result.is_ok()) {
        bus_.emit(events::ChunkAcceptedEvent{
            session.identity.unique_id,
            window.part_index,
            session.total_parts,
            attempt.part_size,
            machine.attempts(),
        });
    }
    return result;
}

transport::ChunkRequest Uploader::build_request(const Session& session,
                                                const ChunkAttempt& attempt,
                                                const std::vector<std::uint8_t>& data) const {
    transport::ChunkRequest request;
    request.url = config_.endpoint;
    request.timeout = config_.timeout;
    request.headers = {
        {"Origin", config_.origin},
        {"Referer", config_.referer},
        {"User-Agent", config_.user_agent},
    };
    request.fields = {
        {"uniqueId", session.identity.unique_id},
        {"accessToken", config_.access_token},
        {"fileName", session.file_name},
        {"psToken", config_.ps_token},
        {"fileSize", std::to_string(session.file_size)},
        {"totalPart", std::to_string(session.total_parts)},
        {"channel", config_.channel},
        {"directoryId", session.directory_id},
        {"fileInfo", attempt.encrypted_envelope},
        {"partSize", std::to_string(attempt.part_size)},
        {"partIndex", std::to_string(attempt.part_index)},
    };
    request.file_name = session.file_name;
    request.file_data = &data;
    return request;
}

Expected<UploadOutcome> Uploader::fail(const Session& session, Error error) {
    bus_.emit(events::UploadFailedEvent{
        session.identity.unique_id,
        session.file_name,
        error.kind,
        error.message,
    });
    return Err<UploadOutcome>(std::move(error));
}

SessionIdentity Uploader::next_identity() {
    std::lock_guard lock(identity_mutex_);
    return identity_generator_.generate();
}

} // namespace wopan::upload
