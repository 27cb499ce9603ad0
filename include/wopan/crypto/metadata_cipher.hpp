#pragma once

#include "wopan/core/error.hpp"
#include "wopan/upload/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wopan::crypto {

/**
 * @brief Produces the encrypted `fileInfo` field for one chunk request
 *
 * Implementations are pure: the output depends only on the access token and
 * the envelope.
 */
class MetadataCipher {
public:
    virtual ~MetadataCipher() = default;

    /// Encrypt raw plaintext, returning base64 text
    virtual Expected<std::string> encrypt(std::string_view access_token,
                                          std::string_view plaintext) const = 0;

    /// Serialize @p envelope canonically and encrypt it
    Expected<std::string> seal(std::string_view access_token,
                               const upload::FileInfoEnvelope& envelope) const;
};

/**
 * @brief AES-128-CBC / PKCS#7 / base64 as required by the upload2C endpoint
 *
 * The IV is a fixed protocol constant and the key is the first 16 bytes of the
 * access token. Both are dictated by the remote service.
 */
class AesCbcMetadataCipher final : public MetadataCipher {
public:
    static constexpr std::size_t kKeySize = 16;
    static constexpr std::string_view kProtocolIv = "wNSOYIB1k1DjY5lA";

    Expected<std::string> encrypt(std::string_view access_token,
                                  std::string_view plaintext) const override;

    /// Inverse of encrypt(); used to verify envelopes
    Expected<std::string> decrypt(std::string_view access_token,
                                  std::string_view ciphertext_base64) const;

    /// First kKeySize bytes of the token; InvalidCredential when shorter
    static Expected<std::string> derive_key(std::string_view access_token);
};

std::string base64_encode(const std::vector<std::uint8_t>& data);
Expected<std::vector<std::uint8_t>> base64_decode(std::string_view text);

} // namespace wopan::crypto
