#include "wopan/crypto/metadata_cipher.hpp"

#include "wopan/upload/envelope.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>

namespace wopan::crypto {
namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

constexpr int kBlockSize = 16;

std::string openssl_error(const char* what) {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::string(what) + ": " + buffer;
}

const unsigned char* as_bytes(std::string_view text) {
    return reinterpret_cast<const unsigned char*>(text.data());
}

} // namespace

Expected<std::string> MetadataCipher::seal(std::string_view access_token,
                                           const upload::FileInfoEnvelope& envelope) const {
    return encrypt(access_token, upload::to_canonical_json(envelope));
}

Expected<std::string> AesCbcMetadataCipher::derive_key(std::string_view access_token) {
    if (access_token.size() < kKeySize) {
        return Err<std::string>(make_error(ErrorKind::InvalidCredential,
            "Access token must be at least " + std::to_string(kKeySize) + " bytes, got " +
            std::to_string(access_token.size())));
    }
    return Ok<std::string, Error>(std::string(access_token.substr(0, kKeySize)));
}

Expected<std::string> AesCbcMetadataCipher::encrypt(std::string_view access_token,
                                                    std::string_view plaintext) const {
    auto key = derive_key(access_token);
    if (key.is_error()) {
        return key;
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return Err<std::string>(make_error(ErrorKind::Internal, "Failed to create EVP_CIPHER_CTX"));
    }

    // PKCS#7 padding is EVP's default for CBC
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           as_bytes(key.value()), as_bytes(kProtocolIv)) != 1) {
        return Err<std::string>(make_error(ErrorKind::Internal, openssl_error("EVP_EncryptInit_ex failed")));
    }

    std::vector<std::uint8_t> out(plaintext.size() + kBlockSize);
    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, as_bytes(plaintext),
                          static_cast<int>(plaintext.size())) != 1) {
        return Err<std::string>(make_error(ErrorKind::Internal, openssl_error("EVP_EncryptUpdate failed")));
    }
    int total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        return Err<std::string>(make_error(ErrorKind::Internal, openssl_error("EVP_EncryptFinal_ex failed")));
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));

    return Ok<std::string, Error>(base64_encode(out));
}

Expected<std::string> AesCbcMetadataCipher::decrypt(std::string_view access_token,
                                                    std::string_view ciphertext_base64) const {
    auto key = derive_key(access_token);
    if (key.is_error()) {
        return key;
    }

    auto ciphertext = base64_decode(ciphertext_base64);
    if (ciphertext.is_error()) {
        return Err<std::string>(ciphertext.error());
    }
    const auto& in = ciphertext.value();
    if (in.empty() || in.size() % kBlockSize != 0) {
        return Err<std::string>(make_error(ErrorKind::Validation, "Ciphertext is not a whole number of blocks"));
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return Err<std::string>(make_error(ErrorKind::Internal, "Failed to create EVP_CIPHER_CTX"));
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           as_bytes(key.value()), as_bytes(kProtocolIv)) != 1) {
        return Err<std::string>(make_error(ErrorKind::Internal, openssl_error("EVP_DecryptInit_ex failed")));
    }

    std::string out(in.size() + kBlockSize, '\0');
    auto* out_bytes = reinterpret_cast<unsigned char*>(out.data());
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), out_bytes, &len, in.data(), static_cast<int>(in.size())) != 1) {
        return Err<std::string>(make_error(ErrorKind::Internal, openssl_error("EVP_DecryptUpdate failed")));
    }
    int total = len;

    if (EVP_DecryptFinal_ex(ctx.get(), out_bytes + total, &len) != 1) {
        return Err<std::string>(make_error(ErrorKind::Validation, openssl_error("Bad padding or wrong key")));
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));

    return Ok<std::string, Error>(std::move(out));
}

std::string base64_encode(const std::vector<std::uint8_t>& data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

Expected<std::vector<std::uint8_t>> base64_decode(std::string_view text) {
    if (text.empty()) {
        return Ok<std::vector<std::uint8_t>, Error>({});
    }
    if (text.size() % 4 != 0) {
        return Err<std::vector<std::uint8_t>>(make_error(ErrorKind::Validation, "Invalid base64 length"));
    }

    std::vector<std::uint8_t> out(3 * text.size() / 4);
    const int written = EVP_DecodeBlock(out.data(), as_bytes(text), static_cast<int>(text.size()));
    if (written < 0) {
        return Err<std::vector<std::uint8_t>>(make_error(ErrorKind::Validation, "Invalid base64 text"));
    }

    // EVP_DecodeBlock keeps the zero bytes that stand in for '=' padding
    std::size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return Ok<std::vector<std::uint8_t>, Error>(std::move(out));
}

} // namespace wopan::crypto
