#include "wopan/crypto/metadata_cipher.hpp"
#include "wopan/upload/envelope.hpp"

#include <gtest/gtest.h>

#include <string>

using wopan::ErrorKind;
using wopan::crypto::AesCbcMetadataCipher;
using wopan::crypto::base64_decode;
using wopan::crypto::base64_encode;

namespace {

const std::string kToken = "abcd1234ABCD5678";

const std::string kEnvelopeJson =
    R"({"spaceType":"0","directoryId":"0","batchNo":"20240101120000",)"
    R"("fileName":"clip.mp4","fileSize":20971520,"fileType":"2"})";

const std::string kEnvelopeCiphertext =
    "/bJCl1D8G/d8DcosgoYaWiRo+BToTyctMwYYPKK037iGZytZMAntuVvwGM1thU4I9KDb1t3b8rEq2IJ7"
    "Ja5f7ajLGPu4Z3Xptjb4gu1+F69o2Rhf6eGN8c7OdhQkbL4iTMGhNR5fBtBcKDB3tW+ICDm7Ud2+WoHJ/rkjIPBoLC0=";

} // namespace

TEST(MetadataCipherTest, MatchesKnownCiphertexts) {
    AesCbcMetadataCipher cipher;

    auto empty = cipher.encrypt(kToken, "");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value(), "IuoPzSzLLpLbUpIk3Av5+w==");

    auto hello = cipher.encrypt(kToken, "hello");
    ASSERT_TRUE(hello.is_ok());
    EXPECT_EQ(hello.value(), "nMAVUmoqvLNJ0WfmD1G/2g==");

    auto envelope = cipher.encrypt(kToken, kEnvelopeJson);
    ASSERT_TRUE(envelope.is_ok());
    EXPECT_EQ(envelope.value(), kEnvelopeCiphertext);
}

TEST(MetadataCipherTest, SealSerializesEnvelopeCanonically) {
    AesCbcMetadataCipher cipher;

    wopan::upload::SessionIdentity identity{"1704081600000_abcdef", "20240101120000"};
    const auto envelope = wopan::upload::make_envelope(identity, "0", "clip.mp4", 20971520);

    auto sealed = cipher.seal(kToken, envelope);
    ASSERT_TRUE(sealed.is_ok());
    EXPECT_EQ(sealed.value(), kEnvelopeCiphertext);
}

TEST(MetadataCipherTest, OnlyFirstSixteenTokenBytesFormTheKey) {
    AesCbcMetadataCipher cipher;

    auto key = AesCbcMetadataCipher::derive_key("abcd1234ABCD5678extra");
    ASSERT_TRUE(key.is_ok());
    EXPECT_EQ(key.value(), kToken);

    auto long_token = cipher.encrypt("abcd1234ABCD5678extra", "hello");
    ASSERT_TRUE(long_token.is_ok());
    EXPECT_EQ(long_token.value(), "nMAVUmoqvLNJ0WfmD1G/2g==");
}

TEST(MetadataCipherTest, ShortTokenIsInvalidCredential) {
    AesCbcMetadataCipher cipher;

    auto result = cipher.encrypt("short", "hello");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidCredential);

    EXPECT_TRUE(AesCbcMetadataCipher::derive_key("").is_error());
}

TEST(MetadataCipherTest, DecryptRecoversPlaintext) {
    AesCbcMetadataCipher cipher;

    auto plain = cipher.decrypt(kToken, kEnvelopeCiphertext);
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value(), kEnvelopeJson);
}

TEST(MetadataCipherTest, DecryptRejectsGarbage) {
    AesCbcMetadataCipher cipher;

    EXPECT_TRUE(cipher.decrypt(kToken, "not base64 !!").is_error());
    // Valid base64 but not a whole block
    EXPECT_TRUE(cipher.decrypt(kToken, "aGVsbG8=").is_error());
}

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64_encode({}), "");
    EXPECT_EQ(base64_encode({'f'}), "Zg==");
    EXPECT_EQ(base64_encode({'f', 'o'}), "Zm8=");
    EXPECT_EQ(base64_encode({'f', 'o', 'o'}), "Zm9v");

    auto decoded = base64_decode("Zm9vYmFy");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::string(decoded.value().begin(), decoded.value().end()), "foobar");
}
