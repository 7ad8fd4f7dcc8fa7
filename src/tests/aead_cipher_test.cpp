#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "peerdrop/crypto/aead_cipher.hpp"
#include "peerdrop/crypto/base64.hpp"
#include "test_utils.hpp"

namespace peerdrop {
namespace crypto {
namespace test {

class AeadCipherTest : public ::testing::Test {
protected:
    static SymmetricKey make_key(uint8_t fill) {
        SymmetricKey::Bytes bytes;
        bytes.fill(fill);
        return SymmetricKey(bytes);
    }

    AeadCipher cipher_{make_key(0x42)};
};

TEST_F(AeadCipherTest, SealsAndOpens) {
    auto plaintext = peerdrop::test::random_bytes(16384);
    auto sealed = cipher_.encrypt(plaintext);

    EXPECT_EQ(sealed.ciphertext.size(), plaintext.size() + AeadCipher::TAG_SIZE);
    EXPECT_EQ(cipher_.decrypt(sealed.iv, sealed.ciphertext), plaintext);
}

TEST_F(AeadCipherTest, EmptyPlaintextCarriesOnlyTag) {
    auto sealed = cipher_.encrypt(std::vector<uint8_t>());
    EXPECT_EQ(sealed.ciphertext.size(), AeadCipher::TAG_SIZE);
    EXPECT_TRUE(cipher_.decrypt(sealed.iv, sealed.ciphertext).empty());
}

TEST_F(AeadCipherTest, FreshIvPerMessage) {
    const std::vector<uint8_t> plaintext(64, 0x11);
    auto first = cipher_.encrypt(plaintext);
    auto second = cipher_.encrypt(plaintext);
    EXPECT_NE(first.iv, second.iv);
    EXPECT_NE(first.ciphertext, second.ciphertext);
}

TEST_F(AeadCipherTest, TamperedCiphertextFailsAuthentication) {
    auto sealed = cipher_.encrypt(std::vector<uint8_t>(100, 0x33));
    sealed.ciphertext[10] ^= 0x01;
    EXPECT_THROW(cipher_.decrypt(sealed.iv, sealed.ciphertext), AuthenticationError);
}

TEST_F(AeadCipherTest, TamperedIvFailsAuthentication) {
    auto sealed = cipher_.encrypt(std::vector<uint8_t>(100, 0x33));
    sealed.iv[0] ^= 0x80;
    EXPECT_THROW(cipher_.decrypt(sealed.iv, sealed.ciphertext), AuthenticationError);
}

TEST_F(AeadCipherTest, WrongKeyFailsAuthentication) {
    auto sealed = cipher_.encrypt(std::vector<uint8_t>(100, 0x33));
    AeadCipher other(make_key(0x43));
    EXPECT_THROW(other.decrypt(sealed.iv, sealed.ciphertext), AuthenticationError);
}

TEST_F(AeadCipherTest, TruncatedInputFailsAuthentication) {
    EXPECT_THROW(cipher_.decrypt(AeadCipher::generate_iv(), std::vector<uint8_t>(AeadCipher::TAG_SIZE - 1)),
                 AuthenticationError);
}

TEST_F(AeadCipherTest, StringFormIsIvThenCiphertext) {
    const std::string encoded = cipher_.encrypt_string("report.pdf");
    auto raw = base64_decode(encoded);
    EXPECT_EQ(raw.size(), AeadCipher::IV_SIZE + std::string("report.pdf").size() + AeadCipher::TAG_SIZE);
    EXPECT_EQ(cipher_.decrypt_string(encoded), "report.pdf");
}

TEST_F(AeadCipherTest, StringDecryptRejectsGarbage) {
    EXPECT_THROW(cipher_.decrypt_string("***"), AuthenticationError);
    EXPECT_THROW(cipher_.decrypt_string(base64_encode(std::string("short"))), AuthenticationError);

    auto raw = base64_decode(cipher_.encrypt_string("name"));
    raw.back() ^= 0xff;
    EXPECT_THROW(cipher_.decrypt_string(base64_encode(raw)), AuthenticationError);
}

} // namespace test
} // namespace crypto
} // namespace peerdrop
