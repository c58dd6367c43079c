/**
 * @file test_pbe.cpp
 * @brief Unit tests for the password-based encryption engine
 */

#include <gtest/gtest.h>
#include <keystore/pkcs12/pbe.h>
#include <keystore/pkcs12/errors.h>
#include <keystore/pkcs12/oids.h>
#include <keystore/common/encoding.h>

#include <memory>
#include <openssl/evp.h>

using namespace keystore::pkcs12;
using keystore::common::Encoding;

namespace {

const CipherSuite ALL_SUITES[] = {
    CipherSuite::PBE_SHA1_RC4_128,
    CipherSuite::PBE_SHA1_RC4_40,
    CipherSuite::PBE_SHA1_3DES_3KEY,
    CipherSuite::PBE_SHA1_3DES_2KEY,
    CipherSuite::PBE_SHA1_RC2_128,
    CipherSuite::PBE_SHA1_RC2_40,
    CipherSuite::PBES2_AES_128_CBC,
    CipherSuite::PBES2_AES_192_CBC,
    CipherSuite::PBES2_AES_256_CBC,
    CipherSuite::PBES2_DES_EDE3_CBC,
};

Bytes textBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

/**
 * @brief Encrypt one raw block under the 3DES PBE parameters of @p algorithm
 *
 * No padding is added, so the caller controls what decryption sees.
 */
Bytes encryptRawDes3(const AlgorithmIdentifier& algorithm, const Password& password,
                     const Bytes& block) {
    PbeParameters params = decodePbeParameters(algorithm.parameters, DEFAULT_MAX_ITERATIONS);
    KeyMaterial key = deriveKey(password.bmp(), params.salt, params.iterations,
                                KeyPurpose::ENCRYPTION_KEY, 24, EVP_sha1());
    KeyMaterial iv = deriveKey(password.bmp(), params.salt, params.iterations,
                               KeyPurpose::IV, 8, EVP_sha1());

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>
        ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    Bytes out(block.size() + 8);
    int len = 0;
    int finalLen = 0;
    EVP_EncryptInit_ex(ctx.get(), EVP_des_ede3_cbc(), nullptr, key.data(), iv.data());
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);
    EVP_EncryptUpdate(ctx.get(), out.data(), &len, block.data(), static_cast<int>(block.size()));
    EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &finalLen);
    out.resize(static_cast<size_t>(len + finalLen));
    return out;
}

} // anonymous namespace

class PbeTest : public ::testing::Test {
protected:
    Password password_ = Password::fromUtf8("pbe-test-password");
    Bytes plaintext_ = textBytes("The quick brown fox jumps over the lazy dog");

    bool available(CipherSuite suite) {
        return !cipherSuiteInfo(suite).legacyProvider || loadLegacyProvider();
    }
};

// ============================================================================
// Round trip
// ============================================================================

TEST_F(PbeTest, RoundTrip_AllSuites) {
    for (CipherSuite suite : ALL_SUITES) {
        SCOPED_TRACE(cipherSuiteToString(suite));
        if (!available(suite)) {
            continue;
        }
        auto enc = pbe::encrypt(suite, password_, plaintext_, 64);
        EXPECT_NE(enc.ciphertext, plaintext_);
        EXPECT_EQ(pbe::decrypt(enc.algorithm, password_, enc.ciphertext, DEFAULT_MAX_ITERATIONS),
                  plaintext_);
    }
}

TEST_F(PbeTest, RoundTrip_BlockAlignedPlaintext) {
    Bytes aligned(32, 0x5A);
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, aligned, 16);
    // A full padding block is appended
    EXPECT_EQ(enc.ciphertext.size(), 40u);
    EXPECT_EQ(pbe::decrypt(enc.algorithm, password_, enc.ciphertext, DEFAULT_MAX_ITERATIONS),
              aligned);
}

TEST_F(PbeTest, RoundTrip_EmptyPlaintext) {
    auto enc = pbe::encrypt(CipherSuite::PBES2_AES_256_CBC, password_, Bytes(), 16);
    EXPECT_EQ(enc.ciphertext.size(), 16u);
    EXPECT_TRUE(pbe::decrypt(enc.algorithm, password_, enc.ciphertext,
                             DEFAULT_MAX_ITERATIONS).empty());
}

TEST_F(PbeTest, RoundTrip_AbsentAndEmptyPasswords) {
    for (const auto& pw : {Password::absent(), Password::fromUtf8("")}) {
        auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, pw, plaintext_, 16);
        EXPECT_EQ(pbe::decrypt(enc.algorithm, pw, enc.ciphertext, DEFAULT_MAX_ITERATIONS),
                  plaintext_);
    }
}

TEST_F(PbeTest, StreamCipher_NoPadding) {
    if (!loadLegacyProvider()) {
        GTEST_SKIP() << "legacy provider not available";
    }
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_RC4_128, password_, plaintext_, 16);
    EXPECT_EQ(enc.ciphertext.size(), plaintext_.size());
}

TEST_F(PbeTest, FreshSaltPerCall) {
    auto a = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    auto b = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    EXPECT_NE(a.algorithm.parameters, b.algorithm.parameters);
    EXPECT_NE(a.ciphertext, b.ciphertext);
}

// ============================================================================
// Algorithm identifiers
// ============================================================================

TEST_F(PbeTest, LegacyAlgorithm_Parameters) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_2KEY, password_, plaintext_, 1234, 12);
    EXPECT_EQ(enc.algorithm.oid, oids::PBE_SHA1_3DES_2KEY);
    PbeParameters params = decodePbeParameters(enc.algorithm.parameters, DEFAULT_MAX_ITERATIONS);
    EXPECT_EQ(params.salt.size(), 12u);
    EXPECT_EQ(params.iterations, 1234);
}

TEST_F(PbeTest, Pbes2Algorithm_Parameters) {
    auto enc = pbe::encrypt(CipherSuite::PBES2_AES_256_CBC, password_, plaintext_, 2048);
    EXPECT_EQ(enc.algorithm.oid, oids::PBES2);
    Pbes2Parameters params = decodePbes2Parameters(enc.algorithm.parameters,
                                                   DEFAULT_MAX_ITERATIONS);
    EXPECT_EQ(params.cipherOid, oids::AES256_CBC);
    EXPECT_EQ(params.prfOid, oids::HMAC_SHA256);
    EXPECT_EQ(params.iterations, 2048);
    EXPECT_EQ(params.iv.size(), 16u);
    EXPECT_EQ(params.salt.size(), pbe::DEFAULT_SALT_LENGTH);
}

TEST_F(PbeTest, SuiteNames) {
    EXPECT_EQ(cipherSuiteToString(CipherSuite::PBE_SHA1_3DES_3KEY), "pbeWithSHAAnd3-KeyTripleDES-CBC");
    EXPECT_EQ(cipherSuiteToString(CipherSuite::PBE_SHA1_RC2_40), "pbeWithSHAAnd40BitRC2-CBC");
    EXPECT_STREQ(cipherSuiteInfo(CipherSuite::PBE_SHA1_RC4_128).oid, "1.2.840.113549.1.12.1.1");
    EXPECT_STREQ(cipherSuiteInfo(CipherSuite::PBE_SHA1_RC2_40).oid, "1.2.840.113549.1.12.1.6");
}

// ============================================================================
// Decryption failures
// ============================================================================

TEST_F(PbeTest, WrongPassword_NeverYieldsPlaintext) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    Password wrong = Password::fromUtf8("not-the-password");
    try {
        Bytes out = pbe::decrypt(enc.algorithm, wrong, enc.ciphertext, DEFAULT_MAX_ITERATIONS);
        EXPECT_NE(out, plaintext_);
    } catch (const DecryptionException&) {
        SUCCEED();
    }
}

TEST_F(PbeTest, Padding_ZeroByteRejected) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    Bytes block = {1, 2, 3, 4, 5, 6, 7, 0};
    Bytes ciphertext = encryptRawDes3(enc.algorithm, password_, block);
    EXPECT_THROW(pbe::decrypt(enc.algorithm, password_, ciphertext, DEFAULT_MAX_ITERATIONS),
                 DecryptionException);
}

TEST_F(PbeTest, Padding_LongerThanBlockRejected) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    Bytes block = {9, 9, 9, 9, 9, 9, 9, 9};
    Bytes ciphertext = encryptRawDes3(enc.algorithm, password_, block);
    EXPECT_THROW(pbe::decrypt(enc.algorithm, password_, ciphertext, DEFAULT_MAX_ITERATIONS),
                 DecryptionException);
}

TEST_F(PbeTest, Padding_InconsistentBytesRejected) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    Bytes block = {1, 2, 3, 4, 5, 3, 2, 3};
    Bytes ciphertext = encryptRawDes3(enc.algorithm, password_, block);
    EXPECT_THROW(pbe::decrypt(enc.algorithm, password_, ciphertext, DEFAULT_MAX_ITERATIONS),
                 DecryptionException);
}

TEST_F(PbeTest, Padding_FullBlockAccepted) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    Bytes block = {8, 8, 8, 8, 8, 8, 8, 8};
    Bytes ciphertext = encryptRawDes3(enc.algorithm, password_, block);
    EXPECT_TRUE(pbe::decrypt(enc.algorithm, password_, ciphertext,
                             DEFAULT_MAX_ITERATIONS).empty());
}

TEST_F(PbeTest, CiphertextLength_NotBlockMultiple) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16);
    Bytes truncated(enc.ciphertext.begin(), enc.ciphertext.end() - 3);
    EXPECT_THROW(pbe::decrypt(enc.algorithm, password_, truncated, DEFAULT_MAX_ITERATIONS),
                 DecryptionException);
}

TEST_F(PbeTest, CiphertextLength_Empty) {
    auto enc = pbe::encrypt(CipherSuite::PBES2_AES_128_CBC, password_, plaintext_, 16);
    EXPECT_THROW(pbe::decrypt(enc.algorithm, password_, Bytes(), DEFAULT_MAX_ITERATIONS),
                 DecryptionException);
}

// ============================================================================
// Parameter checks
// ============================================================================

TEST_F(PbeTest, UnknownAlgorithm_Unsupported) {
    AlgorithmIdentifier alg{"1.2.3.4.5", std::nullopt};
    EXPECT_THROW(pbe::decrypt(alg, password_, Bytes(16, 0), DEFAULT_MAX_ITERATIONS),
                 UnsupportedException);
}

TEST_F(PbeTest, IterationsAboveBound_Structural) {
    auto enc = pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 5000);
    EXPECT_THROW(pbe::decrypt(enc.algorithm, password_, enc.ciphertext, 4999),
                 StructuralException);
}

TEST_F(PbeTest, MissingParameters_Structural) {
    AlgorithmIdentifier alg{oids::PBE_SHA1_3DES_3KEY, std::nullopt};
    EXPECT_THROW(pbe::decrypt(alg, password_, Bytes(16, 0), DEFAULT_MAX_ITERATIONS),
                 StructuralException);
}

TEST_F(PbeTest, Encrypt_InvalidSettings) {
    EXPECT_THROW(pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 0),
                 StructuralException);
    EXPECT_THROW(pbe::encrypt(CipherSuite::PBE_SHA1_3DES_3KEY, password_, plaintext_, 16, 0),
                 StructuralException);
}
