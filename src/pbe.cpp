/**
 * @file pbe.cpp
 * @brief PKCS#12 and PBES2 password-based encryption
 */

#include "keystore/pkcs12/pbe.h"
#include "keystore/pkcs12/errors.h"
#include "keystore/pkcs12/oids.h"

#include <climits>
#include <memory>
#include <mutex>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/provider.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

namespace keystore::pkcs12 {

namespace {

struct CipherDeleter {
    void operator()(EVP_CIPHER* c) const { EVP_CIPHER_free(c); }
};
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherPtr = std::unique_ptr<EVP_CIPHER, CipherDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// Cipher suite table (static initialization, never modified)
const CipherSuiteInfo CIPHER_SUITES[] = {
    {CipherSuite::PBE_SHA1_RC4_128,   oids::PBE_SHA1_RC4_128,   "pbeWithSHAAnd128BitRC4",          "RC4",          16, 0,  false, true},
    {CipherSuite::PBE_SHA1_RC4_40,    oids::PBE_SHA1_RC4_40,    "pbeWithSHAAnd40BitRC4",           "RC4-40",       5,  0,  false, true},
    {CipherSuite::PBE_SHA1_3DES_3KEY, oids::PBE_SHA1_3DES_3KEY, "pbeWithSHAAnd3-KeyTripleDES-CBC", "DES-EDE3-CBC", 24, 8,  false, false},
    {CipherSuite::PBE_SHA1_3DES_2KEY, oids::PBE_SHA1_3DES_2KEY, "pbeWithSHAAnd2-KeyTripleDES-CBC", "DES-EDE-CBC",  16, 8,  false, false},
    {CipherSuite::PBE_SHA1_RC2_128,   oids::PBE_SHA1_RC2_128,   "pbeWithSHAAnd128BitRC2-CBC",      "RC2-CBC",      16, 8,  false, true},
    {CipherSuite::PBE_SHA1_RC2_40,    oids::PBE_SHA1_RC2_40,    "pbeWithSHAAnd40BitRC2-CBC",       "RC2-40-CBC",   5,  8,  false, true},
    {CipherSuite::PBES2_AES_128_CBC,  oids::AES128_CBC,         "PBES2 aes128-CBC",                "AES-128-CBC",  16, 16, true,  false},
    {CipherSuite::PBES2_AES_192_CBC,  oids::AES192_CBC,         "PBES2 aes192-CBC",                "AES-192-CBC",  24, 16, true,  false},
    {CipherSuite::PBES2_AES_256_CBC,  oids::AES256_CBC,         "PBES2 aes256-CBC",                "AES-256-CBC",  32, 16, true,  false},
    {CipherSuite::PBES2_DES_EDE3_CBC, oids::DES_EDE3_CBC,       "PBES2 des-EDE3-CBC",              "DES-EDE3-CBC", 24, 8,  true,  false},
};

// PBKDF2 PRFs
struct PrfInfo {
    const char* oid;
    const EVP_MD* (*md)();
};

const PrfInfo PBKDF2_PRFS[] = {
    {oids::HMAC_SHA1,   EVP_sha1},
    {oids::HMAC_SHA224, EVP_sha224},
    {oids::HMAC_SHA256, EVP_sha256},
    {oids::HMAC_SHA384, EVP_sha384},
    {oids::HMAC_SHA512, EVP_sha512},
};

const CipherSuiteInfo* findSuite(const std::string& oid, bool pbes2) {
    for (const auto& info : CIPHER_SUITES) {
        if (info.pbes2 == pbes2 && oid == info.oid) {
            return &info;
        }
    }
    return nullptr;
}

const EVP_MD* findPrf(const std::string& oid) {
    for (const auto& prf : PBKDF2_PRFS) {
        if (oid == prf.oid) {
            return prf.md();
        }
    }
    return nullptr;
}

CipherPtr fetchCipher(const CipherSuiteInfo& info) {
    if (info.legacyProvider && !loadLegacyProvider()) {
        throw UnsupportedException(std::string(info.name) +
                                   " requires the OpenSSL legacy provider, which is not available");
    }
    CipherPtr cipher(EVP_CIPHER_fetch(nullptr, info.cipherName, nullptr));
    if (!cipher) {
        ERR_clear_error();
        throw UnsupportedException(std::string("cipher ") + info.cipherName + " is not available");
    }
    return cipher;
}

Bytes randomBytes(size_t length) {
    Bytes out(length);
    if (length > 0 && RAND_bytes(out.data(), static_cast<int>(length)) != 1) {
        ERR_clear_error();
        throw UnsupportedException("random number generator failure");
    }
    return out;
}

/**
 * @brief Validate end-of-block padding without data-dependent branches
 * @return Number of padding bytes
 */
size_t checkPadding(const Bytes& plaintext, size_t blockSize) {
    const size_t n = plaintext.size();
    const unsigned int pad = plaintext[n - 1];

    unsigned int bad = static_cast<unsigned int>(pad == 0) |
                       static_cast<unsigned int>(pad > blockSize);
    for (size_t k = 0; k < blockSize; k++) {
        // 1 while k < pad
        unsigned int inPad = static_cast<unsigned int>(k - pad) >> (sizeof(unsigned int) * 8 - 1);
        bad |= (0u - inPad) & (plaintext[n - 1 - k] ^ pad);
    }
    if (bad != 0) {
        throw DecryptionException("invalid padding (wrong password?)");
    }
    return pad;
}

Bytes runCipher(const EVP_CIPHER* cipher, const KeyMaterial& key, const KeyMaterial& iv,
                const Bytes& input, bool encrypt) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    const int enc = encrypt ? 1 : 0;

    bool ok = ctx &&
              EVP_CipherInit_ex2(ctx.get(), cipher, nullptr, nullptr, enc, nullptr) == 1;
    if (ok && EVP_CIPHER_CTX_get_key_length(ctx.get()) != static_cast<int>(key.size())) {
        ok = EVP_CIPHER_CTX_set_key_length(ctx.get(), static_cast<int>(key.size())) == 1;
    }
    ok = ok &&
         EVP_CipherInit_ex2(ctx.get(), nullptr, key.data(),
                            iv.empty() ? nullptr : iv.data(), enc, nullptr) == 1 &&
         EVP_CIPHER_CTX_set_padding(ctx.get(), 0) == 1;

    Bytes output(input.size() + static_cast<size_t>(EVP_CIPHER_get_block_size(cipher)));
    int outLen = 0;
    int finalLen = 0;
    if (ok) {
        ok = EVP_CipherUpdate(ctx.get(), output.data(), &outLen, input.data(),
                              static_cast<int>(input.size())) == 1 &&
             EVP_CipherFinal_ex(ctx.get(), output.data() + outLen, &finalLen) == 1;
    }
    if (!ok) {
        ERR_clear_error();
        OPENSSL_cleanse(output.data(), output.size());
        if (encrypt) {
            throw UnsupportedException("cipher initialization or encryption failed");
        }
        throw DecryptionException("cipher initialization or decryption failed");
    }
    output.resize(static_cast<size_t>(outLen + finalLen));
    return output;
}

Bytes decryptBlock(const EVP_CIPHER* cipher, const KeyMaterial& key, const KeyMaterial& iv,
                   const Bytes& ciphertext) {
    const size_t blockSize = static_cast<size_t>(EVP_CIPHER_get_block_size(cipher));
    if (ciphertext.size() > static_cast<size_t>(INT_MAX)) {
        throw DecryptionException("ciphertext too large");
    }
    if (blockSize > 1 && (ciphertext.empty() || ciphertext.size() % blockSize != 0)) {
        throw DecryptionException("ciphertext length " + std::to_string(ciphertext.size()) +
                                  " is not a positive multiple of the block size");
    }

    Bytes plaintext = runCipher(cipher, key, iv, ciphertext, false);
    if (blockSize > 1) {
        size_t pad = checkPadding(plaintext, blockSize);
        OPENSSL_cleanse(plaintext.data() + plaintext.size() - pad, pad);
        plaintext.resize(plaintext.size() - pad);
    }
    return plaintext;
}

Bytes encryptBlock(const EVP_CIPHER* cipher, const KeyMaterial& key, const KeyMaterial& iv,
                   const Bytes& plaintext) {
    const size_t blockSize = static_cast<size_t>(EVP_CIPHER_get_block_size(cipher));
    if (plaintext.size() > static_cast<size_t>(INT_MAX) - blockSize) {
        throw UnsupportedException("plaintext too large");
    }
    if (blockSize <= 1) {
        return runCipher(cipher, key, iv, plaintext, true);
    }

    Bytes padded(plaintext);
    const size_t pad = blockSize - (plaintext.size() % blockSize);
    padded.insert(padded.end(), pad, static_cast<uint8_t>(pad));
    Bytes ciphertext = runCipher(cipher, key, iv, padded, true);
    OPENSSL_cleanse(padded.data(), padded.size());
    return ciphertext;
}

// --- PKCS#12 legacy suites ---

Bytes decryptLegacy(const CipherSuiteInfo& info, const AlgorithmIdentifier& algorithm,
                    const Password& password, const Bytes& ciphertext, int64_t maxIterations) {
    PbeParameters params = decodePbeParameters(algorithm.parameters, maxIterations);
    CipherPtr cipher = fetchCipher(info);

    KeyMaterial key = deriveKey(password.bmp(), params.salt, params.iterations,
                                KeyPurpose::ENCRYPTION_KEY, info.keyLength, EVP_sha1());
    KeyMaterial iv;
    if (info.ivLength > 0) {
        iv = deriveKey(password.bmp(), params.salt, params.iterations,
                       KeyPurpose::IV, info.ivLength, EVP_sha1());
    }
    return decryptBlock(cipher.get(), key, iv, ciphertext);
}

pbe::Encrypted encryptLegacy(const CipherSuiteInfo& info, const Password& password,
                             const Bytes& plaintext, int64_t iterations, size_t saltLength) {
    CipherPtr cipher = fetchCipher(info);
    PbeParameters params{randomBytes(saltLength), iterations};

    KeyMaterial key = deriveKey(password.bmp(), params.salt, params.iterations,
                                KeyPurpose::ENCRYPTION_KEY, info.keyLength, EVP_sha1());
    KeyMaterial iv;
    if (info.ivLength > 0) {
        iv = deriveKey(password.bmp(), params.salt, params.iterations,
                       KeyPurpose::IV, info.ivLength, EVP_sha1());
    }

    pbe::Encrypted result;
    result.algorithm = {info.oid, encodePbeParameters(params)};
    result.ciphertext = encryptBlock(cipher.get(), key, iv, plaintext);
    return result;
}

// --- PBES2 ---

KeyMaterial pbkdf2(const Password& password, const Pbes2Parameters& params,
                   const EVP_MD* prf, size_t keyLength) {
    if (params.iterations > INT_MAX) {
        throw StructuralException("PBKDF2-params: iteration count too large");
    }
    KeyMaterial key(keyLength);
    const char* pass = password.utf8().empty()
        ? "" : reinterpret_cast<const char*>(password.utf8().data());
    if (PKCS5_PBKDF2_HMAC(pass, static_cast<int>(password.utf8().size()),
                          params.salt.data(), static_cast<int>(params.salt.size()),
                          static_cast<int>(params.iterations), prf,
                          static_cast<int>(keyLength), key.data()) != 1) {
        ERR_clear_error();
        throw UnsupportedException("PBKDF2 derivation failed");
    }
    return key;
}

Bytes decryptPbes2(const AlgorithmIdentifier& algorithm, const Password& password,
                   const Bytes& ciphertext, int64_t maxIterations) {
    Pbes2Parameters params = decodePbes2Parameters(algorithm.parameters, maxIterations);

    const CipherSuiteInfo* info = findSuite(params.cipherOid, true);
    if (!info) {
        throw UnsupportedException("PBES2 encryption scheme " + oids::oidName(params.cipherOid));
    }
    const EVP_MD* prf = findPrf(params.prfOid);
    if (!prf) {
        throw UnsupportedException("PBKDF2 PRF " + oids::oidName(params.prfOid));
    }
    if (params.keyLength && static_cast<size_t>(*params.keyLength) != info->keyLength) {
        throw StructuralException("PBKDF2-params: key length " + std::to_string(*params.keyLength) +
                                  " does not match " + info->name);
    }
    if (params.iv.size() != info->ivLength) {
        throw StructuralException(std::string("PBES2-params: IV length does not match ") + info->name);
    }

    CipherPtr cipher = fetchCipher(*info);
    KeyMaterial key = pbkdf2(password, params, prf, info->keyLength);
    KeyMaterial iv(params.iv.data(), params.iv.size());
    return decryptBlock(cipher.get(), key, iv, ciphertext);
}

pbe::Encrypted encryptPbes2(const CipherSuiteInfo& info, const Password& password,
                            const Bytes& plaintext, int64_t iterations, size_t saltLength) {
    CipherPtr cipher = fetchCipher(info);

    Pbes2Parameters params;
    params.salt = randomBytes(saltLength);
    params.iterations = iterations;
    params.prfOid = oids::HMAC_SHA256;
    params.cipherOid = info.oid;
    params.iv = randomBytes(info.ivLength);

    KeyMaterial key = pbkdf2(password, params, EVP_sha256(), info.keyLength);
    KeyMaterial iv(params.iv.data(), params.iv.size());

    pbe::Encrypted result;
    result.algorithm = {oids::PBES2, encodePbes2Parameters(params)};
    result.ciphertext = encryptBlock(cipher.get(), key, iv, plaintext);
    return result;
}

} // anonymous namespace

const CipherSuiteInfo& cipherSuiteInfo(CipherSuite suite) {
    for (const auto& info : CIPHER_SUITES) {
        if (info.suite == suite) {
            return info;
        }
    }
    throw UnsupportedException("cipher suite");
}

std::string cipherSuiteToString(CipherSuite suite) {
    return cipherSuiteInfo(suite).name;
}

bool loadLegacyProvider() {
    static std::once_flag once;
    static bool available = false;

    std::call_once(once, [] {
        // retain_fallbacks keeps the default provider active
        OSSL_PROVIDER* legacy = OSSL_PROVIDER_try_load(nullptr, "legacy", 1);
        available = legacy != nullptr;
        if (available) {
            spdlog::debug("OpenSSL legacy provider loaded");
        } else {
            ERR_clear_error();
            spdlog::warn("OpenSSL legacy provider not available: RC2 and RC4 suites disabled");
        }
    });
    return available;
}

namespace pbe {

Bytes decrypt(const AlgorithmIdentifier& algorithm,
              const Password& password,
              const Bytes& ciphertext,
              int64_t maxIterations) {
    if (algorithm.oid == oids::PBES2) {
        spdlog::debug("PBE: decrypting {} bytes with PBES2", ciphertext.size());
        return decryptPbes2(algorithm, password, ciphertext, maxIterations);
    }

    const CipherSuiteInfo* info = findSuite(algorithm.oid, false);
    if (!info) {
        throw UnsupportedException("encryption algorithm " + oids::oidName(algorithm.oid));
    }
    spdlog::debug("PBE: decrypting {} bytes with {}", ciphertext.size(), info->name);
    return decryptLegacy(*info, algorithm, password, ciphertext, maxIterations);
}

Encrypted encrypt(CipherSuite suite,
                  const Password& password,
                  const Bytes& plaintext,
                  int64_t iterations,
                  size_t saltLength) {
    if (iterations < 1) {
        throw StructuralException("PBE: iteration count must be positive");
    }
    if (saltLength == 0 || saltLength > static_cast<size_t>(INT_MAX)) {
        throw StructuralException("PBE: invalid salt length");
    }

    const CipherSuiteInfo& info = cipherSuiteInfo(suite);
    spdlog::debug("PBE: encrypting {} bytes with {}, {} iterations", plaintext.size(), info.name,
                  iterations);
    if (info.pbes2) {
        return encryptPbes2(info, password, plaintext, iterations, saltLength);
    }
    return encryptLegacy(info, password, plaintext, iterations, saltLength);
}

} // namespace pbe

} // namespace keystore::pkcs12
