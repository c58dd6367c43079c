/**
 * @file mac.cpp
 * @brief PKCS#12 MAC computation and verification
 */

#include "keystore/pkcs12/mac.h"
#include "keystore/pkcs12/der.h"
#include "keystore/pkcs12/errors.h"
#include "keystore/pkcs12/oids.h"

#include <climits>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

namespace keystore::pkcs12 {

namespace {

struct MacDigestEntry {
    MacDigest digest;
    const char* oid;
    const EVP_MD* (*md)();
};

// MAC digest table (static initialization)
const MacDigestEntry MAC_DIGESTS[] = {
    {MacDigest::SHA1,   oids::SHA1,   EVP_sha1},
    {MacDigest::SHA224, oids::SHA224, EVP_sha224},
    {MacDigest::SHA256, oids::SHA256, EVP_sha256},
    {MacDigest::SHA384, oids::SHA384, EVP_sha384},
    {MacDigest::SHA512, oids::SHA512, EVP_sha512},
};

const EVP_MD* digestForOid(const std::string& oid) {
    for (const auto& d : MAC_DIGESTS) {
        if (oid == d.oid) {
            return d.md();
        }
    }
    throw UnsupportedException("MAC digest algorithm " + oids::oidName(oid));
}

const MacDigestEntry& digestInfo(MacDigest digest) {
    for (const auto& d : MAC_DIGESTS) {
        if (d.digest == digest) {
            return d;
        }
    }
    throw UnsupportedException("MAC digest " + macDigestToString(digest));
}

} // anonymous namespace

namespace mac {

Bytes compute(const std::string& digestOid,
              const Password& password,
              const Bytes& salt,
              int64_t iterations,
              const Bytes& data) {
    const EVP_MD* md = digestForOid(digestOid);
    const size_t mdSize = static_cast<size_t>(EVP_MD_get_size(md));

    KeyMaterial key = deriveKey(password.bmp(), salt, iterations, KeyPurpose::MAC_KEY, mdSize, md);

    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int outLen = 0;
    if (!HMAC(md, key.data(), static_cast<int>(key.size()), data.data(), data.size(),
              out.data(), &outLen)) {
        ERR_clear_error();
        throw UnsupportedException("HMAC computation failed");
    }
    out.resize(outLen);
    return out;
}

bool verify(const MacData& macData, const Password& password, const Bytes& data) {
    const EVP_MD* md = digestForOid(macData.digestAlgorithm.oid);
    const size_t mdSize = static_cast<size_t>(EVP_MD_get_size(md));
    if (macData.digest.size() != mdSize) {
        throw StructuralException("MacData: digest length " + std::to_string(macData.digest.size()) +
                                  " does not match " + oids::oidName(macData.digestAlgorithm.oid));
    }

    Bytes computed = compute(macData.digestAlgorithm.oid, password, macData.salt,
                             macData.iterations, data);
    return CRYPTO_memcmp(computed.data(), macData.digest.data(), mdSize) == 0;
}

MacData create(MacDigest digest,
               const Password& password,
               const Bytes& data,
               int64_t iterations,
               size_t saltLength) {
    if (iterations < 1) {
        throw StructuralException("MAC: iteration count must be positive");
    }
    if (saltLength == 0 || saltLength > static_cast<size_t>(INT_MAX)) {
        throw StructuralException("MAC: invalid salt length");
    }

    const MacDigestEntry& info = digestInfo(digest);

    MacData macData;
    macData.digestAlgorithm = {info.oid, der::null()};
    macData.salt.resize(saltLength);
    if (RAND_bytes(macData.salt.data(), static_cast<int>(saltLength)) != 1) {
        ERR_clear_error();
        throw UnsupportedException("random number generator failure");
    }
    macData.iterations = iterations;
    macData.digest = compute(info.oid, password, macData.salt, iterations, data);

    spdlog::debug("MAC: {} over {} bytes, {} iterations", macDigestToString(digest),
                  data.size(), iterations);
    return macData;
}

} // namespace mac

} // namespace keystore::pkcs12
