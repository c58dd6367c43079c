/**
 * @file mac.h
 * @brief Password integrity mode (RFC 7292 Section 5.2 / Appendix B.4)
 *
 * The MAC key comes from the PKCS#12 key derivation with purpose 3 and the
 * same digest as the HMAC; its length equals the digest output size.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "keystore/pkcs12/kdf.h"
#include "keystore/pkcs12/structures.h"
#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/// @brief MAC digest algorithms
enum class MacDigest {
    SHA1,
    SHA224,
    SHA256,
    SHA384,
    SHA512
};

/// @brief Convert MacDigest to string
inline std::string macDigestToString(MacDigest d) {
    switch (d) {
        case MacDigest::SHA1:   return "SHA-1";
        case MacDigest::SHA224: return "SHA-224";
        case MacDigest::SHA256: return "SHA-256";
        case MacDigest::SHA384: return "SHA-384";
        case MacDigest::SHA512: return "SHA-512";
    }
    return "SHA-1";
}

namespace mac {

constexpr int64_t DEFAULT_ITERATIONS = 2048;
constexpr size_t DEFAULT_SALT_LENGTH = 8;

/**
 * @brief Compute the HMAC over the authenticated safe
 * @param digestOid Digest algorithm OID from MacData
 * @param password Password
 * @param salt MAC salt
 * @param iterations Derivation iteration count
 * @param data Exact authSafe content octets
 * @throws UnsupportedException on unknown digests
 */
Bytes compute(const std::string& digestOid,
              const Password& password,
              const Bytes& salt,
              int64_t iterations,
              const Bytes& data);

/**
 * @brief Verify stored MacData against the authenticated safe
 *
 * The comparison runs in constant time.
 *
 * @return true if the MAC matches
 * @throws UnsupportedException on unknown digests
 * @throws StructuralException if the stored digest has the wrong length
 */
bool verify(const MacData& macData, const Password& password, const Bytes& data);

/**
 * @brief Build MacData with a fresh random salt
 */
MacData create(MacDigest digest,
               const Password& password,
               const Bytes& data,
               int64_t iterations = DEFAULT_ITERATIONS,
               size_t saltLength = DEFAULT_SALT_LENGTH);

} // namespace mac

} // namespace keystore::pkcs12
