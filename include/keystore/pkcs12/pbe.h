/**
 * @file pbe.h
 * @brief Password-based encryption engine
 *
 * PKCS#12 legacy cipher suites (RFC 7292 Appendix C) over the Appendix B
 * key derivation, plus PBES2 / PBKDF2 (RFC 8018) as written by current
 * OpenSSL and Java releases.
 *
 * RC2 and RC4 live in the OpenSSL legacy provider, which is loaded once on
 * first use.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "keystore/pkcs12/kdf.h"
#include "keystore/pkcs12/structures.h"
#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/// @brief Cipher suites selectable on encode
enum class CipherSuite {
    PBE_SHA1_RC4_128,
    PBE_SHA1_RC4_40,
    PBE_SHA1_3DES_3KEY,
    PBE_SHA1_3DES_2KEY,
    PBE_SHA1_RC2_128,
    PBE_SHA1_RC2_40,
    PBES2_AES_128_CBC,
    PBES2_AES_192_CBC,
    PBES2_AES_256_CBC,
    PBES2_DES_EDE3_CBC
};

/**
 * @brief Static description of one cipher suite
 */
struct CipherSuiteInfo {
    CipherSuite suite;
    const char* oid;            ///< PKCS#12 PBE OID, or the PBES2 encryption scheme OID
    const char* name;
    const char* cipherName;     ///< OpenSSL fetch name
    size_t keyLength;
    size_t ivLength;
    bool pbes2;
    bool legacyProvider;        ///< Needs the OpenSSL legacy provider
};

/// @brief Table entry for a suite
const CipherSuiteInfo& cipherSuiteInfo(CipherSuite suite);

/// @brief Display name of a suite (e.g., "pbeWithSHAAnd3-KeyTripleDES-CBC")
std::string cipherSuiteToString(CipherSuite suite);

/**
 * @brief Load the OpenSSL legacy provider (RC2, RC4) once per process
 * @return true if the provider is available
 */
bool loadLegacyProvider();

namespace pbe {

/// @brief Default iteration count on encode
constexpr int64_t DEFAULT_ITERATIONS = 2048;

/// @brief Default salt length on encode
constexpr size_t DEFAULT_SALT_LENGTH = 8;

/**
 * @brief Encrypted payload with the AlgorithmIdentifier that describes it
 */
struct Encrypted {
    AlgorithmIdentifier algorithm;
    Bytes ciphertext;
};

/**
 * @brief Decrypt with the algorithm named by an AlgorithmIdentifier
 *
 * Block ciphers have their padding validated in constant time over the
 * last block.
 *
 * @param algorithm Encryption algorithm with its parameters
 * @param password Password
 * @param ciphertext Ciphertext
 * @param maxIterations Upper bound on the iteration count
 * @return Plaintext with padding removed
 * @throws UnsupportedException on unknown algorithms or a missing provider
 * @throws StructuralException on malformed parameters
 * @throws DecryptionException on bad ciphertext length or padding
 */
Bytes decrypt(const AlgorithmIdentifier& algorithm,
              const Password& password,
              const Bytes& ciphertext,
              int64_t maxIterations);

/**
 * @brief Encrypt with a fresh random salt (and IV for PBES2)
 *
 * @param suite Cipher suite
 * @param password Password
 * @param plaintext Plaintext
 * @param iterations Iteration count
 * @param saltLength Salt length in bytes
 */
Encrypted encrypt(CipherSuite suite,
                  const Password& password,
                  const Bytes& plaintext,
                  int64_t iterations = DEFAULT_ITERATIONS,
                  size_t saltLength = DEFAULT_SALT_LENGTH);

} // namespace pbe

} // namespace keystore::pkcs12
