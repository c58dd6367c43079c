/**
 * @file container.h
 * @brief PKCS#12 container decode / encode entry points
 *
 * decode(): PFX -> MAC check -> AuthenticatedSafe blocks -> (PBE) ->
 * SafeContents -> bags -> ordered records.
 * encode(): the reverse, grouping consecutive records into blocks so that
 * decoding reproduces their order.
 *
 * Both are pure functions of their arguments: no state survives a call.
 *
 * @code
 *   auto result = keystore::pkcs12::decode(fileBytes, std::string("changeit"));
 *   for (const auto& record : result.records) { ... }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "keystore/pkcs12/mac.h"
#include "keystore/pkcs12/pbe.h"
#include "keystore/pkcs12/providers.h"
#include "keystore/pkcs12/structures.h"
#include "keystore/pkcs12/types.h"

namespace keystore::common {
class ConfigManager;
}

namespace keystore::pkcs12 {

/**
 * @brief Decode settings
 */
struct DecodeOptions {
    MacPolicy macPolicy = MacPolicy::STRICT;
    KeyFormat keyFormat = KeyFormat::PKCS8;
    int64_t maxIterations = DEFAULT_MAX_ITERATIONS;
    bool validatePayloads = true;
    unsigned int workerThreads = 1;                  ///< > 1 decodes blocks in parallel
    IPrivateKeyParser* keyParser = nullptr;          ///< Non-owning, OpenSSL parser if null
    ICertificateParser* certificateParser = nullptr; ///< Non-owning, OpenSSL parser if null

    /**
     * @brief Build from KEYSTORE_* configuration keys
     *
     * Invalid values log a warning and keep the default.
     */
    static DecodeOptions fromConfig(const common::ConfigManager& config);
};

/**
 * @brief Encode settings
 */
struct EncodeOptions {
    CipherSuite keySuite = CipherSuite::PBE_SHA1_3DES_3KEY;
    CipherSuite certificateSuite = CipherSuite::PBE_SHA1_3DES_3KEY;
    bool shroudKeys = true;
    bool shroudSecrets = true;
    bool encryptCertificates = true;
    bool validatePayloads = true;
    int64_t iterations = pbe::DEFAULT_ITERATIONS;
    size_t saltLength = pbe::DEFAULT_SALT_LENGTH;
    bool includeMac = true;
    MacDigest macDigest = MacDigest::SHA1;
    int64_t macIterations = mac::DEFAULT_ITERATIONS;
    IPrivateKeyParser* keyParser = nullptr;
    ICertificateParser* certificateParser = nullptr;

    /**
     * @brief Build from KEYSTORE_* configuration keys
     */
    static EncodeOptions fromConfig(const common::ConfigManager& config);
};

/**
 * @brief Decode a PKCS#12 container
 *
 * @param data Complete container bytes
 * @param password Password; std::nullopt (absent) and "" (empty) are distinct
 * @param options Decode settings
 * @return Records in container order, MAC status and warnings
 * @throws StructuralException on malformed input
 * @throws UnsupportedException on unimplemented algorithms or bag variants
 * @throws DecryptionException when a block or key does not decrypt, or when the
 *         MAC fails and the password does not decrypt the contents
 * @throws IntegrityException when the MAC policy rejects the container
 */
DecodeResult decode(const Bytes& data,
                    const std::optional<std::string>& password,
                    const DecodeOptions& options = DecodeOptions());

/**
 * @brief Encode records into a PKCS#12 container
 *
 * @param records Records to store, in order
 * @param password Password; std::nullopt (absent) and "" (empty) are distinct
 * @param options Encode settings
 * @return DER container
 * @throws StructuralException or UnsupportedException on invalid records
 */
Bytes encode(const std::vector<Record>& records,
             const std::optional<std::string>& password,
             const EncodeOptions& options = EncodeOptions());

} // namespace keystore::pkcs12
