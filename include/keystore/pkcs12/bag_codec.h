/**
 * @file bag_codec.h
 * @brief SafeBag payload codec (RFC 7292 Section 4.2)
 *
 * Bag values are decoded through one table keyed by bag type OID into a
 * tagged payload variant, then turned into records. Unknown bag types
 * become UNKNOWN records carrying the bag value verbatim.
 *
 * | Bag type            | Decode                                 | Encode                         |
 * |---------------------|----------------------------------------|--------------------------------|
 * | keyBag              | PrivateKeyInfo as is                   | PrivateKeyInfo as is           |
 * | pkcs8ShroudedKeyBag | PBE-decrypt, then PrivateKeyInfo       | PBE-encrypt PrivateKeyInfo     |
 * | certBag             | x509Certificate only                   | x509Certificate                |
 * | crlBag              | x509CRL only                           | x509CRL                        |
 * | secretBag           | secret value (shrouded keys decrypted) | secret value (optionally shrouded) |
 * | safeContentsBag     | flattened in place                     | never produced                 |
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

#include "keystore/pkcs12/kdf.h"
#include "keystore/pkcs12/pbe.h"
#include "keystore/pkcs12/providers.h"
#include "keystore/pkcs12/structures.h"
#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/// @brief Maximum depth of nested safeContentsBag
constexpr int MAX_SAFE_CONTENTS_DEPTH = 16;

namespace bags {

/// keyBag, or a decrypted pkcs8ShroudedKeyBag
struct KeyPayload {
    Bytes pkcs8;
};

struct CertificatePayload {
    Bytes der;
};

struct CrlPayload {
    Bytes der;
};

struct SecretPayload {
    std::string typeOid;   ///< secretTypeId, or the inner key algorithm for shrouded secrets
    Bytes value;
};

/// safeContentsBag: child bags, owned
struct NestedPayload {
    std::vector<SafeBag> bags;
};

/// Unrecognized bag type
struct OpaquePayload {
    std::string bagId;
    Bytes value;
};

} // namespace bags

using BagPayload = std::variant<bags::KeyPayload,
                                bags::CertificatePayload,
                                bags::CrlPayload,
                                bags::SecretPayload,
                                bags::NestedPayload,
                                bags::OpaquePayload>;

/**
 * @brief Everything a bag decoder needs besides the bag
 */
struct BagDecodeContext {
    const Password& password;
    KeyFormat keyFormat;
    int64_t maxIterations;
    bool validatePayloads;
    IPrivateKeyParser& keyParser;
    ICertificateParser& certificateParser;
};

/**
 * @brief Bag encoding settings
 */
struct BagEncodeOptions {
    CipherSuite keySuite = CipherSuite::PBE_SHA1_3DES_3KEY;
    bool shroudKeys = true;
    bool shroudSecrets = true;
    bool validatePayloads = true;
    int64_t iterations = pbe::DEFAULT_ITERATIONS;
    size_t saltLength = pbe::DEFAULT_SALT_LENGTH;
};

/**
 * @brief Decrypt an EncryptedPrivateKeyInfo and check it holds a PrivateKeyInfo
 *
 * @return PrivateKeyInfo DER
 * @throws DecryptionException on bad padding or when the plaintext is not a PrivateKeyInfo
 * @throws StructuralException when the EncryptedPrivateKeyInfo is malformed
 */
Bytes decryptShroudedKeyBag(const Bytes& epkiDer, const Password& password,
                            int64_t maxIterations);

/**
 * @brief Decode one bag value through the bag type table
 *
 * @throws StructuralException on malformed values or invalid payloads
 * @throws UnsupportedException on non-X.509 certificate or CRL types
 * @throws DecryptionException when a shrouded key does not decrypt
 */
BagPayload decodeBagPayload(const SafeBag& bag, const BagDecodeContext& ctx);

/**
 * @brief Decode bags into records, flattening nested SafeContents in order
 * @param bags Bags of one SafeContents
 * @param ctx Decode context
 * @param out Records are appended here
 * @param depth Nesting depth of @p bags
 */
void decodeBags(const std::vector<SafeBag>& bags,
                const BagDecodeContext& ctx,
                std::vector<Record>& out,
                int depth = 0);

/**
 * @brief Encode one record as a SafeBag
 *
 * @param record Record to encode
 * @param password Password for shrouded keys and secrets
 * @param options Encoding settings
 * @param keyParser Converts legacy keys to PKCS#8
 * @param certificateParser Validates certificates and CRLs
 * @return Encoded SafeBag
 */
Bytes encodeRecord(const Record& record,
                   const Password& password,
                   const BagEncodeOptions& options,
                   IPrivateKeyParser& keyParser,
                   ICertificateParser& certificateParser);

} // namespace keystore::pkcs12
