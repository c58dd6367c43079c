/**
 * @file structures.h
 * @brief PKCS#12 structural model (RFC 7292 Section 4, Appendix D)
 *
 * Typed records for the nested container layers and their codecs:
 * PFX, MacData, ContentInfo, EncryptedData, SafeBag, attributes,
 * EncryptedPrivateKeyInfo and the pkcs-12PbeParams.
 *
 * Decoders consume BER, encoders produce DER. Decoders only check shape;
 * algorithm semantics belong to the PBE and MAC engines.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/// @brief PFX version accepted and produced
constexpr int64_t PFX_VERSION = 3;

/// @brief Default iteration ceiling for attacker-supplied counts
constexpr int64_t DEFAULT_MAX_ITERATIONS = 10000000;

/**
 * @brief AlgorithmIdentifier with parameters kept as raw DER
 */
struct AlgorithmIdentifier {
    std::string oid;
    std::optional<Bytes> parameters;  ///< Complete parameter element, if present
};

/**
 * @brief pkcs-12PbeParams: salt and iteration count
 */
struct PbeParameters {
    Bytes salt;
    int64_t iterations = 0;
};

/**
 * @brief PBES2-params with PBKDF2-params flattened (RFC 8018 Appendix A)
 */
struct Pbes2Parameters {
    Bytes salt;
    int64_t iterations = 0;
    std::optional<int64_t> keyLength;
    std::string prfOid;              ///< PBKDF2 PRF, hmacWithSHA1 when absent
    std::string cipherOid;           ///< Encryption scheme
    Bytes iv;
};

/**
 * @brief MacData with its DigestInfo flattened
 */
struct MacData {
    AlgorithmIdentifier digestAlgorithm;
    Bytes digest;
    Bytes salt;
    int64_t iterations = 1;
};

/**
 * @brief ContentInfo
 *
 * For `data`, content holds the OCTET STRING value.
 * For every other type, content holds the complete inner element
 * (the EncryptedData SEQUENCE for `encryptedData`).
 */
struct ContentInfo {
    std::string contentType;
    Bytes content;
};

/**
 * @brief PFX: version, authenticated safe and optional MacData
 */
struct Pfx {
    int64_t version = PFX_VERSION;
    Bytes authSafe;                  ///< Octets of the authSafe `data` content (MAC input)
    std::optional<MacData> macData;
};

/**
 * @brief EncryptedData / EncryptedContentInfo
 */
struct EncryptedData {
    std::string contentType;         ///< Type of the plaintext (normally `data`)
    AlgorithmIdentifier algorithm;
    Bytes ciphertext;
};

/**
 * @brief EncryptedPrivateKeyInfo (PKCS#8)
 */
struct EncryptedPrivateKeyInfo {
    AlgorithmIdentifier algorithm;
    Bytes ciphertext;
};

/**
 * @brief One SafeBag with its value still undecoded
 */
struct SafeBag {
    std::string bagId;
    Bytes value;                     ///< Complete element inside the [0] EXPLICIT wrapper
    RecordAttributes attributes;
};

/// @name AlgorithmIdentifier
/// @{
Bytes encodeAlgorithm(const AlgorithmIdentifier& alg);
/// @}

/// @name PBE parameters
/// @{

/**
 * @brief Decode pkcs-12PbeParams
 * @param parameters Raw parameter element from the AlgorithmIdentifier
 * @param maxIterations Upper bound on the iteration count
 * @throws StructuralException on shape or iteration bound violation
 */
PbeParameters decodePbeParameters(const std::optional<Bytes>& parameters, int64_t maxIterations);
Bytes encodePbeParameters(const PbeParameters& params);

/**
 * @brief Decode PBES2-params
 * @throws StructuralException on shape or iteration bound violation
 * @throws UnsupportedException if the key derivation function is not PBKDF2
 */
Pbes2Parameters decodePbes2Parameters(const std::optional<Bytes>& parameters, int64_t maxIterations);
Bytes encodePbes2Parameters(const Pbes2Parameters& params);
/// @}

/// @name PFX
/// @{

/**
 * @brief Decode the outer PFX
 *
 * Requires version 3 and an authSafe of type `data`.
 *
 * @param der Complete container bytes
 * @param maxIterations Upper bound on the MAC iteration count
 * @throws StructuralException on malformed input
 * @throws UnsupportedException on other versions or signedData integrity mode
 */
Pfx decodePfx(const Bytes& der, int64_t maxIterations);
Bytes encodePfx(const Bytes& authSafe, const std::optional<MacData>& macData);
/// @}

/// @name AuthenticatedSafe
/// @{
std::vector<ContentInfo> decodeAuthenticatedSafe(const Bytes& der);
Bytes encodeAuthenticatedSafe(const std::vector<Bytes>& contentInfos);
Bytes encodeDataContentInfo(const Bytes& data);
Bytes encodeEncryptedDataContentInfo(const AlgorithmIdentifier& algorithm, const Bytes& ciphertext);
/// @}

/// @name EncryptedData
/// @{
EncryptedData decodeEncryptedData(const Bytes& der);
/// @}

/// @name EncryptedPrivateKeyInfo
/// @{
EncryptedPrivateKeyInfo decodeEncryptedPrivateKeyInfo(const Bytes& der);
Bytes encodeEncryptedPrivateKeyInfo(const EncryptedPrivateKeyInfo& epki);
/// @}

/// @name SafeContents
/// @{

/**
 * @brief Decode SafeContents into its bags, in order
 * @param context Structural layer name used in error messages
 */
std::vector<SafeBag> decodeSafeContents(const Bytes& der, const std::string& context);
Bytes encodeSafeBag(const SafeBag& bag);
Bytes encodeSafeContents(const std::vector<Bytes>& bags);
/// @}

/// @name Attributes
/// @{

/**
 * @brief Encode the SET OF Attribute for a bag
 * @return Encoded SET, or empty bytes if there is nothing to encode
 */
Bytes encodeAttributes(const RecordAttributes& attributes);
/// @}

} // namespace keystore::pkcs12
