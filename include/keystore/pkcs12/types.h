/**
 * @file types.h
 * @brief Common types for the PKCS#12 keystore library
 *
 * Record vocabulary, attribute model and option enums shared by the
 * decoder, the encoder and the export helpers.
 * RFC 7292 (PKCS #12 v1.1) compliant.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keystore::pkcs12 {

using Bytes = std::vector<uint8_t>;

/// @brief Type of a decoded keystore record
enum class RecordType {
    CERTIFICATE,      ///< DER X.509 certificate
    PRIVATE_KEY,      ///< DER PKCS#8 PrivateKeyInfo
    RSA_PRIVATE_KEY,  ///< DER PKCS#1 RSAPrivateKey (legacy)
    EC_PRIVATE_KEY,   ///< DER SEC1 ECPrivateKey
    SECRET,           ///< Raw secret bytes
    CRL,              ///< DER X.509 CRL
    UNKNOWN           ///< Unrecognized bag, value kept verbatim
};

/// @brief Private key output format on decode
enum class KeyFormat {
    PKCS8,   ///< Always PKCS#8 PrivateKeyInfo
    LEGACY   ///< RSA -> PKCS#1, EC -> SEC1, others stay PKCS#8
};

/// @brief How a MAC mismatch or a missing MAC is treated on decode
enum class MacPolicy {
    STRICT,   ///< Mismatch is fatal, missing MAC is a warning
    LENIENT,  ///< Mismatch and missing MAC are warnings
    REQUIRE   ///< Mismatch and missing MAC are fatal
};

/// @brief Outcome of the integrity check on decode
enum class MacStatus {
    VERIFIED,  ///< MAC present and matching
    MISSING,   ///< Container carries no MacData
    FAILED     ///< MAC present but not matching (LENIENT only)
};

/// @brief Bag attribute kept verbatim (anything but friendlyName / localKeyId)
struct BagAttribute {
    std::string oid;            ///< Attribute type, dotted form
    std::vector<Bytes> values;  ///< Each value as a complete DER element

    bool operator==(const BagAttribute& other) const {
        return oid == other.oid && values == other.values;
    }
    bool operator!=(const BagAttribute& other) const { return !(*this == other); }
};

/// @brief Attributes attached to a record
struct RecordAttributes {
    std::optional<std::string> friendlyName;  ///< PKCS#9 friendlyName as UTF-8
    std::optional<Bytes> localKeyId;          ///< PKCS#9 localKeyId raw bytes
    std::vector<BagAttribute> other;          ///< Unrecognized attributes, in order

    bool empty() const {
        return !friendlyName && !localKeyId && other.empty();
    }

    bool operator==(const RecordAttributes& other_) const {
        return friendlyName == other_.friendlyName &&
               localKeyId == other_.localKeyId &&
               other == other_.other;
    }
    bool operator!=(const RecordAttributes& other_) const { return !(*this == other_); }
};

/// @brief One plaintext entry of a keystore
struct Record {
    RecordType type = RecordType::UNKNOWN;
    RecordAttributes attributes;
    Bytes payload;
    /// Secret type (or inner key algorithm) for SECRET, bag type for UNKNOWN.
    std::string typeOid;

    bool operator==(const Record& other) const {
        return type == other.type && attributes == other.attributes &&
               payload == other.payload && typeOid == other.typeOid;
    }
    bool operator!=(const Record& other) const { return !(*this == other); }
};

/// @brief Full decode outcome
struct DecodeResult {
    std::vector<Record> records;
    MacStatus macStatus = MacStatus::MISSING;
    std::vector<std::string> warnings;

    bool authenticated() const { return macStatus == MacStatus::VERIFIED; }
};

/// @brief Convert RecordType to its display name
inline std::string recordTypeToString(RecordType t) {
    switch (t) {
        case RecordType::CERTIFICATE:     return "certificate";
        case RecordType::PRIVATE_KEY:     return "private key (PKCS#8)";
        case RecordType::RSA_PRIVATE_KEY: return "private key (legacy)";
        case RecordType::EC_PRIVATE_KEY:  return "EC private key";
        case RecordType::SECRET:          return "secret";
        case RecordType::CRL:             return "CRL";
        case RecordType::UNKNOWN:         return "unknown";
    }
    return "unknown";
}

/// @brief True for the three private key record types
inline bool isPrivateKey(RecordType t) {
    return t == RecordType::PRIVATE_KEY ||
           t == RecordType::RSA_PRIVATE_KEY ||
           t == RecordType::EC_PRIVATE_KEY;
}

/// @brief Convert MacStatus to string
inline std::string macStatusToString(MacStatus s) {
    switch (s) {
        case MacStatus::VERIFIED: return "VERIFIED";
        case MacStatus::MISSING:  return "MISSING";
        case MacStatus::FAILED:   return "FAILED";
    }
    return "UNKNOWN";
}

/// @brief Convert MacPolicy to string
inline std::string macPolicyToString(MacPolicy p) {
    switch (p) {
        case MacPolicy::STRICT:  return "strict";
        case MacPolicy::LENIENT: return "lenient";
        case MacPolicy::REQUIRE: return "require";
    }
    return "strict";
}

} // namespace keystore::pkcs12
