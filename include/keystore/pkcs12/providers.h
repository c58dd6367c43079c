/**
 * @file providers.h
 * @brief Parser interfaces for the payloads carried by keystore records
 *
 * The container codec treats X.509 and private-key structures as opaque
 * DER payloads. These interfaces decouple it from the parsers that check
 * and convert those payloads:
 *   - OpenSslCertificateParser / OpenSslPrivateKeyParser (openssl_providers.h)
 *   - test doubles in the unit tests
 */

#pragma once

#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/**
 * @brief Private key in the format a record carries it
 */
struct ConvertedKey {
    RecordType type = RecordType::PRIVATE_KEY;
    Bytes der;
};

/**
 * @brief Private key parser interface
 */
class IPrivateKeyParser {
public:
    virtual ~IPrivateKeyParser() = default;

    /**
     * @brief Check that bytes are a complete DER PKCS#8 PrivateKeyInfo
     * @param pkcs8 Candidate PrivateKeyInfo
     * @return true if a usable key parses from the bytes
     */
    virtual bool isValidPrivateKey(const Bytes& pkcs8) = 0;

    /**
     * @brief Convert PKCS#8 to the key type's traditional encoding
     *
     * RSA becomes PKCS#1 RSAPrivateKey, EC becomes SEC1 ECPrivateKey.
     * Other key types are returned unchanged as PRIVATE_KEY.
     *
     * @throws StructuralException if the key does not parse
     */
    virtual ConvertedKey toLegacy(const Bytes& pkcs8) = 0;

    /**
     * @brief Convert a private key record payload to PKCS#8
     * @param type PRIVATE_KEY, RSA_PRIVATE_KEY or EC_PRIVATE_KEY
     * @param der Record payload
     * @throws StructuralException if the key does not parse
     */
    virtual Bytes toPkcs8(RecordType type, const Bytes& der) = 0;
};

/**
 * @brief X.509 certificate and CRL parser interface
 */
class ICertificateParser {
public:
    virtual ~ICertificateParser() = default;

    /// @brief true if the bytes are exactly one DER X.509 certificate
    virtual bool isValidCertificate(const Bytes& der) = 0;

    /// @brief true if the bytes are exactly one DER X.509 CRL
    virtual bool isValidCrl(const Bytes& der) = 0;
};

} // namespace keystore::pkcs12
