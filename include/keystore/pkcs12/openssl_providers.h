/**
 * @file openssl_providers.h
 * @brief OpenSSL-backed implementations of the payload parsers
 */

#pragma once

#include "keystore/pkcs12/providers.h"

namespace keystore::pkcs12 {

/**
 * @brief Private key parser over EVP_PKEY / PKCS8_PRIV_KEY_INFO
 */
class OpenSslPrivateKeyParser : public IPrivateKeyParser {
public:
    bool isValidPrivateKey(const Bytes& pkcs8) override;
    ConvertedKey toLegacy(const Bytes& pkcs8) override;
    Bytes toPkcs8(RecordType type, const Bytes& der) override;
};

/**
 * @brief Certificate and CRL parser over d2i_X509 / d2i_X509_CRL
 */
class OpenSslCertificateParser : public ICertificateParser {
public:
    bool isValidCertificate(const Bytes& der) override;
    bool isValidCrl(const Bytes& der) override;
};

} // namespace keystore::pkcs12
