/**
 * @file cert_ops.h
 * @brief X.509 certificate and CRL inspection for decoded records
 *
 * Read-only helpers used by the JSON summary and the inspect tool.
 * They operate on OpenSSL X509/X509_CRL structures passed as arguments,
 * or parse a record payload into an owning handle first.
 */

#pragma once

#include <memory>
#include <string>
#include <openssl/x509.h>
#include <openssl/asn1.h>

#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/// @name Owning handles
/// @{

struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};

struct X509CrlDeleter {
    void operator()(X509_CRL* crl) const { X509_CRL_free(crl); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509CrlPtr = std::unique_ptr<X509_CRL, X509CrlDeleter>;

/**
 * @brief Parse a DER certificate
 * @return Certificate, or nullptr if the bytes are not exactly one certificate
 */
X509Ptr parseCertificate(const Bytes& der);

/**
 * @brief Parse a DER CRL
 * @return CRL, or nullptr if the bytes are not exactly one CRL
 */
X509CrlPtr parseCrl(const Bytes& der);

/// @}

/// @name Certificate Status Checks
/// @{

/**
 * @brief Check if certificate has expired (notAfter < now)
 * @param cert Certificate to check (non-owning)
 * @return true if expired
 */
bool isCertificateExpired(X509* cert);

/**
 * @brief Check if certificate is self-signed (subject DN == issuer DN)
 *
 * Uses case-insensitive comparison per RFC 4517 Section 4.2.15.
 */
bool isSelfSigned(X509* cert);

/// @}

/// @name DN Extraction
/// @{

/**
 * @brief Extract Subject DN from certificate
 * @param cert Certificate (non-owning)
 * @return Subject DN in OpenSSL oneline format (e.g., "/OU=EXAMPLE/CN=John Doe")
 */
std::string getSubjectDn(X509* cert);

/**
 * @brief Extract Issuer DN from certificate
 */
std::string getIssuerDn(X509* cert);

/**
 * @brief Extract Issuer DN from CRL
 */
std::string getCrlIssuerDn(X509_CRL* crl);

/// @}

/// @name Fingerprint
/// @{

/**
 * @brief Calculate SHA-256 fingerprint of certificate
 * @param cert Certificate (non-owning)
 * @return 64-char lowercase hex string, or empty on error
 */
std::string getCertificateFingerprint(X509* cert);

/// @}

/// @name Time Utilities
/// @{

/**
 * @brief Convert ASN1_TIME to ISO 8601 string
 * @param t ASN.1 time structure (non-owning)
 * @return ISO 8601 formatted string (e.g., "2026-02-16T12:00:00Z"), or empty on error
 */
std::string asn1TimeToIso8601(const ASN1_TIME* t);

/// @}

} // namespace keystore::pkcs12
