/**
 * @file oids.h
 * @brief Object identifiers used by PKCS#12 containers
 *
 * Values from RFC 7292 Appendix D, RFC 2315 (PKCS #7), RFC 2985 (PKCS #9)
 * and RFC 8018 (PKCS #5). Process-wide constants, never modified.
 */

#pragma once

#include <string>

namespace keystore::pkcs12::oids {

// PKCS #7 content types
inline constexpr const char* DATA = "1.2.840.113549.1.7.1";
inline constexpr const char* SIGNED_DATA = "1.2.840.113549.1.7.2";
inline constexpr const char* ENVELOPED_DATA = "1.2.840.113549.1.7.3";
inline constexpr const char* ENCRYPTED_DATA = "1.2.840.113549.1.7.6";

// Bag types (pkcs-12 bagtypes)
inline constexpr const char* KEY_BAG = "1.2.840.113549.1.12.10.1.1";
inline constexpr const char* PKCS8_SHROUDED_KEY_BAG = "1.2.840.113549.1.12.10.1.2";
inline constexpr const char* CERT_BAG = "1.2.840.113549.1.12.10.1.3";
inline constexpr const char* CRL_BAG = "1.2.840.113549.1.12.10.1.4";
inline constexpr const char* SECRET_BAG = "1.2.840.113549.1.12.10.1.5";
inline constexpr const char* SAFE_CONTENTS_BAG = "1.2.840.113549.1.12.10.1.6";

// Certificate and CRL types (pkcs-9)
inline constexpr const char* X509_CERTIFICATE = "1.2.840.113549.1.9.22.1";
inline constexpr const char* SDSI_CERTIFICATE = "1.2.840.113549.1.9.22.2";
inline constexpr const char* X509_CRL = "1.2.840.113549.1.9.23.1";

// Attributes (pkcs-9)
inline constexpr const char* FRIENDLY_NAME = "1.2.840.113549.1.9.20";
inline constexpr const char* LOCAL_KEY_ID = "1.2.840.113549.1.9.21";
inline constexpr const char* MS_CSP_NAME = "1.3.6.1.4.1.311.17.1";
inline constexpr const char* ORACLE_TRUSTED_KEY_USAGE = "2.16.840.1.113894.746875.1.1";

// Password-based encryption (pkcs-12PbeIds)
inline constexpr const char* PBE_SHA1_RC4_128 = "1.2.840.113549.1.12.1.1";
inline constexpr const char* PBE_SHA1_RC4_40 = "1.2.840.113549.1.12.1.2";
inline constexpr const char* PBE_SHA1_3DES_3KEY = "1.2.840.113549.1.12.1.3";
inline constexpr const char* PBE_SHA1_3DES_2KEY = "1.2.840.113549.1.12.1.4";
inline constexpr const char* PBE_SHA1_RC2_128 = "1.2.840.113549.1.12.1.5";
inline constexpr const char* PBE_SHA1_RC2_40 = "1.2.840.113549.1.12.1.6";

// PKCS #5 v2
inline constexpr const char* PBES2 = "1.2.840.113549.1.5.13";
inline constexpr const char* PBKDF2 = "1.2.840.113549.1.5.12";
inline constexpr const char* HMAC_SHA1 = "1.2.840.113549.2.7";
inline constexpr const char* HMAC_SHA224 = "1.2.840.113549.2.8";
inline constexpr const char* HMAC_SHA256 = "1.2.840.113549.2.9";
inline constexpr const char* HMAC_SHA384 = "1.2.840.113549.2.10";
inline constexpr const char* HMAC_SHA512 = "1.2.840.113549.2.11";
inline constexpr const char* AES128_CBC = "2.16.840.1.101.3.4.1.2";
inline constexpr const char* AES192_CBC = "2.16.840.1.101.3.4.1.22";
inline constexpr const char* AES256_CBC = "2.16.840.1.101.3.4.1.42";
inline constexpr const char* DES_EDE3_CBC = "1.2.840.113549.3.7";

// Digest algorithms (MacData)
inline constexpr const char* SHA1 = "1.3.14.3.2.26";
inline constexpr const char* SHA224 = "2.16.840.1.101.3.4.2.4";
inline constexpr const char* SHA256 = "2.16.840.1.101.3.4.2.1";
inline constexpr const char* SHA384 = "2.16.840.1.101.3.4.2.2";
inline constexpr const char* SHA512 = "2.16.840.1.101.3.4.2.3";

/**
 * @brief Get a readable name for a known OID
 * @param oid Dotted OID
 * @return Short name (e.g., "friendlyName", "pbeWithSHAAnd40BitRC2-CBC"), or the OID itself
 */
std::string oidName(const std::string& oid);

} // namespace keystore::pkcs12::oids
