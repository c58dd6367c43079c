/**
 * @file oids.cpp
 * @brief OID display names
 */

#include "keystore/pkcs12/oids.h"

#include <map>

namespace keystore::pkcs12::oids {

// OID name mapping (static initialization)
static const std::map<std::string, std::string> OID_NAMES = {
    {DATA, "data"},
    {SIGNED_DATA, "signedData"},
    {ENVELOPED_DATA, "envelopedData"},
    {ENCRYPTED_DATA, "encryptedData"},
    {KEY_BAG, "keyBag"},
    {PKCS8_SHROUDED_KEY_BAG, "pkcs8ShroudedKeyBag"},
    {CERT_BAG, "certBag"},
    {CRL_BAG, "crlBag"},
    {SECRET_BAG, "secretBag"},
    {SAFE_CONTENTS_BAG, "safeContentsBag"},
    {X509_CERTIFICATE, "x509Certificate"},
    {SDSI_CERTIFICATE, "sdsiCertificate"},
    {X509_CRL, "x509CRL"},
    {FRIENDLY_NAME, "friendlyName"},
    {LOCAL_KEY_ID, "localKeyId"},
    {MS_CSP_NAME, "msCspName"},
    {ORACLE_TRUSTED_KEY_USAGE, "oracleTrustedKeyUsage"},
    {PBE_SHA1_RC4_128, "pbeWithSHAAnd128BitRC4"},
    {PBE_SHA1_RC4_40, "pbeWithSHAAnd40BitRC4"},
    {PBE_SHA1_3DES_3KEY, "pbeWithSHAAnd3-KeyTripleDES-CBC"},
    {PBE_SHA1_3DES_2KEY, "pbeWithSHAAnd2-KeyTripleDES-CBC"},
    {PBE_SHA1_RC2_128, "pbeWithSHAAnd128BitRC2-CBC"},
    {PBE_SHA1_RC2_40, "pbeWithSHAAnd40BitRC2-CBC"},
    {PBES2, "PBES2"},
    {PBKDF2, "PBKDF2"},
    {HMAC_SHA1, "hmacWithSHA1"},
    {HMAC_SHA224, "hmacWithSHA224"},
    {HMAC_SHA256, "hmacWithSHA256"},
    {HMAC_SHA384, "hmacWithSHA384"},
    {HMAC_SHA512, "hmacWithSHA512"},
    {AES128_CBC, "aes128-CBC"},
    {AES192_CBC, "aes192-CBC"},
    {AES256_CBC, "aes256-CBC"},
    {DES_EDE3_CBC, "des-EDE3-CBC"},
    {SHA1, "SHA-1"},
    {SHA224, "SHA-224"},
    {SHA256, "SHA-256"},
    {SHA384, "SHA-384"},
    {SHA512, "SHA-512"},
    {"2.16.840.1.101.3.4.1", "AES"},
    {"1.2.840.113549.1.1.1", "rsaEncryption"},
    {"1.2.840.10045.2.1", "ecPublicKey"}
};

std::string oidName(const std::string& oid) {
    auto it = OID_NAMES.find(oid);
    if (it != OID_NAMES.end()) {
        return it->second;
    }
    return oid;
}

} // namespace keystore::pkcs12::oids
