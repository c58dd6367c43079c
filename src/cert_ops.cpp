/**
 * @file cert_ops.cpp
 * @brief X.509 certificate and CRL inspection
 *
 * No logging side effects; failures come back as empty values.
 */

#include "keystore/pkcs12/cert_ops.h"
#include "keystore/common/encoding.h"

#include <cstring>
#include <ctime>
#include <strings.h>
#include <vector>
#include <openssl/evp.h>
#include <openssl/err.h>

namespace keystore::pkcs12 {

// --- Parsing ---

X509Ptr parseCertificate(const Bytes& der) {
    if (der.empty()) return nullptr;

    const unsigned char* p = der.data();
    X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
    if (!cert || p != der.data() + der.size()) {
        ERR_clear_error();
        return nullptr;
    }
    return cert;
}

X509CrlPtr parseCrl(const Bytes& der) {
    if (der.empty()) return nullptr;

    const unsigned char* p = der.data();
    X509CrlPtr crl(d2i_X509_CRL(nullptr, &p, static_cast<long>(der.size())));
    if (!crl || p != der.data() + der.size()) {
        ERR_clear_error();
        return nullptr;
    }
    return crl;
}

// --- Certificate Status Checks ---

bool isCertificateExpired(X509* cert) {
    if (!cert) return true;
    time_t now = time(nullptr);
    return (X509_cmp_time(X509_get0_notAfter(cert), &now) < 0);
}

bool isSelfSigned(X509* cert) {
    if (!cert) return false;

    // RFC 4517 Section 4.2.15: case-insensitive DN comparison
    std::string subject = getSubjectDn(cert);
    std::string issuer = getIssuerDn(cert);
    return (strcasecmp(subject.c_str(), issuer.c_str()) == 0);
}

// --- DN Extraction ---

namespace {

std::string nameToString(const X509_NAME* name) {
    if (!name) return "";

    char* dn = X509_NAME_oneline(name, nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

} // anonymous namespace

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";
    return nameToString(X509_get_subject_name(cert));
}

std::string getIssuerDn(X509* cert) {
    if (!cert) return "";
    return nameToString(X509_get_issuer_name(cert));
}

std::string getCrlIssuerDn(X509_CRL* crl) {
    if (!crl) return "";
    return nameToString(X509_CRL_get_issuer(crl));
}

// --- Fingerprint ---

std::string getCertificateFingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;

    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        ERR_clear_error();
        return "";
    }

    return common::Encoding::toHex(std::vector<uint8_t>(md, md + mdLen));
}

// --- Time Utilities ---

std::string asn1TimeToIso8601(const ASN1_TIME* t) {
    if (!t) return "";
    struct tm tm_val;
    if (ASN1_TIME_to_tm(t, &tm_val) == 1) {
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
        return std::string(buf);
    }
    ERR_clear_error();
    return "";
}

} // namespace keystore::pkcs12
