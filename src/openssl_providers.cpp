/**
 * @file openssl_providers.cpp
 * @brief OpenSSL-backed payload parsers
 */

#include "keystore/pkcs12/openssl_providers.h"
#include "keystore/pkcs12/errors.h"

#include <climits>
#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace keystore::pkcs12 {

namespace {

struct Pkcs8Deleter {
    void operator()(PKCS8_PRIV_KEY_INFO* p) const { PKCS8_PRIV_KEY_INFO_free(p); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); }
};
struct X509Deleter {
    void operator()(X509* x) const { X509_free(x); }
};
struct CrlDeleter {
    void operator()(X509_CRL* c) const { X509_CRL_free(c); }
};

using Pkcs8Ptr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, Pkcs8Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using CrlPtr = std::unique_ptr<X509_CRL, CrlDeleter>;

bool sizeOk(const Bytes& der) {
    return !der.empty() && der.size() <= static_cast<size_t>(LONG_MAX);
}

PkeyPtr parsePkcs8(const Bytes& der) {
    if (!sizeOk(der)) return nullptr;

    const unsigned char* p = der.data();
    Pkcs8Ptr p8(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, static_cast<long>(der.size())));
    if (!p8 || p != der.data() + der.size()) {
        ERR_clear_error();
        return nullptr;
    }

    PkeyPtr pkey(EVP_PKCS82PKEY(p8.get()));
    if (!pkey) {
        ERR_clear_error();
    }
    return pkey;
}

PkeyPtr parseTraditional(int type, const Bytes& der) {
    if (!sizeOk(der)) return nullptr;

    const unsigned char* p = der.data();
    PkeyPtr pkey(d2i_PrivateKey(type, nullptr, &p, static_cast<long>(der.size())));
    if (!pkey || p != der.data() + der.size()) {
        ERR_clear_error();
        return nullptr;
    }
    return pkey;
}

Bytes encodePkcs8(EVP_PKEY* pkey) {
    Pkcs8Ptr p8(EVP_PKEY2PKCS8(pkey));
    if (!p8) {
        ERR_clear_error();
        throw StructuralException("PrivateKeyInfo: cannot convert key to PKCS#8");
    }

    int len = i2d_PKCS8_PRIV_KEY_INFO(p8.get(), nullptr);
    if (len <= 0) {
        ERR_clear_error();
        throw StructuralException("PrivateKeyInfo: cannot encode key");
    }
    Bytes out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_PKCS8_PRIV_KEY_INFO(p8.get(), &p);
    return out;
}

} // anonymous namespace

// --- OpenSslPrivateKeyParser ---

bool OpenSslPrivateKeyParser::isValidPrivateKey(const Bytes& pkcs8) {
    return parsePkcs8(pkcs8) != nullptr;
}

ConvertedKey OpenSslPrivateKeyParser::toLegacy(const Bytes& pkcs8) {
    PkeyPtr pkey = parsePkcs8(pkcs8);
    if (!pkey) {
        throw StructuralException("PrivateKeyInfo: key does not parse");
    }

    ConvertedKey result;
    switch (EVP_PKEY_get_base_id(pkey.get())) {
        case EVP_PKEY_RSA:
            result.type = RecordType::RSA_PRIVATE_KEY;
            break;
        case EVP_PKEY_EC:
            result.type = RecordType::EC_PRIVATE_KEY;
            break;
        default:
            result.type = RecordType::PRIVATE_KEY;
            result.der = pkcs8;
            return result;
    }

    // i2d_PrivateKey writes PKCS#1 for RSA and SEC1 for EC
    unsigned char* out = nullptr;
    int len = i2d_PrivateKey(pkey.get(), &out);
    if (len <= 0) {
        ERR_clear_error();
        throw StructuralException("PrivateKeyInfo: cannot encode traditional key");
    }
    result.der.assign(out, out + len);
    OPENSSL_clear_free(out, static_cast<size_t>(len));
    return result;
}

Bytes OpenSslPrivateKeyParser::toPkcs8(RecordType type, const Bytes& der) {
    PkeyPtr pkey;
    switch (type) {
        case RecordType::PRIVATE_KEY:
            if (!isValidPrivateKey(der)) {
                throw StructuralException("PrivateKeyInfo: key does not parse");
            }
            return der;
        case RecordType::RSA_PRIVATE_KEY:
            pkey = parseTraditional(EVP_PKEY_RSA, der);
            if (!pkey) {
                throw StructuralException("RSAPrivateKey: key does not parse");
            }
            break;
        case RecordType::EC_PRIVATE_KEY:
            pkey = parseTraditional(EVP_PKEY_EC, der);
            if (!pkey) {
                throw StructuralException("ECPrivateKey: key does not parse");
            }
            break;
        default:
            throw UnsupportedException("record type " + recordTypeToString(type) +
                                       " is not a private key");
    }
    return encodePkcs8(pkey.get());
}

// --- OpenSslCertificateParser ---

bool OpenSslCertificateParser::isValidCertificate(const Bytes& der) {
    if (!sizeOk(der)) return false;

    const unsigned char* p = der.data();
    X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
    if (!cert || p != der.data() + der.size()) {
        ERR_clear_error();
        return false;
    }
    return true;
}

bool OpenSslCertificateParser::isValidCrl(const Bytes& der) {
    if (!sizeOk(der)) return false;

    const unsigned char* p = der.data();
    CrlPtr crl(d2i_X509_CRL(nullptr, &p, static_cast<long>(der.size())));
    if (!crl || p != der.data() + der.size()) {
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace keystore::pkcs12
