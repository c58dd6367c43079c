/**
 * @file pem_export.cpp
 * @brief PEM rendering of decoded records
 */

#include "keystore/pkcs12/pem_export.h"
#include "keystore/common/encoding.h"

#include <memory>
#include <stdexcept>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/pem.h>

namespace keystore::pkcs12 {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

/**
 * @brief Keep a header value on one printable line
 *
 * Bytes outside printable ASCII become \xHH and a backslash becomes \\,
 * so a name cannot end the header line or the PEM block.
 */
std::string escapeHeaderValue(const std::string& value) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string escaped;
    escaped.reserve(value.size());
    for (unsigned char c : value) {
        if (c == '\\') {
            escaped += "\\\\";
        } else if (c >= 0x20 && c <= 0x7E) {
            escaped += static_cast<char>(c);
        } else {
            escaped += "\\x";
            escaped += HEX[c >> 4];
            escaped += HEX[c & 0x0F];
        }
    }
    return escaped;
}

std::string headersOf(const RecordAttributes& attributes) {
    std::string headers;
    if (attributes.friendlyName) {
        headers += "friendlyName: " + escapeHeaderValue(*attributes.friendlyName) + "\n";
    }
    if (attributes.localKeyId) {
        headers += "localKeyId: " + common::Encoding::toHex(*attributes.localKeyId, true) + "\n";
    }
    return headers;
}

} // anonymous namespace

std::string pemTypeOf(RecordType type) {
    switch (type) {
        case RecordType::CERTIFICATE:     return "CERTIFICATE";
        case RecordType::PRIVATE_KEY:     return "PRIVATE KEY";
        case RecordType::RSA_PRIVATE_KEY: return "RSA PRIVATE KEY";
        case RecordType::EC_PRIVATE_KEY:  return "EC PRIVATE KEY";
        case RecordType::SECRET:          return "SECRET BAG";
        case RecordType::CRL:             return "X509 CRL";
        case RecordType::UNKNOWN:         return "UNKNOWN BAG";
    }
    return "UNKNOWN BAG";
}

std::string toPem(const Record& record) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw std::runtime_error("PEM export: BIO allocation failed");
    }

    std::string type = pemTypeOf(record.type);
    std::string headers = headersOf(record.attributes);
    int written = PEM_write_bio(bio.get(), type.c_str(), headers.c_str(),
                                record.payload.data(), static_cast<long>(record.payload.size()));
    if (written <= 0) {
        ERR_clear_error();
        throw std::runtime_error("PEM export: failed to write " + type);
    }

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(bio.get(), &buffer);
    return std::string(buffer->data, buffer->length);
}

std::string toPem(const std::vector<Record>& records) {
    std::string out;
    for (const auto& record : records) {
        out += toPem(record);
    }
    return out;
}

} // namespace keystore::pkcs12
