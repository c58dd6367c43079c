/**
 * @file der.cpp
 * @brief DER/BER element reader and DER writer over OpenSSL primitives
 */

#include "keystore/pkcs12/der.h"
#include "keystore/pkcs12/errors.h"

#include <algorithm>
#include <climits>
#include <memory>
#include <openssl/asn1.h>
#include <openssl/err.h>
#include <openssl/objects.h>

namespace keystore::pkcs12::der {

namespace {

// RAII wrappers for OpenSSL ASN.1 objects
struct Asn1ObjectDeleter {
    void operator()(ASN1_OBJECT* o) const { ASN1_OBJECT_free(o); }
};
struct Asn1IntegerDeleter {
    void operator()(ASN1_INTEGER* i) const { ASN1_INTEGER_free(i); }
};
struct Asn1StringDeleter {
    void operator()(ASN1_STRING* s) const { ASN1_STRING_free(s); }
};

using Asn1ObjectPtr = std::unique_ptr<ASN1_OBJECT, Asn1ObjectDeleter>;
using Asn1IntegerPtr = std::unique_ptr<ASN1_INTEGER, Asn1IntegerDeleter>;
using Asn1StringPtr = std::unique_ptr<ASN1_STRING, Asn1StringDeleter>;

std::string describeTag(int tag, int cls) {
    if (cls == V_ASN1_CONTEXT_SPECIFIC) {
        return "[" + std::to_string(tag) + "]";
    }
    switch (tag) {
        case V_ASN1_INTEGER:      return "INTEGER";
        case V_ASN1_OCTET_STRING: return "OCTET STRING";
        case V_ASN1_NULL:         return "NULL";
        case V_ASN1_OBJECT:       return "OBJECT IDENTIFIER";
        case V_ASN1_SEQUENCE:     return "SEQUENCE";
        case V_ASN1_SET:          return "SET";
        case V_ASN1_BMPSTRING:    return "BMPString";
        default:                  return "tag " + std::to_string(tag);
    }
}

} // anonymous namespace

// --- Reader ---

Reader::Reader(const uint8_t* data, size_t length, std::string context, int depth)
    : data_(data), length_(length), context_(std::move(context)), depth_(depth) {
    if (depth_ > MAX_DEPTH) {
        fail("nesting too deep");
    }
}

Reader::Reader(const Bytes& data, std::string context)
    : Reader(data.data(), data.size(), std::move(context), 0) {}

void Reader::fail(const std::string& message) const {
    throw StructuralException(context_ + ": " + message);
}

Element Reader::parseAt(size_t offset) const {
    if (offset >= length_) {
        fail("unexpected end of data");
    }
    const size_t avail = length_ - offset;
    if (avail > static_cast<size_t>(LONG_MAX)) {
        fail("input too large");
    }

    const unsigned char* p = data_ + offset;
    long len = 0;
    int tag = 0;
    int cls = 0;
    int ret = ASN1_get_object(&p, &len, &tag, &cls, static_cast<long>(avail));
    if (ret & 0x80) {
        ERR_clear_error();
        fail("truncated or malformed element");
    }

    Element e;
    e.tag = tag;
    e.cls = cls;
    e.constructed = (ret & V_ASN1_CONSTRUCTED) != 0;
    e.start = data_ + offset;
    e.headerLength = static_cast<size_t>(p - e.start);
    e.content = p;

    if (ret == (V_ASN1_CONSTRUCTED | 1)) {
        e.indefinite = true;
        e.contentLength = indefiniteContentLength(p, avail - e.headerLength, depth_ + 1);
        e.totalLength = e.headerLength + e.contentLength + 2;
    } else {
        if (len < 0 || static_cast<size_t>(len) > avail - e.headerLength) {
            fail("element length exceeds available data");
        }
        e.contentLength = static_cast<size_t>(len);
        e.totalLength = e.headerLength + e.contentLength;
    }
    return e;
}

size_t Reader::indefiniteContentLength(const uint8_t* p, size_t avail, int depth) const {
    if (depth > MAX_DEPTH) {
        fail("nesting too deep");
    }
    Reader inner(p, avail, context_, depth);
    size_t offset = 0;
    while (true) {
        if (avail - offset < 2) {
            fail("unterminated indefinite-length element");
        }
        if (p[offset] == 0x00 && p[offset + 1] == 0x00) {
            return offset;
        }
        Element child = inner.parseAt(offset);
        offset += child.totalLength;
    }
}

bool Reader::peek(int tag, int cls) const {
    if (atEnd()) {
        return false;
    }
    Element e = parseAt(pos_);
    return e.is(tag, cls);
}

Element Reader::next() {
    Element e = parseAt(pos_);
    pos_ += e.totalLength;
    return e;
}

Element Reader::expect(int tag, int cls, const char* what) {
    if (atEnd()) {
        fail(std::string("missing ") + what);
    }
    Element e = next();
    if (!e.is(tag, cls)) {
        fail(std::string("expected ") + describeTag(tag, cls) + " for " + what +
             ", found " + describeTag(e.tag, e.cls));
    }
    return e;
}

Reader Reader::enter(const Element& e, const std::string& context) const {
    if (!e.constructed) {
        throw StructuralException(context + ": expected constructed element");
    }
    return Reader(e.content, e.contentLength, context, depth_ + 1);
}

Reader Reader::enterSequence(const char* what) {
    Element e = expect(V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL, what);
    return enter(e, context_);
}

std::string Reader::readOid(const char* what) {
    return oidOf(expect(V_ASN1_OBJECT, V_ASN1_UNIVERSAL, what), what);
}

Bytes Reader::readOctetString(const char* what) {
    return octetsOf(expect(V_ASN1_OCTET_STRING, V_ASN1_UNIVERSAL, what), what);
}

int64_t Reader::readInteger(const char* what) {
    return integerOf(expect(V_ASN1_INTEGER, V_ASN1_UNIVERSAL, what), what);
}

void Reader::expectEnd(const char* what) const {
    if (!atEnd()) {
        fail(std::string("unexpected trailing data after ") + what);
    }
}

std::string Reader::oidOf(const Element& e, const char* what) const {
    if (e.constructed || e.indefinite || e.contentLength == 0) {
        fail(std::string("malformed OBJECT IDENTIFIER for ") + what);
    }

    const unsigned char* p = e.start;
    Asn1ObjectPtr obj(d2i_ASN1_OBJECT(nullptr, &p, static_cast<long>(e.totalLength)));
    if (!obj) {
        ERR_clear_error();
        fail(std::string("malformed OBJECT IDENTIFIER for ") + what);
    }

    char buf[128];
    int n = OBJ_obj2txt(buf, sizeof(buf), obj.get(), 1);
    if (n <= 0) {
        ERR_clear_error();
        fail(std::string("malformed OBJECT IDENTIFIER for ") + what);
    }
    if (static_cast<size_t>(n) < sizeof(buf)) {
        return std::string(buf, static_cast<size_t>(n));
    }

    std::string big(static_cast<size_t>(n) + 1, '\0');
    OBJ_obj2txt(&big[0], n + 1, obj.get(), 1);
    big.resize(static_cast<size_t>(n));
    return big;
}

Bytes Reader::octetsOf(const Element& e, const char* what) const {
    Bytes out;
    collectOctets(e, out, depth_ + 1, what);
    return out;
}

void Reader::collectOctets(const Element& e, Bytes& out, int depth, const char* what) const {
    if (!e.constructed) {
        out.insert(out.end(), e.content, e.content + e.contentLength);
        return;
    }

    // BER constructed string: concatenation of primitive OCTET STRING segments
    Reader segments(e.content, e.contentLength, context_, depth);
    while (!segments.atEnd()) {
        Element seg = segments.next();
        if (!seg.is(V_ASN1_OCTET_STRING)) {
            fail(std::string("invalid segment in constructed OCTET STRING for ") + what);
        }
        collectOctets(seg, out, depth + 1, what);
    }
}

int64_t Reader::integerOf(const Element& e, const char* what) const {
    if (e.constructed || e.contentLength == 0) {
        fail(std::string("malformed INTEGER for ") + what);
    }

    const unsigned char* p = e.start;
    Asn1IntegerPtr ai(d2i_ASN1_INTEGER(nullptr, &p, static_cast<long>(e.totalLength)));
    if (!ai) {
        ERR_clear_error();
        fail(std::string("malformed INTEGER for ") + what);
    }

    int64_t value = 0;
    if (ASN1_INTEGER_get_int64(&value, ai.get()) != 1) {
        ERR_clear_error();
        fail(std::string("INTEGER out of range for ") + what);
    }
    if (value < 0) {
        fail(std::string("negative INTEGER for ") + what);
    }
    return value;
}

// --- Writer ---

Bytes encode(int tag, int cls, bool constructed, const Bytes& content) {
    if (content.size() > static_cast<size_t>(INT_MAX)) {
        throw StructuralException("element too large to encode");
    }
    const int length = static_cast<int>(content.size());
    const int total = ASN1_object_size(constructed ? 1 : 0, length, tag);
    if (total < 0) {
        ERR_clear_error();
        throw StructuralException("element too large to encode");
    }

    Bytes out(static_cast<size_t>(total));
    unsigned char* p = out.data();
    ASN1_put_object(&p, constructed ? 1 : 0, length, tag, cls);
    std::copy(content.begin(), content.end(), p);
    return out;
}

Bytes sequence(const std::vector<Bytes>& elements) {
    Bytes content;
    for (const auto& e : elements) {
        content.insert(content.end(), e.begin(), e.end());
    }
    return encode(V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL, true, content);
}

Bytes set(const std::vector<Bytes>& elements) {
    Bytes content;
    for (const auto& e : elements) {
        content.insert(content.end(), e.begin(), e.end());
    }
    return encode(V_ASN1_SET, V_ASN1_UNIVERSAL, true, content);
}

Bytes explicitTag(int tag, const Bytes& inner) {
    return encode(tag, V_ASN1_CONTEXT_SPECIFIC, true, inner);
}

Bytes octetString(const Bytes& value) {
    return encode(V_ASN1_OCTET_STRING, V_ASN1_UNIVERSAL, false, value);
}

Bytes integer(int64_t value) {
    Asn1IntegerPtr ai(ASN1_INTEGER_new());
    if (!ai || ASN1_INTEGER_set_int64(ai.get(), value) != 1) {
        ERR_clear_error();
        throw StructuralException("cannot encode INTEGER");
    }
    int len = i2d_ASN1_INTEGER(ai.get(), nullptr);
    if (len <= 0) {
        ERR_clear_error();
        throw StructuralException("cannot encode INTEGER");
    }
    Bytes out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_ASN1_INTEGER(ai.get(), &p);
    return out;
}

Bytes oid(const std::string& dotted) {
    Asn1ObjectPtr obj(OBJ_txt2obj(dotted.c_str(), 1));
    if (!obj) {
        ERR_clear_error();
        throw StructuralException("invalid OBJECT IDENTIFIER: " + dotted);
    }
    int len = i2d_ASN1_OBJECT(obj.get(), nullptr);
    if (len <= 0) {
        ERR_clear_error();
        throw StructuralException("invalid OBJECT IDENTIFIER: " + dotted);
    }
    Bytes out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_ASN1_OBJECT(obj.get(), &p);
    return out;
}

Bytes null() {
    return Bytes{0x05, 0x00};
}

Bytes bmpString(const std::string& utf8) {
    ASN1_STRING* raw = nullptr;
    int ret = ASN1_mbstring_copy(&raw, reinterpret_cast<const unsigned char*>(utf8.data()),
                                 static_cast<int>(utf8.size()), MBSTRING_UTF8, B_ASN1_BMPSTRING);
    Asn1StringPtr s(raw);
    if (ret < 0 || !s) {
        ERR_clear_error();
        throw UnsupportedException("text cannot be represented as BMPString");
    }
    const unsigned char* data = ASN1_STRING_get0_data(s.get());
    Bytes content(data, data + ASN1_STRING_length(s.get()));
    return encode(V_ASN1_BMPSTRING, V_ASN1_UNIVERSAL, false, content);
}

std::string bmpToUtf8(const Bytes& content) {
    if (content.size() % 2 != 0) {
        throw StructuralException("BMPString has odd length");
    }
    if (content.empty()) {
        return std::string();
    }

    Asn1StringPtr s(ASN1_STRING_type_new(V_ASN1_BMPSTRING));
    if (!s || ASN1_STRING_set(s.get(), content.data(), static_cast<int>(content.size())) != 1) {
        ERR_clear_error();
        throw StructuralException("cannot read BMPString");
    }

    unsigned char* out = nullptr;
    int n = ASN1_STRING_to_UTF8(&out, s.get());
    if (n < 0) {
        ERR_clear_error();
        throw StructuralException("invalid BMPString");
    }
    std::string result(reinterpret_cast<char*>(out), static_cast<size_t>(n));
    OPENSSL_free(out);
    return result;
}

} // namespace keystore::pkcs12::der
