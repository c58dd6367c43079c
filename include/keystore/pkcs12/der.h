/**
 * @file der.h
 * @brief Minimal DER/BER element reader and DER writer
 *
 * Thin adapter over OpenSSL's primitive TLV header codec
 * (ASN1_get_object / ASN1_put_object) and its OID, INTEGER and BMPString
 * conversions. Only what the PKCS#12 structures need: no schema engine.
 *
 * Reader accepts BER input (indefinite lengths, constructed OCTET STRING).
 * Writer always produces DER.
 *
 * Every read failure throws StructuralException naming the structural layer
 * ("context") that was being decoded. No read ever goes past the buffer.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <openssl/asn1.h>

#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12::der {

/// @brief Maximum nesting depth accepted while scanning BER
constexpr int MAX_DEPTH = 64;

/**
 * @brief One parsed element (a view into the caller's buffer)
 */
struct Element {
    int tag = 0;
    int cls = V_ASN1_UNIVERSAL;        ///< V_ASN1_UNIVERSAL, V_ASN1_CONTEXT_SPECIFIC, ...
    bool constructed = false;
    bool indefinite = false;           ///< BER indefinite length
    const uint8_t* start = nullptr;    ///< First header byte
    size_t headerLength = 0;
    const uint8_t* content = nullptr;
    size_t contentLength = 0;          ///< Excludes the end-of-contents octets
    size_t totalLength = 0;            ///< Header + content (+ EOC)

    bool is(int tag_, int cls_ = V_ASN1_UNIVERSAL) const {
        return tag == tag_ && cls == cls_;
    }

    /// Complete element bytes, header included
    Bytes raw() const { return Bytes(start, start + totalLength); }

    /// Content bytes only
    Bytes contentBytes() const { return Bytes(content, content + contentLength); }
};

/**
 * @brief Sequential reader over the content of one constructed element
 */
class Reader {
public:
    Reader(const uint8_t* data, size_t length, std::string context, int depth = 0);
    Reader(const Bytes& data, std::string context);

    /// @name Position
    /// @{
    bool atEnd() const { return pos_ >= length_; }
    size_t remaining() const { return length_ - pos_; }
    const std::string& context() const { return context_; }
    /// @}

    /**
     * @brief Check the tag of the next element without consuming it
     * @return false at end of input or on a different tag
     */
    bool peek(int tag, int cls = V_ASN1_UNIVERSAL) const;

    /**
     * @brief Consume the next element, whatever its tag
     * @throws StructuralException on truncated or malformed header
     */
    Element next();

    /**
     * @brief Consume the next element and require its tag
     * @param what Field name used in the error message
     */
    Element expect(int tag, int cls, const char* what);

    /**
     * @brief Reader over the content of a constructed element
     * @param e Element previously returned by this reader (or a parent)
     * @param context Structural layer name for error messages
     */
    Reader enter(const Element& e, const std::string& context) const;

    /// @brief Consume a SEQUENCE and return a reader over its content
    Reader enterSequence(const char* what);

    /// @brief Consume an OBJECT IDENTIFIER and return its dotted form
    std::string readOid(const char* what);

    /// @brief Consume an OCTET STRING (primitive or constructed)
    Bytes readOctetString(const char* what);

    /// @brief Consume a non-negative INTEGER
    int64_t readInteger(const char* what);

    /// @brief Require that no element is left
    void expectEnd(const char* what) const;

    /// @name Element conversions
    /// @{
    std::string oidOf(const Element& e, const char* what) const;
    Bytes octetsOf(const Element& e, const char* what) const;
    int64_t integerOf(const Element& e, const char* what) const;
    /// @}

private:
    Element parseAt(size_t offset) const;
    size_t indefiniteContentLength(const uint8_t* p, size_t avail, int depth) const;
    void collectOctets(const Element& e, Bytes& out, int depth, const char* what) const;
    [[noreturn]] void fail(const std::string& message) const;

    const uint8_t* data_;
    size_t length_;
    size_t pos_ = 0;
    std::string context_;
    int depth_;
};

/// @name Writer
/// @{

/**
 * @brief Encode one DER element
 * @param tag Tag number
 * @param cls Tag class (V_ASN1_UNIVERSAL, V_ASN1_CONTEXT_SPECIFIC, ...)
 * @param constructed Constructed bit
 * @param content Content octets
 */
Bytes encode(int tag, int cls, bool constructed, const Bytes& content);

/// @brief SEQUENCE of already-encoded elements
Bytes sequence(const std::vector<Bytes>& elements);

/**
 * @brief SET OF already-encoded elements, kept in caller order
 *
 * Elements are not sorted: attribute order survives a round trip.
 */
Bytes set(const std::vector<Bytes>& elements);

/// @brief [tag] EXPLICIT wrapper
Bytes explicitTag(int tag, const Bytes& inner);

Bytes octetString(const Bytes& value);
Bytes integer(int64_t value);
Bytes oid(const std::string& dotted);
Bytes null();

/**
 * @brief BMPString from UTF-8 text
 * @throws UnsupportedException if the text has characters outside the BMP
 */
Bytes bmpString(const std::string& utf8);

/// @}

/**
 * @brief Decode BMPString content octets to UTF-8
 * @throws StructuralException on odd length or invalid code units
 */
std::string bmpToUtf8(const Bytes& content);

} // namespace keystore::pkcs12::der
