/**
 * @file encoding.h
 * @brief Base64 and hex conversions (OpenSSL BIO based)
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace keystore::common {

/**
 * @brief Binary-to-text encodings used by fixtures, summaries and the tool
 */
class Encoding {
public:
    /**
     * @brief Encode binary data to single-line Base64
     */
    static std::string toBase64(const std::vector<uint8_t>& data) {
        if (data.empty()) {
            return "";
        }

        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new(BIO_s_mem());
        b64 = BIO_push(b64, mem);

        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        BIO_write(b64, data.data(), static_cast<int>(data.size()));
        BIO_flush(b64);

        BUF_MEM* bufferPtr;
        BIO_get_mem_ptr(b64, &bufferPtr);

        std::string result(bufferPtr->data, bufferPtr->length);
        BIO_free_all(b64);

        return result;
    }

    /**
     * @brief Decode Base64, ignoring whitespace and line breaks
     * @throws std::runtime_error on invalid input
     */
    static std::vector<uint8_t> fromBase64(const std::string& encoded) {
        std::string compact;
        compact.reserve(encoded.size());
        for (char c : encoded) {
            if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
                compact.push_back(c);
            }
        }
        if (compact.empty()) {
            return {};
        }

        if (compact.size() % 4 != 0 || compact.size() > 0x7fffffff) {
            throw std::runtime_error("Base64 decoding failed");
        }

        std::vector<uint8_t> result((compact.length() / 4) * 3);
        int decoded = EVP_DecodeBlock(result.data(),
                                      reinterpret_cast<const unsigned char*>(compact.data()),
                                      static_cast<int>(compact.size()));
        if (decoded < 0) {
            throw std::runtime_error("Base64 decoding failed");
        }

        // EVP_DecodeBlock counts padding as zero bytes
        size_t padding = 0;
        if (compact[compact.size() - 1] == '=') padding++;
        if (compact[compact.size() - 2] == '=') padding++;
        result.resize(static_cast<size_t>(decoded) - padding);
        return result;
    }

    /**
     * @brief Convert binary data to hex
     * @param upper Upper-case digits (PEM headers) instead of lower-case (fingerprints)
     */
    static std::string toHex(const std::vector<uint8_t>& data, bool upper = false) {
        const char* hexChars = upper ? "0123456789ABCDEF" : "0123456789abcdef";
        std::string result;
        result.reserve(data.size() * 2);

        for (uint8_t byte : data) {
            result.push_back(hexChars[(byte >> 4) & 0x0F]);
            result.push_back(hexChars[byte & 0x0F]);
        }

        return result;
    }

    /**
     * @brief Convert hex to binary data (either case)
     * @throws std::runtime_error on odd length or non-hex characters
     */
    static std::vector<uint8_t> fromHex(const std::string& hex) {
        if (hex.length() % 2 != 0) {
            throw std::runtime_error("Invalid hex string length");
        }

        std::vector<uint8_t> result;
        result.reserve(hex.length() / 2);

        for (size_t i = 0; i < hex.length(); i += 2) {
            uint8_t byte = 0;
            for (int j = 0; j < 2; ++j) {
                char c = hex[i + j];
                byte <<= 4;
                if (c >= '0' && c <= '9') {
                    byte |= (c - '0');
                } else if (c >= 'a' && c <= 'f') {
                    byte |= (c - 'a' + 10);
                } else if (c >= 'A' && c <= 'F') {
                    byte |= (c - 'A' + 10);
                } else {
                    throw std::runtime_error("Invalid hex character");
                }
            }
            result.push_back(byte);
        }

        return result;
    }
};

} // namespace keystore::common
