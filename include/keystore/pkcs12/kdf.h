/**
 * @file kdf.h
 * @brief PKCS#12 password-based key derivation (RFC 7292 Appendix B)
 *
 * Also holds the password representations used by the PBE and MAC engines
 * and the cleansed buffer that carries passwords and derived keys.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <openssl/evp.h>

#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/// @brief Diversifier byte selecting what a derivation produces
enum class KeyPurpose : uint8_t {
    ENCRYPTION_KEY = 1,
    IV = 2,
    MAC_KEY = 3
};

/**
 * @brief Move-only byte buffer, cleansed on destruction
 */
class KeyMaterial {
public:
    KeyMaterial() = default;
    explicit KeyMaterial(size_t size) : bytes_(size, 0) {}
    KeyMaterial(const uint8_t* data, size_t size) : bytes_(data, data + size) {}
    ~KeyMaterial();

    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;
    KeyMaterial(KeyMaterial&& other) noexcept;
    KeyMaterial& operator=(KeyMaterial&& other) noexcept;

    uint8_t* data() { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    /// Copy out (tests and known-answer checks only)
    Bytes toBytes() const { return bytes_; }

private:
    void cleanse();

    Bytes bytes_;
};

/**
 * @brief Cleanses a plaintext buffer when the scope exits, also on throw
 *
 * A buffer moved out of before then is left empty, so nothing is cleansed.
 */
class CleanseGuard {
public:
    explicit CleanseGuard(Bytes& bytes) : bytes_(bytes) {}
    ~CleanseGuard();

    CleanseGuard(const CleanseGuard&) = delete;
    CleanseGuard& operator=(const CleanseGuard&) = delete;

private:
    Bytes& bytes_;
};

/**
 * @brief Password in both encodings used by the container
 *
 * Absent and empty are distinct: an absent password contributes no
 * password block to the derivation, an empty one contributes `00 00`.
 */
class Password {
public:
    /// @brief No password at all
    static Password absent();

    /**
     * @brief Password from UTF-8 text
     * @throws UnsupportedException if the text is not valid UTF-8
     */
    static Password fromUtf8(const std::string& utf8);

    /// @brief Password from the caller's optional text
    static Password fromOptional(const std::optional<std::string>& utf8);

    bool isAbsent() const { return absent_; }
    bool isEmpty() const { return !absent_ && utf8_.empty(); }

    /// @brief Big-endian UTF-16 plus terminating `00 00`; empty when absent
    const KeyMaterial& bmp() const { return bmp_; }

    /// @brief Raw UTF-8 bytes (PBES2); empty when absent
    const KeyMaterial& utf8() const { return utf8_; }

private:
    Password() = default;

    bool absent_ = true;
    KeyMaterial bmp_;
    KeyMaterial utf8_;
};

/**
 * @brief Derive key material per RFC 7292 Appendix B.2
 *
 * @param password BMP password bytes (with terminator), empty for an absent password
 * @param salt Salt bytes
 * @param iterations Iteration count, at least 1
 * @param purpose Diversifier
 * @param length Number of output bytes
 * @param md Digest (SHA-1 for every legacy cipher suite)
 * @return Derived bytes
 * @throws UnsupportedException if the digest cannot be used
 */
KeyMaterial deriveKey(const KeyMaterial& password,
                      const Bytes& salt,
                      int64_t iterations,
                      KeyPurpose purpose,
                      size_t length,
                      const EVP_MD* md);

} // namespace keystore::pkcs12
