/**
 * @file errors.h
 * @brief Exception hierarchy for keystore decoding and encoding
 *
 * Every failure carries an ErrorKind so callers can tell a malformed file
 * from a wrong password from a tampered container.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace keystore::pkcs12 {

/// @brief Failure category
enum class ErrorKind {
    STRUCTURAL,   ///< Malformed or truncated encoding, unexpected element
    UNSUPPORTED,  ///< Recognized but unimplemented variant
    DECRYPTION,   ///< Padding or decrypted-content failure (usually wrong password)
    INTEGRITY     ///< MAC mismatch or required MAC missing
};

/// @brief Convert ErrorKind to string
inline std::string errorKindToString(ErrorKind k) {
    switch (k) {
        case ErrorKind::STRUCTURAL:  return "STRUCTURAL";
        case ErrorKind::UNSUPPORTED: return "UNSUPPORTED";
        case ErrorKind::DECRYPTION:  return "DECRYPTION";
        case ErrorKind::INTEGRITY:   return "INTEGRITY";
    }
    return "UNKNOWN";
}

/**
 * @brief Base exception for all keystore errors
 */
class Pkcs12Exception : public std::runtime_error {
public:
    Pkcs12Exception(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Malformed encoding at some structural layer
 */
class StructuralException : public Pkcs12Exception {
public:
    explicit StructuralException(const std::string& message)
        : Pkcs12Exception(ErrorKind::STRUCTURAL, "Structural error: " + message) {}
};

/**
 * @brief Algorithm, version or bag variant that is not implemented
 */
class UnsupportedException : public Pkcs12Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Pkcs12Exception(ErrorKind::UNSUPPORTED, "Not implemented: " + message) {}
};

/**
 * @brief Decryption failed integrity checks (bad padding, unparseable plaintext)
 */
class DecryptionException : public Pkcs12Exception {
public:
    explicit DecryptionException(const std::string& message)
        : Pkcs12Exception(ErrorKind::DECRYPTION, "Decryption error: " + message) {}
};

/**
 * @brief MAC verification failed or a required MAC is missing
 */
class IntegrityException : public Pkcs12Exception {
public:
    explicit IntegrityException(const std::string& message)
        : Pkcs12Exception(ErrorKind::INTEGRITY, "Integrity error: " + message) {}
};

} // namespace keystore::pkcs12
