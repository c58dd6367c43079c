/**
 * @file kdf.cpp
 * @brief PKCS#12 key derivation and password encodings
 */

#include "keystore/pkcs12/kdf.h"
#include "keystore/pkcs12/errors.h"

#include <algorithm>
#include <memory>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/pkcs12.h>

namespace keystore::pkcs12 {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Repeat src into a buffer of v * ceil(len/v) bytes
void fillBlocks(const uint8_t* src, size_t len, size_t v, KeyMaterial& out, size_t offset) {
    size_t blocks = (len + v - 1) / v;
    for (size_t i = 0; i < blocks * v; i++) {
        out.data()[offset + i] = src[i % len];
    }
}

size_t paddedLength(size_t len, size_t v) {
    return len == 0 ? 0 : v * ((len + v - 1) / v);
}

} // anonymous namespace

// --- KeyMaterial ---

KeyMaterial::~KeyMaterial() {
    cleanse();
}

KeyMaterial::KeyMaterial(KeyMaterial&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

KeyMaterial& KeyMaterial::operator=(KeyMaterial&& other) noexcept {
    if (this != &other) {
        cleanse();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

void KeyMaterial::cleanse() {
    if (!bytes_.empty()) {
        OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }
}

CleanseGuard::~CleanseGuard() {
    if (!bytes_.empty()) {
        OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }
}

// --- Password ---

Password Password::absent() {
    return Password();
}

Password Password::fromUtf8(const std::string& utf8) {
    Password p;
    p.absent_ = false;
    p.utf8_ = KeyMaterial(reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size());

    unsigned char* uni = nullptr;
    int uniLen = 0;
    if (!OPENSSL_utf82uni(utf8.c_str(), static_cast<int>(utf8.size()), &uni, &uniLen)) {
        ERR_clear_error();
        throw UnsupportedException("password is not valid UTF-8");
    }
    p.bmp_ = KeyMaterial(uni, static_cast<size_t>(uniLen));
    OPENSSL_clear_free(uni, static_cast<size_t>(uniLen));
    return p;
}

Password Password::fromOptional(const std::optional<std::string>& utf8) {
    return utf8 ? fromUtf8(*utf8) : absent();
}

// --- Derivation ---

KeyMaterial deriveKey(const KeyMaterial& password,
                      const Bytes& salt,
                      int64_t iterations,
                      KeyPurpose purpose,
                      size_t length,
                      const EVP_MD* md) {
    if (iterations < 1) {
        throw StructuralException("key derivation: iteration count must be positive");
    }
    const int mdSize = EVP_MD_get_size(md);
    const int blockSize = EVP_MD_get_block_size(md);
    if (mdSize <= 0 || blockSize <= 0) {
        throw UnsupportedException("key derivation: unusable digest");
    }
    const size_t u = static_cast<size_t>(mdSize);
    const size_t v = static_cast<size_t>(blockSize);

    // D: v copies of the purpose byte
    Bytes d(v, static_cast<uint8_t>(purpose));

    // I = S || P
    const size_t sLen = paddedLength(salt.size(), v);
    const size_t pLen = paddedLength(password.size(), v);
    KeyMaterial i(sLen + pLen);
    if (sLen > 0) {
        fillBlocks(salt.data(), salt.size(), v, i, 0);
    }
    if (pLen > 0) {
        fillBlocks(password.data(), password.size(), v, i, sLen);
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw UnsupportedException("key derivation: cannot allocate digest context");
    }

    KeyMaterial out(length);
    KeyMaterial a(u);
    KeyMaterial b(v);
    size_t produced = 0;

    while (true) {
        if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), d.data(), d.size()) != 1 ||
            EVP_DigestUpdate(ctx.get(), i.data(), i.size()) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), a.data(), nullptr) != 1) {
            ERR_clear_error();
            throw UnsupportedException("key derivation: digest failed");
        }
        for (int64_t n = 1; n < iterations; n++) {
            if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
                EVP_DigestUpdate(ctx.get(), a.data(), u) != 1 ||
                EVP_DigestFinal_ex(ctx.get(), a.data(), nullptr) != 1) {
                ERR_clear_error();
                throw UnsupportedException("key derivation: digest failed");
            }
        }

        size_t take = std::min(u, length - produced);
        std::copy(a.data(), a.data() + take, out.data() + produced);
        produced += take;
        if (produced >= length) {
            break;
        }

        // B: A repeated to v bytes; each v-byte block of I becomes (I_j + B + 1) mod 2^(8v)
        for (size_t j = 0; j < v; j++) {
            b.data()[j] = a.data()[j % u];
        }
        for (size_t blk = 0; blk < i.size(); blk += v) {
            unsigned int carry = 1;
            for (size_t k = v; k-- > 0;) {
                carry += static_cast<unsigned int>(i.data()[blk + k]) + b.data()[k];
                i.data()[blk + k] = static_cast<uint8_t>(carry & 0xff);
                carry >>= 8;
            }
        }
    }
    return out;
}

} // namespace keystore::pkcs12
