/**
 * @file bag_codec.cpp
 * @brief SafeBag payload decode/encode
 */

#include "keystore/pkcs12/bag_codec.h"
#include "keystore/pkcs12/der.h"
#include "keystore/pkcs12/errors.h"
#include "keystore/pkcs12/oids.h"

#include <map>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

namespace keystore::pkcs12 {

namespace {

using BagDecoder = BagPayload (*)(const SafeBag&, const BagDecodeContext&);

/**
 * @brief Read the [0] EXPLICIT OCTET STRING of a CertBag or CRLBag
 * @return {type OID, value octets}
 */
std::pair<std::string, Bytes> decodeTypedValue(const Bytes& value, const char* context) {
    der::Reader top(value, context);
    der::Reader seq = top.enterSequence(context);
    top.expectEnd(context);

    std::string typeOid = seq.readOid("type");
    der::Element wrapper = seq.expect(0, V_ASN1_CONTEXT_SPECIFIC, "value");
    der::Reader inner = seq.enter(wrapper, context);
    Bytes octets = inner.readOctetString("value");
    return {typeOid, octets};
}

/**
 * @brief Parse decrypted bytes as PrivateKeyInfo
 *
 * Only shape is checked here. Bytes that do not even look like a
 * PrivateKeyInfo came from a wrong key.
 *
 * @return {algorithm OID, privateKey octets}
 */
std::pair<std::string, Bytes> decryptedPrivateKeyInfo(const Bytes& plaintext) {
    try {
        der::Reader top(plaintext, "PrivateKeyInfo");
        der::Reader seq = top.enterSequence("PrivateKeyInfo");
        top.expectEnd("PrivateKeyInfo");
        seq.readInteger("version");
        der::Reader alg = seq.enterSequence("privateKeyAlgorithm");
        std::string algorithm = alg.readOid("algorithm");
        Bytes key = seq.readOctetString("privateKey");
        return {algorithm, key};
    } catch (const StructuralException& e) {
        throw DecryptionException(std::string("decrypted content is not a PrivateKeyInfo (") +
                                  e.what() + ")");
    }
}


// --- Bag decoders ---

BagPayload decodeKeyBag(const SafeBag& bag, const BagDecodeContext& ctx) {
    if (ctx.validatePayloads && !ctx.keyParser.isValidPrivateKey(bag.value)) {
        throw StructuralException("KeyBag: payload is not a valid PrivateKeyInfo");
    }
    return bags::KeyPayload{bag.value};
}

BagPayload decodeShroudedKeyBag(const SafeBag& bag, const BagDecodeContext& ctx) {
    Bytes plaintext = decryptShroudedKeyBag(bag.value, ctx.password, ctx.maxIterations);
    CleanseGuard guard(plaintext);
    if (ctx.validatePayloads && !ctx.keyParser.isValidPrivateKey(plaintext)) {
        throw DecryptionException("decrypted PrivateKeyInfo does not parse");
    }
    return bags::KeyPayload{std::move(plaintext)};
}

BagPayload decodeCertBag(const SafeBag& bag, const BagDecodeContext& ctx) {
    auto [certType, payload] = decodeTypedValue(bag.value, "CertBag");
    if (certType != oids::X509_CERTIFICATE) {
        throw UnsupportedException("only X.509 certificates are supported (CertBag type " +
                                   oids::oidName(certType) + ")");
    }
    if (ctx.validatePayloads && !ctx.certificateParser.isValidCertificate(payload)) {
        throw StructuralException("CertBag: payload is not an X.509 certificate");
    }
    return bags::CertificatePayload{std::move(payload)};
}

BagPayload decodeCrlBag(const SafeBag& bag, const BagDecodeContext& ctx) {
    auto [crlType, payload] = decodeTypedValue(bag.value, "CRLBag");
    if (crlType != oids::X509_CRL) {
        throw UnsupportedException("only X.509 CRLs are supported (CRLBag type " +
                                   oids::oidName(crlType) + ")");
    }
    if (ctx.validatePayloads && !ctx.certificateParser.isValidCrl(payload)) {
        throw StructuralException("CRLBag: payload is not an X.509 CRL");
    }
    return bags::CrlPayload{std::move(payload)};
}

BagPayload decodeSecretBag(const SafeBag& bag, const BagDecodeContext& ctx) {
    der::Reader top(bag.value, "SecretBag");
    der::Reader seq = top.enterSequence("SecretBag");
    top.expectEnd("SecretBag");

    std::string typeOid = seq.readOid("secretTypeId");
    der::Element wrapper = seq.expect(0, V_ASN1_CONTEXT_SPECIFIC, "secretValue");
    der::Reader inner = seq.enter(wrapper, "SecretBag");
    der::Element value = inner.next();

    if (typeOid == oids::PKCS8_SHROUDED_KEY_BAG) {
        // Secret key entry: EncryptedPrivateKeyInfo, bare or inside an OCTET STRING
        Bytes epki = value.is(V_ASN1_OCTET_STRING) ? inner.octetsOf(value, "secretValue")
                                                   : value.raw();
        Bytes plaintext = decryptShroudedKeyBag(epki, ctx.password, ctx.maxIterations);
        CleanseGuard guard(plaintext);
        auto [algorithm, key] = decryptedPrivateKeyInfo(plaintext);
        return bags::SecretPayload{algorithm, std::move(key)};
    }

    if (value.is(V_ASN1_OCTET_STRING)) {
        return bags::SecretPayload{typeOid, inner.octetsOf(value, "secretValue")};
    }
    return bags::SecretPayload{typeOid, value.raw()};
}

BagPayload decodeSafeContentsBag(const SafeBag& bag, const BagDecodeContext&) {
    return bags::NestedPayload{decodeSafeContents(bag.value, "SafeContentsBag")};
}

// Bag type table (static initialization, never modified)
const std::map<std::string, BagDecoder> BAG_DECODERS = {
    {oids::KEY_BAG, decodeKeyBag},
    {oids::PKCS8_SHROUDED_KEY_BAG, decodeShroudedKeyBag},
    {oids::CERT_BAG, decodeCertBag},
    {oids::CRL_BAG, decodeCrlBag},
    {oids::SECRET_BAG, decodeSecretBag},
    {oids::SAFE_CONTENTS_BAG, decodeSafeContentsBag},
};

/**
 * @brief Turns a decoded payload into output records
 */
class RecordBuilder {
public:
    RecordBuilder(const SafeBag& bag, const BagDecodeContext& ctx,
                  std::vector<Record>& out, int depth)
        : bag_(bag), ctx_(ctx), out_(out), depth_(depth) {}

    void operator()(bags::KeyPayload& p) const {
        if (ctx_.keyFormat == KeyFormat::LEGACY) {
            ConvertedKey key = ctx_.keyParser.toLegacy(p.pkcs8);
            emit(key.type, std::move(key.der));
            OPENSSL_cleanse(p.pkcs8.data(), p.pkcs8.size());
        } else {
            emit(RecordType::PRIVATE_KEY, std::move(p.pkcs8));
        }
    }

    void operator()(bags::CertificatePayload& p) const {
        emit(RecordType::CERTIFICATE, std::move(p.der));
    }

    void operator()(bags::CrlPayload& p) const {
        emit(RecordType::CRL, std::move(p.der));
    }

    void operator()(bags::SecretPayload& p) const {
        emit(RecordType::SECRET, std::move(p.value), p.typeOid);
    }

    void operator()(bags::NestedPayload& p) const {
        if (!bag_.attributes.empty()) {
            spdlog::debug("SafeContentsBag: ignoring attributes of the nested bag");
        }
        decodeBags(p.bags, ctx_, out_, depth_ + 1);
    }

    void operator()(bags::OpaquePayload& p) const {
        spdlog::warn("SafeBag: passing through unrecognized bag type {}", p.bagId);
        emit(RecordType::UNKNOWN, std::move(p.value), p.bagId);
    }

private:
    void emit(RecordType type, Bytes payload, const std::string& typeOid = "") const {
        Record record;
        record.type = type;
        record.attributes = bag_.attributes;
        record.payload = std::move(payload);
        record.typeOid = typeOid;
        out_.push_back(std::move(record));
    }

    const SafeBag& bag_;
    const BagDecodeContext& ctx_;
    std::vector<Record>& out_;
    int depth_;
};

// --- Encoding helpers ---

Bytes typedValue(const char* typeOid, const Bytes& value) {
    return der::sequence({der::oid(typeOid), der::explicitTag(0, der::octetString(value))});
}

Bytes shroud(const Bytes& pkcs8, const Password& password, const BagEncodeOptions& options) {
    pbe::Encrypted enc = pbe::encrypt(options.keySuite, password, pkcs8,
                                      options.iterations, options.saltLength);
    return encodeEncryptedPrivateKeyInfo({enc.algorithm, enc.ciphertext});
}

void requireTypeOid(const Record& record) {
    if (record.typeOid.empty()) {
        throw StructuralException(recordTypeToString(record.type) + " record has no type OID");
    }
}

} // anonymous namespace

Bytes decryptShroudedKeyBag(const Bytes& epkiDer, const Password& password,
                            int64_t maxIterations) {
    EncryptedPrivateKeyInfo epki = decodeEncryptedPrivateKeyInfo(epkiDer);
    Bytes plaintext = pbe::decrypt(epki.algorithm, password, epki.ciphertext, maxIterations);
    CleanseGuard guard(plaintext);
    decryptedPrivateKeyInfo(plaintext);
    // Moved, not elided: the guard must find the buffer empty
    return std::move(plaintext);
}

BagPayload decodeBagPayload(const SafeBag& bag, const BagDecodeContext& ctx) {
    auto it = BAG_DECODERS.find(bag.bagId);
    if (it == BAG_DECODERS.end()) {
        return bags::OpaquePayload{bag.bagId, bag.value};
    }
    spdlog::debug("SafeBag: {}", oids::oidName(bag.bagId));
    return it->second(bag, ctx);
}

void decodeBags(const std::vector<SafeBag>& bags,
                const BagDecodeContext& ctx,
                std::vector<Record>& out,
                int depth) {
    if (depth > MAX_SAFE_CONTENTS_DEPTH) {
        throw StructuralException("SafeContentsBag: nesting deeper than " +
                                  std::to_string(MAX_SAFE_CONTENTS_DEPTH) + " levels");
    }
    for (const auto& bag : bags) {
        BagPayload payload = decodeBagPayload(bag, ctx);
        std::visit(RecordBuilder(bag, ctx, out, depth), payload);
    }
}

Bytes encodeRecord(const Record& record,
                   const Password& password,
                   const BagEncodeOptions& options,
                   IPrivateKeyParser& keyParser,
                   ICertificateParser& certificateParser) {
    SafeBag bag;
    bag.attributes = record.attributes;

    switch (record.type) {
        case RecordType::PRIVATE_KEY:
        case RecordType::RSA_PRIVATE_KEY:
        case RecordType::EC_PRIVATE_KEY: {
            Bytes pkcs8 = keyParser.toPkcs8(record.type, record.payload);
            if (options.shroudKeys) {
                bag.bagId = oids::PKCS8_SHROUDED_KEY_BAG;
                bag.value = shroud(pkcs8, password, options);
            } else {
                bag.bagId = oids::KEY_BAG;
                bag.value = pkcs8;
            }
            OPENSSL_cleanse(pkcs8.data(), pkcs8.size());
            break;
        }
        case RecordType::CERTIFICATE:
            if (options.validatePayloads && !certificateParser.isValidCertificate(record.payload)) {
                throw StructuralException("certificate record is not an X.509 certificate");
            }
            bag.bagId = oids::CERT_BAG;
            bag.value = typedValue(oids::X509_CERTIFICATE, record.payload);
            break;
        case RecordType::CRL:
            if (options.validatePayloads && !certificateParser.isValidCrl(record.payload)) {
                throw StructuralException("CRL record is not an X.509 CRL");
            }
            bag.bagId = oids::CRL_BAG;
            bag.value = typedValue(oids::X509_CRL, record.payload);
            break;
        case RecordType::SECRET: {
            requireTypeOid(record);
            Bytes value;
            std::string typeOid = record.typeOid;
            if (options.shroudSecrets) {
                // PrivateKeyInfo { 0, { typeOid, NULL }, secret }
                Bytes pki = der::sequence({
                    der::integer(0),
                    der::sequence({der::oid(record.typeOid), der::null()}),
                    der::octetString(record.payload)});
                value = der::octetString(shroud(pki, password, options));
                OPENSSL_cleanse(pki.data(), pki.size());
                typeOid = oids::PKCS8_SHROUDED_KEY_BAG;
            } else {
                value = der::octetString(record.payload);
            }
            bag.bagId = oids::SECRET_BAG;
            bag.value = der::sequence({der::oid(typeOid), der::explicitTag(0, value)});
            break;
        }
        case RecordType::UNKNOWN: {
            requireTypeOid(record);
            der::Reader check(record.payload, "UNKNOWN record");
            check.next();
            check.expectEnd("bag value");
            bag.bagId = record.typeOid;
            bag.value = record.payload;
            break;
        }
    }
    return encodeSafeBag(bag);
}

} // namespace keystore::pkcs12
