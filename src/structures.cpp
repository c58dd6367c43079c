/**
 * @file structures.cpp
 * @brief PKCS#12 structural model codecs
 */

#include "keystore/pkcs12/structures.h"
#include "keystore/pkcs12/der.h"
#include "keystore/pkcs12/errors.h"
#include "keystore/pkcs12/oids.h"

#include <spdlog/spdlog.h>

namespace keystore::pkcs12 {

namespace {

void checkIterations(int64_t iterations, int64_t maxIterations, const std::string& what) {
    if (iterations < 1 || iterations > maxIterations) {
        throw StructuralException(what + ": iteration count " + std::to_string(iterations) +
                                  " outside [1, " + std::to_string(maxIterations) + "]");
    }
}

void warnTrailing(const der::Reader& r, const char* what) {
    if (!r.atEnd()) {
        spdlog::warn("{}: ignoring {} bytes of trailing fields", what, r.remaining());
    }
}

AlgorithmIdentifier decodeAlgorithm(der::Reader& r, const char* what) {
    der::Reader seq = r.enterSequence(what);
    AlgorithmIdentifier alg;
    alg.oid = seq.readOid(what);
    if (!seq.atEnd()) {
        alg.parameters = seq.next().raw();
    }
    return alg;
}

ContentInfo decodeContentInfo(der::Reader r) {
    ContentInfo ci;
    ci.contentType = r.readOid("contentType");

    if (!r.peek(0, V_ASN1_CONTEXT_SPECIFIC)) {
        throw StructuralException(r.context() + ": missing content for " +
                                  oids::oidName(ci.contentType));
    }
    der::Element wrapper = r.next();
    der::Reader inner = r.enter(wrapper, r.context());
    der::Element content = inner.next();

    if (ci.contentType == oids::DATA) {
        if (!content.is(V_ASN1_OCTET_STRING)) {
            throw StructuralException(r.context() + ": data content is not an OCTET STRING");
        }
        ci.content = inner.octetsOf(content, "data");
    } else {
        ci.content = content.raw();
    }
    return ci;
}

MacData decodeMacData(der::Reader r, int64_t maxIterations) {
    MacData mac;
    der::Reader digestInfo = r.enterSequence("DigestInfo");
    mac.digestAlgorithm = decodeAlgorithm(digestInfo, "digestAlgorithm");
    mac.digest = digestInfo.readOctetString("digest");

    mac.salt = r.readOctetString("macSalt");
    if (r.peek(V_ASN1_INTEGER)) {
        mac.iterations = r.readInteger("iterations");
    }
    checkIterations(mac.iterations, maxIterations, "MacData");
    warnTrailing(r, "MacData");
    return mac;
}

RecordAttributes decodeAttributes(const der::Reader& bag, const der::Element& set) {
    RecordAttributes attrs;
    der::Reader items = bag.enter(set, "SafeBag attributes");

    while (!items.atEnd()) {
        der::Reader attr = items.enterSequence("Attribute");
        std::string id = attr.readOid("attrId");
        der::Element valuesElem = attr.expect(V_ASN1_SET, V_ASN1_UNIVERSAL, "attrValues");
        der::Reader values = attr.enter(valuesElem, "Attribute " + oids::oidName(id));

        std::vector<der::Element> elems;
        while (!values.atEnd()) {
            elems.push_back(values.next());
        }

        if (id == oids::FRIENDLY_NAME) {
            if (attrs.friendlyName || elems.size() != 1 || !elems[0].is(V_ASN1_BMPSTRING) ||
                elems[0].constructed) {
                throw StructuralException("SafeBag: friendlyName must be a single BMPString");
            }
            attrs.friendlyName = der::bmpToUtf8(elems[0].contentBytes());
        } else if (id == oids::LOCAL_KEY_ID) {
            if (attrs.localKeyId || elems.size() != 1 || !elems[0].is(V_ASN1_OCTET_STRING)) {
                throw StructuralException("SafeBag: localKeyId must be a single OCTET STRING");
            }
            attrs.localKeyId = values.octetsOf(elems[0], "localKeyId");
        } else {
            BagAttribute other;
            other.oid = id;
            for (const auto& e : elems) {
                other.values.push_back(e.raw());
            }
            attrs.other.push_back(std::move(other));
        }
    }
    return attrs;
}

} // anonymous namespace

// --- AlgorithmIdentifier ---

Bytes encodeAlgorithm(const AlgorithmIdentifier& alg) {
    std::vector<Bytes> parts{der::oid(alg.oid)};
    if (alg.parameters) {
        parts.push_back(*alg.parameters);
    }
    return der::sequence(parts);
}

// --- PBE parameters ---

PbeParameters decodePbeParameters(const std::optional<Bytes>& parameters, int64_t maxIterations) {
    if (!parameters) {
        throw StructuralException("PBEParameter: missing");
    }
    der::Reader top(*parameters, "PBEParameter");
    der::Reader seq = top.enterSequence("PBEParameter");

    PbeParameters params;
    params.salt = seq.readOctetString("salt");
    params.iterations = seq.readInteger("iterations");
    checkIterations(params.iterations, maxIterations, "PBEParameter");
    return params;
}

Bytes encodePbeParameters(const PbeParameters& params) {
    return der::sequence({der::octetString(params.salt), der::integer(params.iterations)});
}

Pbes2Parameters decodePbes2Parameters(const std::optional<Bytes>& parameters, int64_t maxIterations) {
    if (!parameters) {
        throw StructuralException("PBES2-params: missing");
    }
    der::Reader top(*parameters, "PBES2-params");
    der::Reader seq = top.enterSequence("PBES2-params");

    AlgorithmIdentifier kdf = decodeAlgorithm(seq, "keyDerivationFunc");
    if (kdf.oid != oids::PBKDF2) {
        throw UnsupportedException("PBES2 key derivation function " + oids::oidName(kdf.oid));
    }
    AlgorithmIdentifier scheme = decodeAlgorithm(seq, "encryptionScheme");

    Pbes2Parameters params;
    params.prfOid = oids::HMAC_SHA1;
    params.cipherOid = scheme.oid;

    if (!kdf.parameters) {
        throw StructuralException("PBKDF2-params: missing");
    }
    der::Reader kdfTop(*kdf.parameters, "PBKDF2-params");
    der::Reader pbkdf2 = kdfTop.enterSequence("PBKDF2-params");
    params.salt = pbkdf2.readOctetString("salt");
    params.iterations = pbkdf2.readInteger("iterationCount");
    checkIterations(params.iterations, maxIterations, "PBKDF2-params");
    if (pbkdf2.peek(V_ASN1_INTEGER)) {
        params.keyLength = pbkdf2.readInteger("keyLength");
    }
    if (pbkdf2.peek(V_ASN1_SEQUENCE)) {
        params.prfOid = decodeAlgorithm(pbkdf2, "prf").oid;
    }

    if (!scheme.parameters) {
        throw StructuralException("PBES2-params: missing IV");
    }
    der::Reader ivTop(*scheme.parameters, "PBES2-params");
    params.iv = ivTop.readOctetString("iv");
    return params;
}

Bytes encodePbes2Parameters(const Pbes2Parameters& params) {
    std::vector<Bytes> pbkdf2{der::octetString(params.salt), der::integer(params.iterations)};
    if (params.keyLength) {
        pbkdf2.push_back(der::integer(*params.keyLength));
    }
    if (params.prfOid != oids::HMAC_SHA1) {
        pbkdf2.push_back(encodeAlgorithm({params.prfOid, der::null()}));
    }

    Bytes kdf = encodeAlgorithm({oids::PBKDF2, der::sequence(pbkdf2)});
    Bytes scheme = encodeAlgorithm({params.cipherOid, der::octetString(params.iv)});
    return der::sequence({kdf, scheme});
}

// --- PFX ---

Pfx decodePfx(const Bytes& der, int64_t maxIterations) {
    if (der.empty()) {
        throw StructuralException("PFX: empty input");
    }
    der::Reader top(der, "PFX");
    der::Reader pfx = top.enterSequence("PFX");
    if (!top.atEnd()) {
        spdlog::warn("PFX: ignoring {} bytes after the container", top.remaining());
    }

    Pfx result;
    result.version = pfx.readInteger("version");
    if (result.version != PFX_VERSION) {
        throw UnsupportedException("PFX version " + std::to_string(result.version) +
                                   " (only version 3 is supported)");
    }

    der::Element authSafeElem = pfx.expect(V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL, "authSafe");
    ContentInfo authSafe = decodeContentInfo(pfx.enter(authSafeElem, "PFX authSafe"));
    if (authSafe.contentType == oids::SIGNED_DATA) {
        throw UnsupportedException("public-key integrity mode (signedData authSafe)");
    }
    if (authSafe.contentType != oids::DATA) {
        throw UnsupportedException("authSafe content type " + oids::oidName(authSafe.contentType));
    }
    result.authSafe = std::move(authSafe.content);

    if (pfx.peek(V_ASN1_SEQUENCE)) {
        der::Element macElem = pfx.next();
        result.macData = decodeMacData(pfx.enter(macElem, "MacData"), maxIterations);
    }
    warnTrailing(pfx, "PFX");

    spdlog::debug("PFX: version {}, authSafe {} bytes, MAC {}", result.version,
                  result.authSafe.size(), result.macData ? "present" : "absent");
    return result;
}

Bytes encodePfx(const Bytes& authSafe, const std::optional<MacData>& macData) {
    std::vector<Bytes> parts{der::integer(PFX_VERSION), encodeDataContentInfo(authSafe)};

    if (macData) {
        std::vector<Bytes> mac{
            der::sequence({encodeAlgorithm(macData->digestAlgorithm),
                           der::octetString(macData->digest)}),
            der::octetString(macData->salt)};
        // iterations DEFAULT 1
        if (macData->iterations != 1) {
            mac.push_back(der::integer(macData->iterations));
        }
        parts.push_back(der::sequence(mac));
    }
    return der::sequence(parts);
}

// --- AuthenticatedSafe ---

std::vector<ContentInfo> decodeAuthenticatedSafe(const Bytes& der) {
    der::Reader top(der, "AuthenticatedSafe");
    der::Reader seq = top.enterSequence("AuthenticatedSafe");
    top.expectEnd("AuthenticatedSafe");

    std::vector<ContentInfo> blocks;
    while (!seq.atEnd()) {
        der::Element e = seq.expect(V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL, "ContentInfo");
        blocks.push_back(decodeContentInfo(seq.enter(e, "ContentInfo")));
    }
    return blocks;
}

Bytes encodeAuthenticatedSafe(const std::vector<Bytes>& contentInfos) {
    return der::sequence(contentInfos);
}

Bytes encodeDataContentInfo(const Bytes& data) {
    return der::sequence({der::oid(oids::DATA), der::explicitTag(0, der::octetString(data))});
}

Bytes encodeEncryptedDataContentInfo(const AlgorithmIdentifier& algorithm, const Bytes& ciphertext) {
    Bytes encryptedContentInfo = der::sequence({
        der::oid(oids::DATA),
        encodeAlgorithm(algorithm),
        der::encode(0, V_ASN1_CONTEXT_SPECIFIC, false, ciphertext)});
    Bytes encryptedData = der::sequence({der::integer(0), encryptedContentInfo});
    return der::sequence({der::oid(oids::ENCRYPTED_DATA), der::explicitTag(0, encryptedData)});
}

// --- EncryptedData ---

EncryptedData decodeEncryptedData(const Bytes& der) {
    der::Reader top(der, "EncryptedData");
    der::Reader seq = top.enterSequence("EncryptedData");
    seq.readInteger("version");

    der::Element eciElem = seq.expect(V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL, "encryptedContentInfo");
    der::Reader eci = seq.enter(eciElem, "EncryptedContentInfo");

    EncryptedData result;
    result.contentType = eci.readOid("contentType");
    result.algorithm = decodeAlgorithm(eci, "contentEncryptionAlgorithm");
    if (!eci.peek(0, V_ASN1_CONTEXT_SPECIFIC)) {
        throw StructuralException("EncryptedContentInfo: missing encryptedContent");
    }
    result.ciphertext = eci.octetsOf(eci.next(), "encryptedContent");
    warnTrailing(eci, "EncryptedContentInfo");
    warnTrailing(seq, "EncryptedData");
    return result;
}

// --- EncryptedPrivateKeyInfo ---

EncryptedPrivateKeyInfo decodeEncryptedPrivateKeyInfo(const Bytes& der) {
    der::Reader top(der, "EncryptedPrivateKeyInfo");
    der::Reader seq = top.enterSequence("EncryptedPrivateKeyInfo");

    EncryptedPrivateKeyInfo epki;
    epki.algorithm = decodeAlgorithm(seq, "encryptionAlgorithm");
    epki.ciphertext = seq.readOctetString("encryptedData");
    warnTrailing(seq, "EncryptedPrivateKeyInfo");
    return epki;
}

Bytes encodeEncryptedPrivateKeyInfo(const EncryptedPrivateKeyInfo& epki) {
    return der::sequence({encodeAlgorithm(epki.algorithm), der::octetString(epki.ciphertext)});
}

// --- SafeContents ---

std::vector<SafeBag> decodeSafeContents(const Bytes& der, const std::string& context) {
    der::Reader top(der, context);
    der::Reader seq = top.enterSequence("SafeContents");
    top.expectEnd("SafeContents");

    std::vector<SafeBag> bags;
    while (!seq.atEnd()) {
        der::Element bagElem = seq.expect(V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL, "SafeBag");
        der::Reader bag = seq.enter(bagElem, "SafeBag");

        SafeBag sb;
        sb.bagId = bag.readOid("bagId");

        der::Element valueElem = bag.expect(0, V_ASN1_CONTEXT_SPECIFIC, "bagValue");
        der::Reader value = bag.enter(valueElem, "SafeBag " + oids::oidName(sb.bagId));
        sb.value = value.next().raw();
        value.expectEnd("bagValue");

        if (bag.peek(V_ASN1_SET)) {
            sb.attributes = decodeAttributes(bag, bag.next());
        }
        warnTrailing(bag, "SafeBag");
        bags.push_back(std::move(sb));
    }
    return bags;
}

Bytes encodeSafeBag(const SafeBag& bag) {
    std::vector<Bytes> parts{der::oid(bag.bagId), der::explicitTag(0, bag.value)};
    Bytes attrs = encodeAttributes(bag.attributes);
    if (!attrs.empty()) {
        parts.push_back(std::move(attrs));
    }
    return der::sequence(parts);
}

Bytes encodeSafeContents(const std::vector<Bytes>& bags) {
    return der::sequence(bags);
}

// --- Attributes ---

Bytes encodeAttributes(const RecordAttributes& attributes) {
    std::vector<Bytes> items;
    if (attributes.friendlyName) {
        items.push_back(der::sequence({der::oid(oids::FRIENDLY_NAME),
                                       der::set({der::bmpString(*attributes.friendlyName)})}));
    }
    if (attributes.localKeyId) {
        items.push_back(der::sequence({der::oid(oids::LOCAL_KEY_ID),
                                       der::set({der::octetString(*attributes.localKeyId)})}));
    }
    for (const auto& other : attributes.other) {
        items.push_back(der::sequence({der::oid(other.oid), der::set(other.values)}));
    }

    if (items.empty()) {
        return Bytes();
    }
    return der::set(items);
}

} // namespace keystore::pkcs12
