/**
 * @file summary.cpp
 * @brief JSON description of a decode result
 */

#include "keystore/pkcs12/summary.h"
#include "keystore/pkcs12/cert_ops.h"
#include "keystore/pkcs12/der.h"
#include "keystore/pkcs12/errors.h"
#include "keystore/pkcs12/oids.h"
#include "keystore/common/encoding.h"

#include <spdlog/spdlog.h>

namespace keystore::pkcs12 {

namespace {

void describeAttributes(const RecordAttributes& attributes, Json::Value& out) {
    if (attributes.friendlyName) {
        out["friendlyName"] = *attributes.friendlyName;
    }
    if (attributes.localKeyId) {
        out["localKeyId"] = common::Encoding::toHex(*attributes.localKeyId, true);
    }
    if (!attributes.other.empty()) {
        Json::Value others(Json::arrayValue);
        for (const auto& attr : attributes.other) {
            Json::Value entry;
            entry["oid"] = attr.oid;
            entry["name"] = oids::oidName(attr.oid);
            entry["valueCount"] = static_cast<int>(attr.values.size());
            others.append(entry);
        }
        out["otherAttributes"] = others;
    }
}

void describeCertificate(const Bytes& payload, Json::Value& out) {
    X509Ptr cert = parseCertificate(payload);
    if (!cert) {
        out["warning"] = "payload does not parse as an X.509 certificate";
        return;
    }
    out["subjectDn"] = getSubjectDn(cert.get());
    out["issuerDn"] = getIssuerDn(cert.get());
    out["notBefore"] = asn1TimeToIso8601(X509_get0_notBefore(cert.get()));
    out["notAfter"] = asn1TimeToIso8601(X509_get0_notAfter(cert.get()));
    out["fingerprint"] = getCertificateFingerprint(cert.get());
    out["selfSigned"] = isSelfSigned(cert.get());
    out["expired"] = isCertificateExpired(cert.get());
}

void describeCrl(const Bytes& payload, Json::Value& out) {
    X509CrlPtr crl = parseCrl(payload);
    if (!crl) {
        out["warning"] = "payload does not parse as an X.509 CRL";
        return;
    }
    out["issuerDn"] = getCrlIssuerDn(crl.get());
    out["lastUpdate"] = asn1TimeToIso8601(X509_CRL_get0_lastUpdate(crl.get()));
    const ASN1_TIME* nextUpdate = X509_CRL_get0_nextUpdate(crl.get());
    if (nextUpdate) {
        out["nextUpdate"] = asn1TimeToIso8601(nextUpdate);
    }
    STACK_OF(X509_REVOKED)* revoked = X509_CRL_get_REVOKED(crl.get());
    out["revokedCount"] = revoked ? sk_X509_REVOKED_num(revoked) : 0;
}

/// Algorithm of a PKCS#8 PrivateKeyInfo, empty if the shape does not match
std::string pkcs8Algorithm(const Bytes& pkcs8) {
    try {
        der::Reader top(pkcs8, "PrivateKeyInfo");
        der::Reader seq = top.enterSequence("PrivateKeyInfo");
        seq.readInteger("version");
        der::Reader alg = seq.enterSequence("privateKeyAlgorithm");
        return alg.readOid("algorithm");
    } catch (const StructuralException& e) {
        spdlog::debug("Summary: {}", e.what());
        return "";
    }
}

} // anonymous namespace

Json::Value describeRecord(const Record& record, int index) {
    Json::Value out;
    out["index"] = index;
    out["type"] = recordTypeToString(record.type);
    out["payloadSize"] = static_cast<Json::UInt64>(record.payload.size());
    describeAttributes(record.attributes, out);

    switch (record.type) {
        case RecordType::CERTIFICATE:
            describeCertificate(record.payload, out);
            break;
        case RecordType::CRL:
            describeCrl(record.payload, out);
            break;
        case RecordType::PRIVATE_KEY: {
            std::string algorithm = pkcs8Algorithm(record.payload);
            if (!algorithm.empty()) {
                out["keyAlgorithm"] = oids::oidName(algorithm);
            }
            break;
        }
        case RecordType::RSA_PRIVATE_KEY:
            out["keyAlgorithm"] = "rsaEncryption";
            break;
        case RecordType::EC_PRIVATE_KEY:
            out["keyAlgorithm"] = "ecPublicKey";
            break;
        case RecordType::SECRET:
            out["secretType"] = oids::oidName(record.typeOid);
            break;
        case RecordType::UNKNOWN:
            out["bagType"] = record.typeOid;
            break;
    }
    return out;
}

Json::Value describeRecords(const DecodeResult& result) {
    Json::Value out;
    out["macStatus"] = macStatusToString(result.macStatus);

    Json::Value warnings(Json::arrayValue);
    for (const auto& warning : result.warnings) {
        warnings.append(warning);
    }
    out["warnings"] = warnings;

    Json::Value records(Json::arrayValue);
    for (size_t i = 0; i < result.records.size(); ++i) {
        records.append(describeRecord(result.records[i], static_cast<int>(i)));
    }
    out["recordCount"] = static_cast<int>(result.records.size());
    out["records"] = records;
    return out;
}

std::string toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, value);
}

} // namespace keystore::pkcs12
