/**
 * @file test_export.cpp
 * @brief Unit tests for certificate inspection, PEM export and the JSON summary
 */

#include <gtest/gtest.h>
#include <keystore/pkcs12/cert_ops.h>
#include <keystore/pkcs12/oids.h>
#include <keystore/pkcs12/pem_export.h>
#include <keystore/pkcs12/summary.h>
#include <keystore/common/encoding.h>
#include "test_helpers.h"

#include <openssl/bio.h>
#include <openssl/pem.h>

using namespace keystore::pkcs12;
using namespace test_helpers;

namespace {

/// Read one PEM block back: {type, header, data}
struct PemBlock {
    std::string type;
    std::string header;
    Bytes data;
};

PemBlock readPem(const std::string& pem) {
    PemBlock block;
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long len = 0;
    if (PEM_read_bio(bio, &name, &header, &data, &len) == 1) {
        block.type = name;
        block.header = header;
        block.data.assign(data, data + len);
    }
    OPENSSL_free(name);
    OPENSSL_free(header);
    OPENSSL_free(data);
    BIO_free(bio);
    return block;
}

} // anonymous namespace

class ExportTest : public ::testing::Test {
protected:
    UniqueKey key_;
    UniqueCert cert_;

    void SetUp() override {
        key_ = generateEcKey();
        cert_ = createSelfSigned(key_.get(), "Export Test");
    }
};

// ============================================================================
// cert_ops
// ============================================================================

TEST_F(ExportTest, ParseCertificate) {
    Bytes der = certToDer(cert_.get());
    EXPECT_NE(parseCertificate(der), nullptr);

    Bytes trailing = der;
    trailing.push_back(0x00);
    EXPECT_EQ(parseCertificate(trailing), nullptr);
    EXPECT_EQ(parseCertificate(Bytes()), nullptr);
    EXPECT_EQ(parseCertificate(Bytes{0x30, 0x00}), nullptr);
}

TEST_F(ExportTest, ParseCrl) {
    UniqueCrl crl = createCrl(key_.get(), cert_.get());
    EXPECT_NE(parseCrl(crlToDer(crl.get())), nullptr);
    EXPECT_EQ(parseCrl(certToDer(cert_.get())), nullptr);
}

TEST_F(ExportTest, DistinguishedNames) {
    EXPECT_EQ(getSubjectDn(cert_.get()), "/CN=Export Test/O=Keystore Tests");
    EXPECT_EQ(getIssuerDn(cert_.get()), getSubjectDn(cert_.get()));
    EXPECT_EQ(getSubjectDn(nullptr), "");

    UniqueCrl crl = createCrl(key_.get(), cert_.get());
    EXPECT_EQ(getCrlIssuerDn(crl.get()), "/CN=Export Test/O=Keystore Tests");
}

TEST_F(ExportTest, SelfSignedAndExpired) {
    EXPECT_TRUE(isSelfSigned(cert_.get()));
    EXPECT_FALSE(isCertificateExpired(cert_.get()));

    auto expired = createExpiredCert(key_.get());
    EXPECT_TRUE(isCertificateExpired(expired.get()));
    EXPECT_TRUE(isCertificateExpired(nullptr));
    EXPECT_FALSE(isSelfSigned(nullptr));
}

TEST_F(ExportTest, Fingerprint) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    ASSERT_EQ(X509_digest(cert_.get(), EVP_sha256(), md, &mdLen), 1);

    std::string fp = getCertificateFingerprint(cert_.get());
    ASSERT_EQ(fp.size(), 64u);
    EXPECT_EQ(fp, keystore::common::Encoding::toHex(Bytes(md, md + mdLen)));
    EXPECT_EQ(getCertificateFingerprint(cert_.get()), fp);
    EXPECT_EQ(getCertificateFingerprint(nullptr), "");
}

TEST_F(ExportTest, Asn1TimeToIso8601) {
    ASN1_TIME* t = ASN1_TIME_new();
    ASN1_TIME_set(t, 1700000000);
    EXPECT_EQ(asn1TimeToIso8601(t), "2023-11-14T22:13:20Z");
    ASN1_TIME_free(t);
    EXPECT_EQ(asn1TimeToIso8601(nullptr), "");
}

// ============================================================================
// PEM
// ============================================================================

TEST_F(ExportTest, PemTypes) {
    EXPECT_EQ(pemTypeOf(RecordType::CERTIFICATE), "CERTIFICATE");
    EXPECT_EQ(pemTypeOf(RecordType::PRIVATE_KEY), "PRIVATE KEY");
    EXPECT_EQ(pemTypeOf(RecordType::RSA_PRIVATE_KEY), "RSA PRIVATE KEY");
    EXPECT_EQ(pemTypeOf(RecordType::EC_PRIVATE_KEY), "EC PRIVATE KEY");
    EXPECT_EQ(pemTypeOf(RecordType::CRL), "X509 CRL");
    EXPECT_EQ(pemTypeOf(RecordType::SECRET), "SECRET BAG");
    EXPECT_EQ(pemTypeOf(RecordType::UNKNOWN), "UNKNOWN BAG");
}

TEST_F(ExportTest, Pem_CertificateWithHeaders) {
    Bytes der = certToDer(cert_.get());
    std::string pem = toPem(makeRecord(RecordType::CERTIFICATE, der, "leaf", Bytes{0x0A, 0x0B}));

    EXPECT_EQ(pem.rfind("-----BEGIN CERTIFICATE-----\n", 0), 0u);
    EXPECT_NE(pem.find("friendlyName: leaf\n"), std::string::npos);
    EXPECT_NE(pem.find("localKeyId: 0A0B\n"), std::string::npos);

    PemBlock block = readPem(pem);
    EXPECT_EQ(block.type, "CERTIFICATE");
    EXPECT_EQ(block.data, der);
}

TEST_F(ExportTest, Pem_NoAttributesNoHeaders) {
    Bytes pkcs8 = keyToPkcs8(key_.get());
    std::string pem = toPem(makeRecord(RecordType::PRIVATE_KEY, pkcs8));
    EXPECT_EQ(pem.find(':'), std::string::npos);

    PemBlock block = readPem(pem);
    EXPECT_EQ(block.type, "PRIVATE KEY");
    EXPECT_TRUE(block.header.empty());
    EXPECT_EQ(block.data, pkcs8);
}

TEST_F(ExportTest, Pem_FriendlyNameCannotBreakOutOfHeader) {
    Bytes secret(16, 0x42);
    Record record = makeSecret(oids::AES128_CBC, secret,
                               "x\n\n-----END SECRET BAG-----\n-----BEGIN CERTIFICATE-----\nAAAA");
    std::string pem = toPem(record);

    EXPECT_EQ(pem.find("\n-----BEGIN CERTIFICATE"), std::string::npos);
    EXPECT_EQ(pem.find("\n-----END SECRET BAG"), pem.rfind("\n-----END SECRET BAG"));
    EXPECT_NE(pem.find("friendlyName: x\\x0A\\x0A-----END SECRET BAG-----\\x0A"),
              std::string::npos);

    PemBlock block = readPem(pem);
    EXPECT_EQ(block.type, "SECRET BAG");
    EXPECT_EQ(block.data, secret);
}

TEST_F(ExportTest, Pem_FriendlyNameEscaping) {
    Bytes der = certToDer(cert_.get());
    std::string pem = toPem(makeRecord(RecordType::CERTIFICATE, der,
                                       "caf\xC3\xA9 a\\b\rc"));
    EXPECT_NE(pem.find("friendlyName: caf\\xC3\\xA9 a\\\\b\\x0Dc\n"), std::string::npos);
    EXPECT_EQ(pem.find('\r'), std::string::npos);
    EXPECT_EQ(readPem(pem).data, der);
}

TEST_F(ExportTest, Pem_RecordsConcatenatedInOrder) {
    std::vector<Record> records{
        makeRecord(RecordType::CERTIFICATE, certToDer(cert_.get())),
        makeRecord(RecordType::EC_PRIVATE_KEY, keyToLegacy(key_.get())),
    };
    std::string pem = toPem(records);
    size_t cert = pem.find("BEGIN CERTIFICATE");
    size_t key = pem.find("BEGIN EC PRIVATE KEY");
    ASSERT_NE(cert, std::string::npos);
    ASSERT_NE(key, std::string::npos);
    EXPECT_LT(cert, key);
    EXPECT_EQ(toPem(std::vector<Record>()), "");
}

// ============================================================================
// JSON summary
// ============================================================================

TEST_F(ExportTest, Summary_Certificate) {
    Record record = makeRecord(RecordType::CERTIFICATE, certToDer(cert_.get()), "leaf",
                               Bytes{0xA7, 0x66});
    record.attributes.other.push_back({oids::ORACLE_TRUSTED_KEY_USAGE, {Bytes{0x05, 0x00}}});

    Json::Value v = describeRecord(record, 3);
    EXPECT_EQ(v["index"].asInt(), 3);
    EXPECT_EQ(v["type"].asString(), "certificate");
    EXPECT_EQ(v["payloadSize"].asUInt64(), record.payload.size());
    EXPECT_EQ(v["friendlyName"].asString(), "leaf");
    EXPECT_EQ(v["localKeyId"].asString(), "A766");
    EXPECT_EQ(v["subjectDn"].asString(), "/CN=Export Test/O=Keystore Tests");
    EXPECT_EQ(v["fingerprint"].asString(), getCertificateFingerprint(cert_.get()));
    EXPECT_TRUE(v["selfSigned"].asBool());
    EXPECT_FALSE(v["expired"].asBool());
    EXPECT_FALSE(v["notAfter"].asString().empty());
    ASSERT_EQ(v["otherAttributes"].size(), 1u);
    EXPECT_EQ(v["otherAttributes"][0]["oid"].asString(), oids::ORACLE_TRUSTED_KEY_USAGE);
    EXPECT_EQ(v["otherAttributes"][0]["valueCount"].asInt(), 1);
}

TEST_F(ExportTest, Summary_Crl) {
    UniqueCrl crl = createCrl(key_.get(), cert_.get(), {10, 11, 12});
    Json::Value v = describeRecord(makeRecord(RecordType::CRL, crlToDer(crl.get())), 0);
    EXPECT_EQ(v["type"].asString(), "CRL");
    EXPECT_EQ(v["revokedCount"].asInt(), 3);
    EXPECT_TRUE(v.isMember("nextUpdate"));
}

TEST_F(ExportTest, Summary_KeysAndSecrets) {
    Json::Value key = describeRecord(makeRecord(RecordType::PRIVATE_KEY,
                                                keyToPkcs8(key_.get())), 0);
    EXPECT_EQ(key["keyAlgorithm"].asString(), "ecPublicKey");
    EXPECT_FALSE(key.isMember("friendlyName"));

    Json::Value legacy = describeRecord(makeRecord(RecordType::RSA_PRIVATE_KEY, Bytes{1}), 1);
    EXPECT_EQ(legacy["keyAlgorithm"].asString(), "rsaEncryption");

    Json::Value secret = describeRecord(makeSecret("2.16.840.1.101.3.4.1", Bytes(16, 1)), 2);
    EXPECT_EQ(secret["type"].asString(), "secret");
    EXPECT_EQ(secret["secretType"].asString(), "AES");
}

TEST_F(ExportTest, Summary_InvalidCertificatePayload) {
    Json::Value v = describeRecord(makeRecord(RecordType::CERTIFICATE, Bytes{0x30, 0x00}), 0);
    EXPECT_TRUE(v.isMember("warning"));
    EXPECT_FALSE(v.isMember("subjectDn"));
}

TEST_F(ExportTest, Summary_DecodeResult) {
    DecodeResult result;
    result.macStatus = MacStatus::MISSING;
    result.warnings.push_back("container carries no MAC");
    result.records.push_back(makeRecord(RecordType::CERTIFICATE, certToDer(cert_.get())));

    Json::Value v = describeRecords(result);
    EXPECT_EQ(v["macStatus"].asString(), "MISSING");
    EXPECT_EQ(v["recordCount"].asInt(), 1);
    ASSERT_EQ(v["warnings"].size(), 1u);
    ASSERT_EQ(v["records"].size(), 1u);
    EXPECT_EQ(v["records"][0]["index"].asInt(), 0);

    std::string json = toJsonString(v);
    EXPECT_NE(json.find("\"macStatus\" : \"MISSING\""), std::string::npos);
    EXPECT_NE(json.find("\n  \"records\""), std::string::npos);
}
