/**
 * @file summary.h
 * @brief JSON description of a decode result (jsoncpp)
 *
 * Output shape:
 * @code
 * {
 *   "macStatus": "VERIFIED",
 *   "warnings": [],
 *   "recordCount": 2,
 *   "records": [
 *     { "index": 0, "type": "private key (PKCS#8)", "payloadSize": 1218,
 *       "friendlyName": "alias", "localKeyId": "A766...", "keyAlgorithm": "rsaEncryption" },
 *     { "index": 1, "type": "certificate", "subjectDn": "/CN=...", "issuerDn": "/CN=...",
 *       "notBefore": "...", "notAfter": "...", "fingerprint": "...", "selfSigned": true }
 *   ]
 * }
 * @endcode
 *
 * Key and secret bytes are never included.
 */

#pragma once

#include <string>
#include <json/json.h>

#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/**
 * @brief Describe one record (type, attributes, payload size, X.509 details)
 * @param record Decoded record
 * @param index Position in the decode result
 */
Json::Value describeRecord(const Record& record, int index);

/**
 * @brief Describe a full decode result
 */
Json::Value describeRecords(const DecodeResult& result);

/**
 * @brief Serialize with two-space indentation
 */
std::string toJsonString(const Json::Value& value);

} // namespace keystore::pkcs12
