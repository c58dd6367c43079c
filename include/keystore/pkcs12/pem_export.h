/**
 * @file pem_export.h
 * @brief PEM rendering of decoded records
 *
 * | Record type     | PEM type          |
 * |-----------------|-------------------|
 * | CERTIFICATE     | CERTIFICATE       |
 * | PRIVATE_KEY     | PRIVATE KEY       |
 * | RSA_PRIVATE_KEY | RSA PRIVATE KEY   |
 * | EC_PRIVATE_KEY  | EC PRIVATE KEY    |
 * | SECRET          | SECRET BAG        |
 * | CRL             | X509 CRL          |
 * | UNKNOWN         | UNKNOWN BAG       |
 *
 * friendlyName and localKeyId (upper-case hex) are written as PEM headers.
 * friendlyName is escaped to printable ASCII (\xHH, \\) on a single line.
 */

#pragma once

#include <string>
#include <vector>

#include "keystore/pkcs12/types.h"

namespace keystore::pkcs12 {

/// @brief PEM type label of a record type
std::string pemTypeOf(RecordType type);

/**
 * @brief Render one record as a PEM block
 * @throws std::runtime_error if OpenSSL cannot write the block
 */
std::string toPem(const Record& record);

/**
 * @brief Render records as consecutive PEM blocks, in order
 */
std::string toPem(const std::vector<Record>& records);

} // namespace keystore::pkcs12
