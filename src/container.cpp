/**
 * @file container.cpp
 * @brief PKCS#12 container orchestration
 */

#include "keystore/pkcs12/container.h"
#include "keystore/pkcs12/bag_codec.h"
#include "keystore/pkcs12/errors.h"
#include "keystore/pkcs12/oids.h"
#include "keystore/pkcs12/openssl_providers.h"
#include "keystore/common/config_manager.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <iterator>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

namespace keystore::pkcs12 {

namespace {

IPrivateKeyParser& keyParserOrDefault(IPrivateKeyParser* parser) {
    static OpenSslPrivateKeyParser defaultParser;
    return parser ? *parser : defaultParser;
}

ICertificateParser& certificateParserOrDefault(ICertificateParser* parser) {
    static OpenSslCertificateParser defaultParser;
    return parser ? *parser : defaultParser;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// --- Integrity ---

/**
 * @brief Outcome of the MAC step
 *
 * usedAlternate is set when the MAC verified only with the other of the
 * empty / absent password variants; that variant then decrypts the bags.
 */
struct MacCheck {
    MacStatus status = MacStatus::MISSING;
    bool usedAlternate = false;
};

Password alternatePassword(const Password& password) {
    return password.isAbsent() ? Password::fromUtf8("") : Password::absent();
}

/**
 * @brief Try the password on the first protected item of the container
 *
 * Items are tried in container order: an encryptedData block, or the first
 * pkcs8ShroudedKeyBag of a data block. Items that cannot be read or use an
 * unavailable cipher are skipped.
 *
 * @return true if the item decrypted, false if it did not,
 *         std::nullopt if there was nothing to try
 */
std::optional<bool> passwordDecrypts(const Pfx& pfx, const Password& password,
                                     int64_t maxIterations) {
    std::vector<ContentInfo> blocks;
    try {
        blocks = decodeAuthenticatedSafe(pfx.authSafe);
    } catch (const StructuralException& e) {
        spdlog::debug("MAC failure check: {}", e.what());
        return std::nullopt;
    }

    for (size_t i = 0; i < blocks.size(); ++i) {
        try {
            if (blocks[i].contentType == oids::ENCRYPTED_DATA) {
                EncryptedData encrypted = decodeEncryptedData(blocks[i].content);
                Bytes plaintext = pbe::decrypt(encrypted.algorithm, password,
                                               encrypted.ciphertext, maxIterations);
                CleanseGuard guard(plaintext);
                try {
                    decodeSafeContents(plaintext, "SafeContents");
                } catch (const StructuralException&) {
                    return false;
                }
                return true;
            }
            if (blocks[i].contentType == oids::DATA) {
                for (const auto& bag : decodeSafeContents(blocks[i].content, "SafeContents")) {
                    if (bag.bagId == oids::PKCS8_SHROUDED_KEY_BAG) {
                        Bytes plaintext = decryptShroudedKeyBag(bag.value, password, maxIterations);
                        CleanseGuard guard(plaintext);
                        return true;
                    }
                }
            }
        } catch (const DecryptionException&) {
            return false;
        } catch (const StructuralException& e) {
            spdlog::debug("MAC failure check: skipping block {} ({})", i, e.what());
        } catch (const UnsupportedException& e) {
            spdlog::debug("MAC failure check: skipping block {} ({})", i, e.what());
        }
    }
    return std::nullopt;
}

MacCheck checkMac(const Pfx& pfx, const Password& password, MacPolicy policy,
                  int64_t maxIterations, std::vector<std::string>& warnings) {
    MacCheck check;

    if (!pfx.macData) {
        if (policy == MacPolicy::REQUIRE) {
            throw IntegrityException("container carries no MAC");
        }
        warnings.push_back("container carries no MAC; contents are not authenticated");
        spdlog::warn("PFX: no MacData, contents are not authenticated");
        return check;
    }

    const MacData& macData = *pfx.macData;
    spdlog::debug("MacData: digest={}, iterations={}",
                  oids::oidName(macData.digestAlgorithm.oid), macData.iterations);

    if (mac::verify(macData, password, pfx.authSafe)) {
        check.status = MacStatus::VERIFIED;
        return check;
    }

    if (password.isAbsent() || password.isEmpty()) {
        if (mac::verify(macData, alternatePassword(password), pfx.authSafe)) {
            spdlog::debug("MacData: verified with the {} password variant",
                          password.isAbsent() ? "empty" : "absent");
            check.status = MacStatus::VERIFIED;
            check.usedAlternate = true;
            return check;
        }
    }

    if (policy != MacPolicy::LENIENT) {
        // A password that decrypts nothing is wrong; one that decrypts means tampering
        std::optional<bool> decrypts = passwordDecrypts(pfx, password, maxIterations);
        if (decrypts == false && (password.isAbsent() || password.isEmpty())) {
            decrypts = passwordDecrypts(pfx, alternatePassword(password), maxIterations);
        }
        if (decrypts == false) {
            throw DecryptionException(
                "wrong password (MAC does not verify and contents do not decrypt)");
        }
        throw IntegrityException("MAC verification failed (container modified after it was sealed)");
    }
    warnings.push_back("MAC verification failed; contents are not authenticated");
    spdlog::warn("PFX: MAC verification failed, continuing under lenient policy");
    check.status = MacStatus::FAILED;
    return check;
}

// --- Blocks ---

/**
 * @brief Cleanses bag values on scope exit
 *
 * Records own copies of their payloads; the bag values may still hold
 * plain keyBag keys.
 */
class BagValuesGuard {
public:
    explicit BagValuesGuard(std::vector<SafeBag>& bags) : bags_(bags) {}
    ~BagValuesGuard() {
        for (auto& bag : bags_) {
            OPENSSL_cleanse(bag.value.data(), bag.value.size());
        }
    }

    BagValuesGuard(const BagValuesGuard&) = delete;
    BagValuesGuard& operator=(const BagValuesGuard&) = delete;

private:
    std::vector<SafeBag>& bags_;
};

/**
 * @brief Decode one AuthenticatedSafe block into records
 */
std::vector<Record> decodeBlock(const ContentInfo& block, size_t index,
                                const BagDecodeContext& ctx) {
    std::vector<SafeBag> bags;
    BagValuesGuard bagsGuard(bags);
    std::string context = "SafeContents[" + std::to_string(index) + "]";

    if (block.contentType == oids::DATA) {
        spdlog::debug("AuthenticatedSafe[{}]: data ({} bytes)", index, block.content.size());
        bags = decodeSafeContents(block.content, context);
    } else if (block.contentType == oids::ENCRYPTED_DATA) {
        EncryptedData encrypted = decodeEncryptedData(block.content);
        spdlog::debug("AuthenticatedSafe[{}]: encryptedData, {}",
                      index, oids::oidName(encrypted.algorithm.oid));
        Bytes plaintext = pbe::decrypt(encrypted.algorithm, ctx.password,
                                       encrypted.ciphertext, ctx.maxIterations);
        CleanseGuard guard(plaintext);
        try {
            bags = decodeSafeContents(plaintext, context);
        } catch (const StructuralException& e) {
            throw DecryptionException("decrypted block " + std::to_string(index) +
                                      " is not SafeContents (" + e.what() + ")");
        }
    } else {
        throw UnsupportedException("AuthenticatedSafe: content type " +
                                   oids::oidName(block.contentType));
    }

    std::vector<Record> records;
    decodeBags(bags, ctx, records);
    return records;
}

std::vector<std::vector<Record>> decodeBlocksParallel(const std::vector<ContentInfo>& blocks,
                                                      const BagDecodeContext& ctx,
                                                      unsigned int workers) {
    std::vector<std::vector<Record>> results(blocks.size());

    for (size_t start = 0; start < blocks.size(); start += workers) {
        size_t end = std::min(blocks.size(), start + workers);
        std::vector<std::future<std::vector<Record>>> futures;
        for (size_t i = start; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, [&blocks, &ctx, i]() {
                return decodeBlock(blocks[i], i, ctx);
            }));
        }
        // get() in block order: the first failing block's error is the one rethrown
        for (size_t i = start; i < end; ++i) {
            results[i] = futures[i - start].get();
        }
    }
    return results;
}

/// Records of one block on encode
struct BlockPlan {
    bool certificates = false;
    std::vector<const Record*> records;
};

std::vector<BlockPlan> planBlocks(const std::vector<Record>& records) {
    std::vector<BlockPlan> plans;
    for (const auto& record : records) {
        bool cert = record.type == RecordType::CERTIFICATE || record.type == RecordType::CRL;
        if (plans.empty() || plans.back().certificates != cert) {
            BlockPlan plan;
            plan.certificates = cert;
            plans.push_back(plan);
        }
        plans.back().records.push_back(&record);
    }
    return plans;
}

} // anonymous namespace

// --- Options ---

DecodeOptions DecodeOptions::fromConfig(const common::ConfigManager& config) {
    DecodeOptions options;

    std::string policy = toLower(config.getString(common::ConfigManager::MAC_POLICY, "strict"));
    if (policy == "strict") {
        options.macPolicy = MacPolicy::STRICT;
    } else if (policy == "lenient") {
        options.macPolicy = MacPolicy::LENIENT;
    } else if (policy == "require") {
        options.macPolicy = MacPolicy::REQUIRE;
    } else {
        spdlog::warn("Invalid {} '{}' (using default: strict)",
                     common::ConfigManager::MAC_POLICY, policy);
    }

    std::string format = toLower(config.getString(common::ConfigManager::KEY_FORMAT, "pkcs8"));
    if (format == "pkcs8") {
        options.keyFormat = KeyFormat::PKCS8;
    } else if (format == "legacy") {
        options.keyFormat = KeyFormat::LEGACY;
    } else {
        spdlog::warn("Invalid {} '{}' (using default: pkcs8)",
                     common::ConfigManager::KEY_FORMAT, format);
    }

    int64_t maxIterations = config.getInt(common::ConfigManager::MAX_ITERATIONS,
                                          DEFAULT_MAX_ITERATIONS);
    if (maxIterations >= 1) {
        options.maxIterations = maxIterations;
    } else {
        spdlog::warn("Invalid {} {} (using default: {})", common::ConfigManager::MAX_ITERATIONS,
                     maxIterations, DEFAULT_MAX_ITERATIONS);
    }

    options.validatePayloads = config.getBool(common::ConfigManager::VALIDATE_PAYLOADS, true);

    int64_t workers = config.getInt(common::ConfigManager::WORKER_THREADS, 1);
    if (workers >= 1 && workers <= 64) {
        options.workerThreads = static_cast<unsigned int>(workers);
    } else {
        spdlog::warn("Invalid {} {} (using default: 1)",
                     common::ConfigManager::WORKER_THREADS, workers);
    }

    return options;
}

EncodeOptions EncodeOptions::fromConfig(const common::ConfigManager& config) {
    EncodeOptions options;
    options.validatePayloads = config.getBool(common::ConfigManager::VALIDATE_PAYLOADS, true);

    int64_t iterations = config.getInt(common::ConfigManager::ENCODE_ITERATIONS,
                                       pbe::DEFAULT_ITERATIONS);
    if (iterations >= 1) {
        options.iterations = iterations;
    } else {
        spdlog::warn("Invalid {} {} (using default: {})", common::ConfigManager::ENCODE_ITERATIONS,
                     iterations, pbe::DEFAULT_ITERATIONS);
    }

    int64_t macIterations = config.getInt(common::ConfigManager::MAC_ITERATIONS,
                                          mac::DEFAULT_ITERATIONS);
    if (macIterations >= 1) {
        options.macIterations = macIterations;
    } else {
        spdlog::warn("Invalid {} {} (using default: {})", common::ConfigManager::MAC_ITERATIONS,
                     macIterations, mac::DEFAULT_ITERATIONS);
    }

    return options;
}

// --- Decode ---

DecodeResult decode(const Bytes& data,
                    const std::optional<std::string>& password,
                    const DecodeOptions& options) {
    auto startTime = std::chrono::steady_clock::now();
    DecodeResult result;

    Pfx pfx = decodePfx(data, options.maxIterations);
    Password given = Password::fromOptional(password);

    MacCheck macCheck = checkMac(pfx, given, options.macPolicy, options.maxIterations,
                                 result.warnings);
    result.macStatus = macCheck.status;
    Password alternate = macCheck.usedAlternate ? alternatePassword(given) : Password::absent();
    const Password& effective = macCheck.usedAlternate ? alternate : given;

    std::vector<ContentInfo> blocks = decodeAuthenticatedSafe(pfx.authSafe);
    spdlog::debug("AuthenticatedSafe: {} block(s)", blocks.size());

    BagDecodeContext ctx{effective,
                         options.keyFormat,
                         options.maxIterations,
                         options.validatePayloads,
                         keyParserOrDefault(options.keyParser),
                         certificateParserOrDefault(options.certificateParser)};

    if (options.workerThreads > 1 && blocks.size() > 1) {
        auto perBlock = decodeBlocksParallel(blocks, ctx, options.workerThreads);
        for (auto& records : perBlock) {
            std::move(records.begin(), records.end(), std::back_inserter(result.records));
        }
    } else {
        for (size_t i = 0; i < blocks.size(); ++i) {
            auto records = decodeBlock(blocks[i], i, ctx);
            std::move(records.begin(), records.end(), std::back_inserter(result.records));
        }
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    spdlog::info("PKCS#12 decoded: {} record(s) in {} block(s), MAC {}, {}ms",
                 result.records.size(), blocks.size(),
                 macStatusToString(result.macStatus), duration.count());
    return result;
}

// --- Encode ---

Bytes encode(const std::vector<Record>& records,
             const std::optional<std::string>& password,
             const EncodeOptions& options) {
    Password pw = Password::fromOptional(password);
    IPrivateKeyParser& keyParser = keyParserOrDefault(options.keyParser);
    ICertificateParser& certificateParser = certificateParserOrDefault(options.certificateParser);

    BagEncodeOptions bagOptions;
    bagOptions.keySuite = options.keySuite;
    bagOptions.shroudKeys = options.shroudKeys;
    bagOptions.shroudSecrets = options.shroudSecrets;
    bagOptions.validatePayloads = options.validatePayloads;
    bagOptions.iterations = options.iterations;
    bagOptions.saltLength = options.saltLength;

    std::vector<Bytes> contentInfos;
    for (const auto& plan : planBlocks(records)) {
        std::vector<Bytes> bags;
        for (const Record* record : plan.records) {
            bags.push_back(encodeRecord(*record, pw, bagOptions, keyParser, certificateParser));
        }
        Bytes safeContents = encodeSafeContents(bags);

        if (plan.certificates && options.encryptCertificates) {
            pbe::Encrypted enc = pbe::encrypt(options.certificateSuite, pw, safeContents,
                                              options.iterations, options.saltLength);
            contentInfos.push_back(encodeEncryptedDataContentInfo(enc.algorithm, enc.ciphertext));
        } else {
            contentInfos.push_back(encodeDataContentInfo(safeContents));
        }
    }

    Bytes authSafe = encodeAuthenticatedSafe(contentInfos);

    std::optional<MacData> macData;
    if (options.includeMac) {
        macData = mac::create(options.macDigest, pw, authSafe, options.macIterations);
    }

    Bytes pfx = encodePfx(authSafe, macData);
    spdlog::info("PKCS#12 encoded: {} record(s) in {} block(s), MAC {}, {} bytes",
                 records.size(), contentInfos.size(),
                 options.includeMac ? macDigestToString(options.macDigest) : "none",
                 pfx.size());
    return pfx;
}

} // namespace keystore::pkcs12
