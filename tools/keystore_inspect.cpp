/**
 * @file keystore_inspect.cpp
 * @brief Print the contents of a PKCS#12 keystore
 *
 * Usage: keystore-inspect <file> [--password-env VAR] [--pem]
 *
 * The password is read from the named environment variable; without
 * --password-env the keystore is opened with no password at all.
 * Output (JSON summary or PEM blocks) goes to stdout, logs go to stderr.
 *
 * Exit codes: 0 success, 1 usage or I/O error, 2 decode error.
 */

#include "keystore/common/config_manager.h"
#include "keystore/common/logger.h"
#include "keystore/pkcs12/container.h"
#include "keystore/pkcs12/errors.h"
#include "keystore/pkcs12/pem_export.h"
#include "keystore/pkcs12/summary.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {

struct Arguments {
    std::string file;
    std::optional<std::string> passwordEnv;
    bool pem = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <file> [--password-env VAR] [--pem]\n"
              << "\n"
              << "  --password-env VAR  read the keystore password from environment variable VAR\n"
              << "  --pem               print records as PEM blocks instead of a JSON summary\n"
              << "\n"
              << "Environment: KEYSTORE_MAC_POLICY, KEYSTORE_KEY_FORMAT, KEYSTORE_MAX_ITERATIONS,\n"
              << "             KEYSTORE_WORKER_THREADS, KEYSTORE_VALIDATE_PAYLOADS, KEYSTORE_LOG_LEVEL\n";
}

std::optional<Arguments> parseArguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--password-env") {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            args.passwordEnv = argv[++i];
        } else if (arg == "--pem") {
            args.pem = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return std::nullopt;
        } else if (args.file.empty()) {
            args.file = arg;
        } else {
            return std::nullopt;
        }
    }
    if (args.file.empty()) {
        return std::nullopt;
    }
    return args;
}

std::optional<keystore::pkcs12::Bytes> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return keystore::pkcs12::Bytes(std::istreambuf_iterator<char>(in),
                                   std::istreambuf_iterator<char>());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using keystore::common::ConfigManager;
    using keystore::common::Logger;

    auto& config = ConfigManager::getInstance();
    Logger::initialize("keystore-inspect", config.getString(ConfigManager::LOG_LEVEL, "warn"));

    auto args = parseArguments(argc, argv);
    if (!args) {
        printUsage(argv[0]);
        return 1;
    }

    auto data = readFile(args->file);
    if (!data) {
        spdlog::error("Cannot read {}", args->file);
        return 1;
    }

    std::optional<std::string> password;
    if (args->passwordEnv) {
        if (!config.has(*args->passwordEnv)) {
            spdlog::error("Environment variable {} is not set", *args->passwordEnv);
            return 1;
        }
        password = config.getString(*args->passwordEnv);
    }

    try {
        auto options = keystore::pkcs12::DecodeOptions::fromConfig(config);
        auto result = keystore::pkcs12::decode(*data, password, options);

        if (args->pem) {
            for (const auto& warning : result.warnings) {
                spdlog::warn("{}", warning);
            }
            std::cout << keystore::pkcs12::toPem(result.records);
        } else {
            std::cout << keystore::pkcs12::toJsonString(
                             keystore::pkcs12::describeRecords(result))
                      << std::endl;
        }
    } catch (const keystore::pkcs12::Pkcs12Exception& e) {
        spdlog::error("{} [{}]", e.what(), keystore::pkcs12::errorKindToString(e.kind()));
        Logger::flush();
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        Logger::flush();
        return 2;
    }

    Logger::flush();
    return 0;
}
