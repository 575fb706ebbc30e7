#include "sync/local_sync.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <remote-basis> <local-file> [output]\n"
              << "  --block-size N       block size in bytes (default " << Config::BLOCK_SIZE << ")\n"
              << "  --digest NAME        strong digest, sha256 or sha1 (default " << Config::STRONG_DIGEST << ")\n"
              << "  --literal-fallback   send a literal when only the fast checksum matches\n"
              << "  --verbose            debug logging\n";
}

int main(int argc, char** argv) {

    SyncOptions options;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--block-size" && i + 1 < argc) {
            char* end = nullptr;
            unsigned long long size = std::strtoull(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0' || size == 0) {
                std::cerr << "Invalid block size: " << argv[i] << "\n";
                return 1;
            }
            options.blockSize = static_cast<size_t>(size);
        } else if (arg == "--digest" && i + 1 < argc) {
            options.strongDigest = argv[++i];
        } else if (arg == "--literal-fallback") {
            options.literalOnStrongMiss = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.size() < 2 || paths.size() > 3) {
        std::cerr << "Insufficient arguments\n";
        printUsage(argv[0]);
        return 1;
    }

    StreamLogger logger(options.verbose ? LogLevel::Debug : LogLevel::Info);
    std::string output = paths.size() == 3 ? paths[2] : paths[0];

    LocalSync sync(paths[0], paths[1], output, options, logger);
    Result<SyncSummary> result = sync.run();
    if (!result.success) {
        logger.error("Sync", result.message);
        return 2;
    }
    return 0;
}
