// config.hpp
#pragma once
#include <cstddef>
#include <string>
#include "result.hpp"

namespace Config {
    inline constexpr size_t BLOCK_SIZE = 6 * 1024;     // 6 kb blocks, both peers must agree on it
    inline constexpr size_t CHANNEL_CAPACITY = 1;      // operations buffered between engine and consumer
    inline constexpr const char* STRONG_DIGEST = "sha256";
}

// Runtime settings shared by the checksum producer, the engine and the patch applier.
struct SyncOptions {
    size_t blockSize = Config::BLOCK_SIZE;
    size_t channelCapacity = Config::CHANNEL_CAPACITY;
    // Emit a literal instead of an unmatched operation when the fast checksum
    // hits but no strong digest in the bucket matches. Off by default.
    bool literalOnStrongMiss = false;
    std::string strongDigest = Config::STRONG_DIGEST;
    bool verbose = false;

    Result<void> validate() const {
        if (blockSize == 0)
            return Result<void>::Error(ErrorCode::InvalidArgument, "block size must be positive");
        if (channelCapacity == 0)
            return Result<void>::Error(ErrorCode::InvalidArgument, "channel capacity must be positive");
        return Result<void>::Ok();
    }
};
