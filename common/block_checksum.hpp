#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include "sync_error.hpp"

struct BlockChecksum {
    uint64_t ordinal = 0;             // Block position in the remote file, in blocks
    uint32_t fast = 0;                // Weak checksum
    std::string strong;               // Raw strong digest bytes
    std::optional<SyncError> fault;   // Set when the producer could not describe the block

    static BlockChecksum make(uint64_t ordinal, uint32_t fast, std::string strong) {
        BlockChecksum c;
        c.ordinal = ordinal;
        c.fast = fast;
        c.strong = std::move(strong);
        return c;
    }

    static BlockChecksum makeFault(uint64_t ordinal, SyncError error) {
        BlockChecksum c;
        c.ordinal = ordinal;
        c.fault = std::move(error);
        return c;
    }

    bool isFault() const { return fault.has_value(); }
};
