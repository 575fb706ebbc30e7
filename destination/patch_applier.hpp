#pragma once
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/result.hpp"
#include "../sync/sync_engine.hpp"

struct ApplyStats {
    uint64_t copiedBlocks = 0;
    uint64_t unmatchedBlocks = 0;   // data-less operations that were not confirmed copies
    uint64_t literalBlocks = 0;
    uint64_t literalBytes = 0;
    uint64_t bytesWritten = 0;
};

// Rebuilds a file from the basis and an operation stream.
class PatchApplier {
public:
    PatchApplier(const SyncOptions& options, Logger& logger);

    // Literal data is written as is, data-less operations copy block
    // `ordinal` of the basis. A fault operation aborts with its error and the
    // partial output must be discarded.
    Result<ApplyStats> apply(std::istream& basis, std::ostream& out, OperationStream& ops) const;

    // Writes to "<output>.sync.tmp" and renames it over outputPath only when
    // every operation was applied.
    Result<ApplyStats> applyToFile(const std::string& basisPath, const std::string& outputPath,
                                   OperationStream& ops) const;

    Result<ApplyStats> applyToFile(const std::string& basisPath, OperationStream& ops) const;

private:
    Result<void> copyBlock(std::istream& basis, std::ostream& out, uint64_t ordinal,
                           std::vector<char>& buffer, ApplyStats& stats) const;

    SyncOptions options_;
    Logger& logger_;
};
