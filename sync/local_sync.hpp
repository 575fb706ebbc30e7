#pragma once
#include <string>
#include "../common/cancellation.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/result.hpp"
#include "../destination/patch_applier.hpp"

struct SyncSummary {
    uint64_t remoteBlocks = 0;
    ApplyStats apply;
};

// Runs both ends of a sync in one process: checksums the basis, indexes them,
// diffs the local file against the index and rebuilds the output.
class LocalSync {
public:
    LocalSync(const std::string& basisPath, const std::string& localPath, const std::string& outputPath,
              const SyncOptions& options = SyncOptions(), Logger& logger = defaultLogger());

    Result<SyncSummary> run(const CancellationToken& cancel = CancellationToken());

private:
    std::string basisPath_;
    std::string localPath_;
    std::string outputPath_;
    SyncOptions options_;
    Logger& logger_;
};
