#include "local_sync.hpp"
#include <memory>
#include "../common/byte_source.hpp"
#include "../common/channel.hpp"
#include "../common/strong_hasher.hpp"
#include "../destination/checksum_generator.hpp"
#include "../source/checksum_index.hpp"
#include "sync_engine.hpp"

LocalSync::LocalSync(const std::string& basisPath, const std::string& localPath, const std::string& outputPath,
                     const SyncOptions& options, Logger& logger)
    : basisPath_(basisPath), localPath_(localPath), outputPath_(outputPath), options_(options), logger_(logger) {}

Result<SyncSummary> LocalSync::run(const CancellationToken& cancel) {
    Result<void> valid = options_.validate();
    if (!valid.success)
        return Result<SyncSummary>::Error(valid.error());

    auto basis = FileSource::open(basisPath_);
    if (!basis.success)
        return Result<SyncSummary>::Error(basis.error());
    auto local = FileSource::open(localPath_);
    if (!local.success)
        return Result<SyncSummary>::Error(local.error());

    // both ends must agree on the digest, so each gets its own instance
    auto remoteHasher = EvpHasher::byName(options_.strongDigest);
    if (!remoteHasher.success)
        return Result<SyncSummary>::Error(remoteHasher.error());
    auto localHasher = EvpHasher::byName(options_.strongDigest);
    if (!localHasher.success)
        return Result<SyncSummary>::Error(localHasher.error());

    // destination side: describe the basis
    auto checksums = std::make_shared<Channel<BlockChecksum>>(options_.channelCapacity);
    ChecksumGenerator generator(options_, logger_);
    auto generated = generator.start(basis.data, std::move(remoteHasher.data), checksums, cancel);

    ChecksumIndexBuilder builder(logger_);
    Result<BlockIndexPtr> index = builder.build(*checksums, cancel);
    Result<uint64_t> remoteBlocks = generated.get();
    if (!index.success)
        return Result<SyncSummary>::Error(index.error());
    if (!remoteBlocks.success)
        return Result<SyncSummary>::Error(SyncError::wrap("failed checksumming " + basisPath_, remoteBlocks.error()));

    logger_.info("Sync", "Indexed " + std::to_string(index.data->size()) + " blocks of " + basisPath_);

    // source side: diff the local file against the index
    SyncEngine engine(options_, logger_);
    auto stream = engine.sync(local.data, std::move(localHasher.data), index.data, cancel);
    if (!stream.success)
        return Result<SyncSummary>::Error(stream.error());

    PatchApplier applier(options_, logger_);
    Result<ApplyStats> applied = applier.applyToFile(basisPath_, outputPath_, *stream.data);
    if (!applied.success)
        return Result<SyncSummary>::Error(SyncError::wrap("sync of " + localPath_ + " failed", applied.error()));

    SyncSummary summary;
    summary.remoteBlocks = remoteBlocks.data;
    summary.apply = applied.data;
    logger_.info("Sync", "Sync Completed: " + std::to_string(summary.apply.copiedBlocks) + " blocks copied, " +
                         std::to_string(summary.apply.literalBytes) + " literal bytes");
    return Result<SyncSummary>::Ok(summary);
}
