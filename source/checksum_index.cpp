#include "checksum_index.hpp"
#include <string>

const BlockIndex::Bucket* BlockIndex::find(uint32_t fast) const {
    auto it = buckets_.find(fast);
    if (it == buckets_.end()) return nullptr;
    return &it->second;
}

void BlockIndex::add(const BlockChecksum& checksum) {
    buckets_[checksum.fast].push_back(checksum);
    ++records_;
}

ChecksumIndexBuilder::ChecksumIndexBuilder(Logger& logger) : logger_(logger) {}

Result<BlockIndexPtr> ChecksumIndexBuilder::build(const NextChecksum& next, const CancellationToken& cancel) const {
    auto index = std::make_shared<BlockIndex>();
    size_t skipped = 0;

    while (std::optional<BlockChecksum> checksum = next()) {
        if (cancel.isCancelled()) {
            logger_.debug("ChecksumIndex", "cancelled after " + std::to_string(index->size()) + " records");
            return Result<BlockIndexPtr>::Error(
                SyncError::wrap("failed building lookup table", cancel.error()), index);
        }

        if (checksum->isFault()) {
            ++skipped;
            logger_.warn("ChecksumIndex", "skipping checksum for block " + std::to_string(checksum->ordinal) +
                                          ": " + checksum->fault->message);
            continue;
        }
        index->add(*checksum);
    }

    logger_.debug("ChecksumIndex", "indexed " + std::to_string(index->size()) + " blocks in " +
                                   std::to_string(index->bucketCount()) + " buckets, skipped " +
                                   std::to_string(skipped));
    return Result<BlockIndexPtr>::Ok(index);
}

Result<BlockIndexPtr> ChecksumIndexBuilder::build(Channel<BlockChecksum>& checksums, const CancellationToken& cancel) const {
    auto result = build([&checksums]() { return checksums.pop(); }, cancel);
    // release a producer still blocked on push
    if (!result.success)
        checksums.abandon();
    return result;
}

Result<BlockIndexPtr> ChecksumIndexBuilder::build(const std::vector<BlockChecksum>& checksums, const CancellationToken& cancel) const {
    size_t pos = 0;
    return build([&checksums, &pos]() -> std::optional<BlockChecksum> {
        if (pos >= checksums.size()) return std::nullopt;
        return checksums[pos++];
    }, cancel);
}
