#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>
#include "../common/block_checksum.hpp"
#include "../common/cancellation.hpp"
#include "../common/channel.hpp"
#include "../common/logger.hpp"
#include "../common/result.hpp"

// Remote block checksums grouped by fast checksum. Only ChecksumIndexBuilder
// fills it; everyone else gets it as std::shared_ptr<const BlockIndex>, which
// is safe to read from several threads without locking.
class BlockIndex {
public:
    using Bucket = std::vector<BlockChecksum>;

    // Candidates for a fast checksum in arrival order, nullptr if none.
    const Bucket* find(uint32_t fast) const;

    size_t size() const { return records_; }
    size_t bucketCount() const { return buckets_.size(); }
    bool empty() const { return records_ == 0; }

private:
    friend class ChecksumIndexBuilder;
    void add(const BlockChecksum& checksum);

    std::unordered_map<uint32_t, Bucket> buckets_;
    size_t records_ = 0;
};

using BlockIndexPtr = std::shared_ptr<const BlockIndex>;

class ChecksumIndexBuilder {
public:
    using NextChecksum = std::function<std::optional<BlockChecksum>()>;

    explicit ChecksumIndexBuilder(Logger& logger);

    // Consumes checksums until the sequence ends. If the token fires the
    // index built so far is returned together with the cancellation error.
    // Faulty records are logged and skipped.
    Result<BlockIndexPtr> build(const NextChecksum& next, const CancellationToken& cancel) const;
    Result<BlockIndexPtr> build(Channel<BlockChecksum>& checksums, const CancellationToken& cancel) const;
    Result<BlockIndexPtr> build(const std::vector<BlockChecksum>& checksums, const CancellationToken& cancel) const;

private:
    Logger& logger_;
};
