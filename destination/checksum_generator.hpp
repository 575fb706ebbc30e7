#pragma once
#include <cstdint>
#include <future>
#include <memory>
#include "../common/block_checksum.hpp"
#include "../common/byte_source.hpp"
#include "../common/cancellation.hpp"
#include "../common/channel.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/result.hpp"
#include "../common/strong_hasher.hpp"

// Describes the basis file as one BlockChecksum per block.
class ChecksumGenerator {
public:
    ChecksumGenerator(const SyncOptions& options, Logger& logger);

    // Pushes a checksum per block of basis into out and closes it when done.
    // A read failure is reported downstream as a fault record. Returns the
    // number of records pushed.
    Result<uint64_t> generate(ByteSource& basis, StrongHasher& strongHash,
                              Channel<BlockChecksum>& out, const CancellationToken& cancel) const;

    // Same as generate() on a background thread.
    std::future<Result<uint64_t>> start(std::shared_ptr<ByteSource> basis,
                                        std::unique_ptr<StrongHasher> strongHash,
                                        std::shared_ptr<Channel<BlockChecksum>> out,
                                        CancellationToken cancel) const;

private:
    Result<uint64_t> produce(ByteSource& basis, StrongHasher& strongHash,
                             Channel<BlockChecksum>& out, const CancellationToken& cancel) const;

    SyncOptions options_;
    Logger& logger_;
};
