#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "../common/block_operation.hpp"
#include "../common/byte_source.hpp"
#include "../common/cancellation.hpp"
#include "../common/channel.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/result.hpp"
#include "../common/strong_hasher.hpp"
#include "../source/checksum_index.hpp"

// Operations produced by one SyncEngine::sync call, in local block order.
// Owns the producing thread. Destroying a stream before it is drained makes
// the producer stop after its current block.
class OperationStream {
public:
    ~OperationStream();

    OperationStream(const OperationStream&) = delete;
    OperationStream& operator=(const OperationStream&) = delete;

    // Blocks until the next operation is ready, std::nullopt at the end.
    std::optional<BlockOperation> next();

    // Collects everything that is left.
    std::vector<BlockOperation> drain();

private:
    friend class SyncEngine;
    explicit OperationStream(size_t capacity);

    std::shared_ptr<Channel<BlockOperation>> channel_;
    std::thread producer_;
};

class SyncEngine {
public:
    explicit SyncEngine(const SyncOptions& options = SyncOptions(), Logger& logger = defaultLogger());

    // Scans source block by block against the remote index and streams copy
    // or literal operations. Returns immediately, the scan runs on its own
    // thread. A null source is rejected up front; a null strongHash falls back
    // to SHA-256 and a null remote index matches nothing. The remote index
    // must not change while the stream is alive. The logger must outlive it.
    Result<std::unique_ptr<OperationStream>> sync(std::shared_ptr<ByteSource> source,
                                                  std::unique_ptr<StrongHasher> strongHash,
                                                  BlockIndexPtr remote,
                                                  CancellationToken cancel = CancellationToken()) const;

private:
    SyncOptions options_;
    Logger& logger_;
};
