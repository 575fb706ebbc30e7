#include "sync_engine.hpp"
#include <exception>
#include <string>
#include <utility>
#include "../common/hash_utils.hpp"

namespace {

// State moved onto the producer thread.
struct SyncTask {
    SyncOptions options;
    std::shared_ptr<ByteSource> source;
    std::unique_ptr<StrongHasher> strongHash;
    BlockIndexPtr remote;
    CancellationToken cancel;
    std::shared_ptr<Channel<BlockOperation>> out;
    Logger* logger;
    uint64_t index = 0;  // local block counter

    BlockOperation matchBlock(std::vector<char> block) {
        uint32_t weak = HashUtils::computeWeakHash(block.data(), block.size());
        const BlockIndex::Bucket* candidates = remote ? remote->find(weak) : nullptr;
        if (candidates == nullptr)
            return BlockOperation::makeLiteral(index, std::move(block));

        strongHash->reset();
        strongHash->write(block.data(), block.size());
        std::string digest = strongHash->digest();

        // first candidate in arrival order wins
        for (const BlockChecksum& candidate : *candidates) {
            if (candidate.strong == digest)
                return BlockOperation::makeCopy(candidate.ordinal);
        }

        if (options.literalOnStrongMiss)
            return BlockOperation::makeLiteral(index, std::move(block));
        return BlockOperation::makeUnmatched(index);
    }

    void scan() {
        std::vector<char> buffer(options.blockSize);

        for (;;) {
            // cancellation is only sampled here, never during a read
            if (cancel.isCancelled()) {
                out->push(BlockOperation::makeFault(index, cancel.error()));
                return;
            }

            ReadResult read = source->read(buffer.data(), buffer.size());
            // a source that reports Ok without data has nothing more to give
            if (read.status == ReadStatus::EndOfStream || (read.status == ReadStatus::Ok && read.bytes == 0))
                return;

            if (read.status == ReadStatus::Error) {
                // the source may be corrupted, the caller has to start over
                SyncError cause{ErrorCode::ReadFailed, read.error};
                logger->warn("SyncEngine", "read failed at block " + std::to_string(index) + ": " + read.error);
                out->push(BlockOperation::makeFault(index, SyncError::wrap("failed reading block", cause)));
                return;
            }

            std::vector<char> block(buffer.begin(), buffer.begin() + read.bytes);
            if (!out->push(matchBlock(std::move(block)))) {
                logger->debug("SyncEngine", "consumer went away at block " + std::to_string(index));
                return;
            }
            ++index;
        }
    }

    void run() {
        try {
            scan();
            logger->debug("SyncEngine", "scan finished after " + std::to_string(index) + " blocks");
        } catch (const std::exception& e) {
            logger->error("SyncEngine", std::string("scan aborted: ") + e.what());
            out->push(BlockOperation::makeFault(index, {ErrorCode::IoFailure, std::string("sync aborted: ") + e.what()}));
        }
        out->close();
    }
};

}

OperationStream::OperationStream(size_t capacity)
    : channel_(std::make_shared<Channel<BlockOperation>>(capacity)) {}

OperationStream::~OperationStream() {
    channel_->abandon();
    if (producer_.joinable())
        producer_.join();
}

std::optional<BlockOperation> OperationStream::next() {
    return channel_->pop();
}

std::vector<BlockOperation> OperationStream::drain() {
    std::vector<BlockOperation> ops;
    while (std::optional<BlockOperation> op = next())
        ops.push_back(std::move(*op));
    return ops;
}

SyncEngine::SyncEngine(const SyncOptions& options, Logger& logger)
    : options_(options), logger_(logger) {}

Result<std::unique_ptr<OperationStream>> SyncEngine::sync(std::shared_ptr<ByteSource> source,
                                                          std::unique_ptr<StrongHasher> strongHash,
                                                          BlockIndexPtr remote,
                                                          CancellationToken cancel) const {
    using StreamResult = Result<std::unique_ptr<OperationStream>>;

    if (!source)
        return StreamResult::Error(ErrorCode::InvalidArgument, "reader required");

    Result<void> valid = options_.validate();
    if (!valid.success)
        return StreamResult::Error(valid.error());

    if (!strongHash)
        strongHash = EvpHasher::sha256();

    std::unique_ptr<OperationStream> stream(new OperationStream(options_.channelCapacity));

    SyncTask task{options_, std::move(source), std::move(strongHash), std::move(remote),
                  std::move(cancel), stream->channel_, &logger_};
    stream->producer_ = std::thread([task = std::move(task)]() mutable { task.run(); });

    return StreamResult::Ok(std::move(stream));
}
