#include "checksum_generator.hpp"
#include <exception>
#include <string>
#include <utility>
#include <vector>
#include "../common/hash_utils.hpp"

ChecksumGenerator::ChecksumGenerator(const SyncOptions& options, Logger& logger)
    : options_(options), logger_(logger) {}

Result<uint64_t> ChecksumGenerator::generate(ByteSource& basis, StrongHasher& strongHash,
                                             Channel<BlockChecksum>& out, const CancellationToken& cancel) const {
    try {
        Result<uint64_t> result = produce(basis, strongHash, out, cancel);
        out.close();
        return result;
    } catch (const std::exception& e) {
        out.close();
        return Result<uint64_t>::Error(ErrorCode::IoFailure, std::string("checksum generation aborted: ") + e.what());
    }
}

Result<uint64_t> ChecksumGenerator::produce(ByteSource& basis, StrongHasher& strongHash,
                                            Channel<BlockChecksum>& out, const CancellationToken& cancel) const {
    Result<void> valid = options_.validate();
    if (!valid.success)
        return Result<uint64_t>::Error(valid.error());

    std::vector<char> buffer(options_.blockSize);
    uint64_t ordinal = 0;

    for (;;) {
        if (cancel.isCancelled())
            return Result<uint64_t>::Error(SyncError::wrap("failed generating checksums", cancel.error()));

        ReadResult read = basis.read(buffer.data(), buffer.size());
        if (read.status == ReadStatus::EndOfStream || (read.status == ReadStatus::Ok && read.bytes == 0))
            break;

        if (read.status == ReadStatus::Error) {
            logger_.error("ChecksumGenerator", "read failed at block " + std::to_string(ordinal) + ": " + read.error);
            SyncError fault{ErrorCode::MalformedChecksum, "unreadable block: " + read.error};
            out.push(BlockChecksum::makeFault(ordinal, fault));
            return Result<uint64_t>::Error(SyncError::wrap("failed reading block", {ErrorCode::ReadFailed, read.error}));
        }

        strongHash.reset();
        strongHash.write(buffer.data(), read.bytes);

        BlockChecksum checksum = BlockChecksum::make(
            ordinal, HashUtils::computeWeakHash(buffer.data(), read.bytes), strongHash.digest());
        if (!out.push(std::move(checksum)))
            return Result<uint64_t>::Error(ErrorCode::Cancelled, "checksum consumer went away");
        ++ordinal;
    }

    logger_.debug("ChecksumGenerator", "generated " + std::to_string(ordinal) + " block checksums");
    return Result<uint64_t>::Ok(ordinal);
}

std::future<Result<uint64_t>> ChecksumGenerator::start(std::shared_ptr<ByteSource> basis,
                                                       std::unique_ptr<StrongHasher> strongHash,
                                                       std::shared_ptr<Channel<BlockChecksum>> out,
                                                       CancellationToken cancel) const {
    ChecksumGenerator self = *this;
    return std::async(std::launch::async,
                      [self, basis = std::move(basis), strongHash = std::move(strongHash),
                       out = std::move(out), cancel = std::move(cancel)]() {
        if (!basis || !strongHash || !out) {
            if (out) out->close();
            return Result<uint64_t>::Error(ErrorCode::InvalidArgument, "basis, hasher and channel are required");
        }
        return self.generate(*basis, *strongHash, *out, cancel);
    });
}
