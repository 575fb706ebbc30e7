#include "patch_applier.hpp"
#include <cstdio>
#include <fstream>
#include <vector>

PatchApplier::PatchApplier(const SyncOptions& options, Logger& logger)
    : options_(options), logger_(logger) {}

Result<void> PatchApplier::copyBlock(std::istream& basis, std::ostream& out, uint64_t ordinal,
                                     std::vector<char>& buffer, ApplyStats& stats) const {
    basis.clear();
    basis.seekg(static_cast<std::streamoff>(ordinal * options_.blockSize), std::ios::beg);
    basis.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = basis.gcount();
    if (basis.bad() || got <= 0)
        return Result<void>::Error(ErrorCode::IoFailure,
                                   "copy references block " + std::to_string(ordinal) + " outside the basis");

    out.write(buffer.data(), got);
    stats.bytesWritten += static_cast<uint64_t>(got);
    return Result<void>::Ok();
}

Result<ApplyStats> PatchApplier::apply(std::istream& basis, std::ostream& out, OperationStream& ops) const {
    Result<void> valid = options_.validate();
    if (!valid.success)
        return Result<ApplyStats>::Error(valid.error());

    ApplyStats stats;
    std::vector<char> buffer(options_.blockSize);

    while (std::optional<BlockOperation> op = ops.next()) {
        switch (op->type) {
            case OpType::FAULT:
                logger_.warn("PatchApplier", "aborting at block " + std::to_string(op->ordinal) + ": " + op->error.message);
                return Result<ApplyStats>::Error(op->error, stats);

            case OpType::LITERAL:
                out.write(op->data.data(), static_cast<std::streamsize>(op->data.size()));
                stats.literalBlocks++;
                stats.literalBytes += op->data.size();
                stats.bytesWritten += op->data.size();
                break;

            case OpType::COPY:
            case OpType::UNMATCHED: {
                Result<void> copied = copyBlock(basis, out, op->ordinal, buffer, stats);
                if (!copied.success)
                    return Result<ApplyStats>::Error(copied.error(), stats);
                if (op->type == OpType::COPY)
                    stats.copiedBlocks++;
                else
                    stats.unmatchedBlocks++;
                break;
            }
        }

        if (!out)
            return Result<ApplyStats>::Error({ErrorCode::IoFailure, "failed writing output"}, stats);
    }

    return Result<ApplyStats>::Ok(stats);
}

Result<ApplyStats> PatchApplier::applyToFile(const std::string& basisPath, const std::string& outputPath,
                                             OperationStream& ops) const {
    std::ifstream basis(basisPath, std::ios::binary);
    std::string tempFilePath = outputPath + ".sync.tmp";
    std::ofstream tempFile(tempFilePath, std::ios::binary | std::ios::trunc);

    if (!basis.is_open() || !tempFile.is_open())
        return Result<ApplyStats>::Error(ErrorCode::IoFailure, "File open failed during delta application");

    Result<ApplyStats> result = apply(basis, tempFile, ops);
    basis.close();
    tempFile.close();

    if (result.success && !tempFile)
        result = Result<ApplyStats>::Error({ErrorCode::IoFailure, "failed flushing " + tempFilePath}, result.data);

    if (!result.success) {
        std::remove(tempFilePath.c_str());
        return result;
    }

    if (std::rename(tempFilePath.c_str(), outputPath.c_str()) != 0) {
        std::remove(tempFilePath.c_str());
        return Result<ApplyStats>::Error({ErrorCode::IoFailure, "failed replacing " + outputPath}, result.data);
    }
    return result;
}

Result<ApplyStats> PatchApplier::applyToFile(const std::string& basisPath, OperationStream& ops) const {
    return applyToFile(basisPath, basisPath, ops);
}
