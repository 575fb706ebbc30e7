#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "common/block_checksum.hpp"
#include "common/block_operation.hpp"
#include "common/byte_source.hpp"
#include "common/hash_utils.hpp"
#include "common/logger.hpp"
#include "common/strong_hasher.hpp"

struct LogEntry {
    LogLevel level;
    std::string tag;
    std::string message;
};

class RecordingLogger : public Logger {
public:
    void log(LogLevel level, const std::string& tag, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({level, tag, message});
    }

    std::vector<LogEntry> entries(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> matching;
        for (const auto& e : entries_)
            if (e.level == level) matching.push_back(e);
        return matching;
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;
};

// Hands out the given chunks one per read, then ends cleanly or fails.
// onRead runs before every read with the zero based read count.
class ScriptedSource : public ByteSource {
public:
    explicit ScriptedSource(std::vector<std::string> chunks, bool failAtEnd = false)
        : chunks_(std::move(chunks)), failAtEnd_(failAtEnd) {}

    std::function<void(size_t)> onRead;

    ReadResult read(char* buffer, size_t length) override {
        if (onRead) onRead(reads_);
        ++reads_;
        if (next_ >= chunks_.size()) {
            if (failAtEnd_) return ReadResult::failure("device unplugged");
            return ReadResult::endOfStream();
        }
        const std::string& chunk = chunks_[next_++];
        size_t n = std::min(length, chunk.size());
        std::copy(chunk.begin(), chunk.begin() + n, buffer);
        return ReadResult::ok(n);
    }

    size_t reads() const { return reads_; }

private:
    std::vector<std::string> chunks_;
    bool failAtEnd_;
    size_t next_ = 0;
    size_t reads_ = 0;
};

inline std::string randomBytes(size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    std::string data(size, '\0');
    for (auto& c : data) c = static_cast<char>(byte(rng));
    return data;
}

inline std::string digestOf(const std::string& block) {
    auto hasher = EvpHasher::sha256();
    hasher->write(block.data(), block.size());
    return hasher->digest();
}

inline BlockChecksum checksumOf(uint64_t ordinal, const std::string& block) {
    return BlockChecksum::make(ordinal, HashUtils::computeWeakHash(block.data(), block.size()), digestOf(block));
}

// One checksum per blockSize slice of data, the way the remote end describes its file.
inline std::vector<BlockChecksum> checksumsOf(const std::string& data, size_t blockSize) {
    std::vector<BlockChecksum> checksums;
    for (size_t off = 0, ordinal = 0; off < data.size(); off += blockSize, ++ordinal)
        checksums.push_back(checksumOf(ordinal, data.substr(off, blockSize)));
    return checksums;
}

inline std::string toString(const std::vector<char>& data) {
    return std::string(data.begin(), data.end());
}
