#pragma once
#include <cstddef>
#include <fstream>
#include <istream>
#include <memory>
#include <sstream>
#include <string>
#include "result.hpp"

enum class ReadStatus { Ok, EndOfStream, Error };

struct ReadResult {
    ReadStatus status;
    size_t bytes;
    std::string error;

    static ReadResult ok(size_t n) { return {ReadStatus::Ok, n, ""}; }
    static ReadResult endOfStream() { return {ReadStatus::EndOfStream, 0, ""}; }
    static ReadResult failure(const std::string& msg) { return {ReadStatus::Error, 0, msg}; }
};

// Sequential byte stream the engine scans block by block.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    // Reads up to length bytes. Ok always carries at least one byte.
    virtual ReadResult read(char* buffer, size_t length) = 0;
};

// Reads from a caller owned std::istream.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& in);
    ReadResult read(char* buffer, size_t length) override;

private:
    std::istream& in_;
};

class FileSource : public ByteSource {
public:
    static Result<std::shared_ptr<ByteSource>> open(const std::string& path);
    ReadResult read(char* buffer, size_t length) override;

private:
    explicit FileSource(const std::string& path);
    std::ifstream file_;
    StreamSource stream_;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string data);
    ReadResult read(char* buffer, size_t length) override;

private:
    std::istringstream in_;
    StreamSource stream_;
};
