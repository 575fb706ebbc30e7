#include "byte_source.hpp"

StreamSource::StreamSource(std::istream& in) : in_(in) {}

ReadResult StreamSource::read(char* buffer, size_t length) {
    if (!in_) {
        // eof from the previous short read is a clean end, anything else is not
        if (in_.eof() && !in_.bad()) return ReadResult::endOfStream();
        return ReadResult::failure("stream is in a failed state");
    }

    in_.read(buffer, static_cast<std::streamsize>(length));
    size_t bytesRead = static_cast<size_t>(in_.gcount());

    if (in_.bad())
        return ReadResult::failure("I/O error while reading stream");
    if (bytesRead == 0) {
        if (in_.eof()) return ReadResult::endOfStream();
        return ReadResult::failure("stream returned no data");
    }
    return ReadResult::ok(bytesRead);
}

FileSource::FileSource(const std::string& path)
    : file_(path, std::ios::binary), stream_(file_) {}

Result<std::shared_ptr<ByteSource>> FileSource::open(const std::string& path) {
    std::shared_ptr<FileSource> source(new FileSource(path));
    if (!source->file_.is_open())
        return Result<std::shared_ptr<ByteSource>>::Error(ErrorCode::IoFailure, "Failed to open file: " + path);
    return Result<std::shared_ptr<ByteSource>>::Ok(source);
}

ReadResult FileSource::read(char* buffer, size_t length) {
    return stream_.read(buffer, length);
}

MemorySource::MemorySource(std::string data)
    : in_(std::move(data)), stream_(in_) {}

ReadResult MemorySource::read(char* buffer, size_t length) {
    return stream_.read(buffer, length);
}
