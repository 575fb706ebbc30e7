#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "sync_error.hpp"

enum class OpType {
    COPY,       // reuse remote block `ordinal`
    LITERAL,    // write `data` verbatim
    UNMATCHED,  // fast checksum hit without a strong match, `ordinal` is the local block
    FAULT       // stream ends abnormally, `ordinal` is the local block
};

inline const char* toString(OpType type) {
    switch (type) {
        case OpType::COPY:      return "copy";
        case OpType::LITERAL:   return "literal";
        case OpType::UNMATCHED: return "unmatched";
        case OpType::FAULT:     return "fault";
    }
    return "unknown";
}

struct BlockOperation {
    OpType type;
    uint64_t ordinal;
    std::vector<char> data;  // used for LITERAL
    SyncError error;         // used for FAULT

    static BlockOperation makeCopy(uint64_t remoteOrdinal) {
        return { OpType::COPY, remoteOrdinal, {}, {} };
    }

    static BlockOperation makeLiteral(uint64_t localOrdinal, std::vector<char> data) {
        return { OpType::LITERAL, localOrdinal, std::move(data), {} };
    }

    static BlockOperation makeUnmatched(uint64_t localOrdinal) {
        return { OpType::UNMATCHED, localOrdinal, {}, {} };
    }

    static BlockOperation makeFault(uint64_t localOrdinal, SyncError error) {
        return { OpType::FAULT, localOrdinal, {}, std::move(error) };
    }

    bool hasData() const { return type == OpType::LITERAL; }
    bool isFault() const { return type == OpType::FAULT; }
};
