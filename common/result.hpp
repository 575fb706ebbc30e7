// Result.hpp
#pragma once
#include <string>
#include <utility>
#include "sync_error.hpp"

template<typename T>
struct Result {
    bool success;
    ErrorCode code;
    std::string message;
    T data;

    static Result<T> Ok(T data) {
        return {true, ErrorCode::None, "", std::move(data)};
    }

    static Result<T> Error(const SyncError& err) {
        return {false, err.code, err.message, T{}};
    }

    static Result<T> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg, T{}};
    }

    // A failure that still hands back whatever was produced before it.
    static Result<T> Error(const SyncError& err, T partial) {
        return {false, err.code, err.message, std::move(partial)};
    }

    SyncError error() const {
        return {code, message};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    ErrorCode code;
    std::string message;

    static Result<void> Ok() {
        return {true, ErrorCode::None, ""};
    }

    static Result<void> Error(const SyncError& err) {
        return {false, err.code, err.message};
    }

    static Result<void> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg};
    }

    SyncError error() const {
        return {code, message};
    }
};
