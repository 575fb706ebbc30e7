#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include "config.hpp"

// Bounded hand-off queue between one producer thread and one consumer.
// push() blocks while the queue is full, pop() blocks while it is empty.
// The producer calls close() when it is done; the consumer calls abandon()
// when it stops listening, after which every push() fails.
template<typename T>
class Channel {
public:
    explicit Channel(size_t capacity = Config::CHANNEL_CAPACITY)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this]() {
            return abandoned_ || closed_ || items_.size() < capacity_;
        });
        if (abandoned_ || closed_)
            return false;

        items_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    // std::nullopt once the channel is closed and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this]() {
            return !items_.empty() || closed_ || abandoned_;
        });
        if (items_.empty())
            return std::nullopt;

        T item = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return item;
    }

    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    void abandon() {
        std::unique_lock<std::mutex> lock(mutex_);
        abandoned_ = true;
        items_.clear();
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool isClosed() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    const size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    bool closed_ = false;
    bool abandoned_ = false;
};
