// filename: memory_store.hpp
#pragma once
#include <core/message_store.hpp>
#include <core/queue_state.hpp>
#include <mutex>

// MemoryStore: one mutex guards both partitions for the whole call, so a
// message can never be leased twice or dropped between the two.

class MemoryStore : public MessageStore {
private:
    QueueState state_;
    std::mutex mutex_;

    void reclaim_locked() {
        state_.reclaim_expired(QueueState::Clock::now());
    }

public:
    explicit MemoryStore(std::chrono::milliseconds visibility_timeout = std::chrono::milliseconds{0})
        : state_(visibility_timeout) {}

    void add(Message msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaim_locked();
        state_.add(std::move(msg));
    }

    std::vector<Message> lease(std::size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = QueueState::Clock::now();
        state_.reclaim_expired(now);
        return state_.lease(count, now);
    }

    std::size_t remove(const std::vector<MessageId>& ids,
                       std::optional<std::int64_t> lock_until = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaim_locked();
        return state_.remove(ids, lock_until);
    }

    std::size_t purge() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.purge();
    }

    std::size_t retry(const std::vector<MessageId>& ids,
                      std::optional<std::int64_t> lock_until = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaim_locked();
        return state_.retry(ids, lock_until);
    }

    std::vector<Message> peek(std::size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaim_locked();
        return state_.peek(count);
    }

    StoreStats stats() override {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaim_locked();
        return state_.stats();
    }
};
