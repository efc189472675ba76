// filename: core/queue_state.hpp
#pragma once
#include <core/message.hpp>
#include <core/message_store.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

// The two partitions and the transitions between them. Not thread-safe:
// the store adapters serialize access.
//
// A message is either in ready_ (state Ready) or in in_flight_
// (state Processing), never both. Deletion removes it entirely.
class QueueState {
public:
    using Clock = std::chrono::system_clock;

    // A zero timeout disables lease expiry.
    explicit QueueState(std::chrono::milliseconds visibility_timeout = std::chrono::milliseconds{0});

    void add(Message msg);
    std::vector<Message> lease(std::size_t count, Clock::time_point now);
    std::size_t remove(const std::vector<MessageId>& ids,
                       std::optional<std::int64_t> lock_until = std::nullopt);
    std::size_t purge();
    std::size_t retry(const std::vector<MessageId>& ids,
                      std::optional<std::int64_t> lock_until = std::nullopt);
    std::vector<Message> peek(std::size_t count) const;
    StoreStats stats() const noexcept;

    // Returns expired leases to the ready tail as if retried, oldest lease
    // first. No-op when expiry is disabled.
    std::size_t reclaim_expired(Clock::time_point now);

    std::chrono::milliseconds visibility_timeout() const noexcept { return visibility_timeout_; }

private:
    struct Lease {
        Message msg;
        std::uint64_t seq;
    };

    void requeue(Message msg);
    // In-flight entry for id, if it is held under lock_until (any lease when unset).
    std::unordered_map<MessageId, Lease, MessageIdHash>::iterator
    find_held(const MessageId& id, const std::optional<std::int64_t>& lock_until);

    std::chrono::milliseconds visibility_timeout_;
    std::deque<Message> ready_;
    std::unordered_map<MessageId, Lease, MessageIdHash> in_flight_;
    std::uint64_t next_seq_{0};
};

inline std::int64_t to_unix_ms(QueueState::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}
