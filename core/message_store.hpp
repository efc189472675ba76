// filename: core/message_store.hpp
#pragma once
#include <core/message.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Storage failure. The in-memory backends only raise it on shutdown.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StoreStats {
    std::size_t ready{0};
    std::size_t in_flight{0};
};

// Storage interface for the queue: a FIFO ready queue plus an in-flight set
// keyed by id. Every call is atomic with respect to every other call.
//
// remove() and retry() take the lease's lock_until as an optional token.
// With a token they only touch messages still held under that lease, so a
// holder whose lease expired cannot act on the message after someone else
// leased it again. Without one they act on whatever lease is current.
class MessageStore {
public:
    virtual void add(Message msg) = 0;
    // Moves up to `count` messages from the head of the ready queue into the
    // in-flight set and returns them in queue order.
    virtual std::vector<Message> lease(std::size_t count) = 0;
    // Ids not in flight are skipped. Returns the number removed.
    virtual std::size_t remove(const std::vector<MessageId>& ids,
                               std::optional<std::int64_t> lock_until = std::nullopt) = 0;
    virtual std::size_t purge() = 0;
    // Returns in-flight messages to the ready tail. Returns the number moved.
    virtual std::size_t retry(const std::vector<MessageId>& ids,
                              std::optional<std::int64_t> lock_until = std::nullopt) = 0;
    virtual std::vector<Message> peek(std::size_t count) = 0;
    virtual StoreStats stats() = 0;
    virtual ~MessageStore() = default;
};
