// filename: src/queue_state.cpp
#include <core/queue_state.hpp>
#include <algorithm>
#include <utility>

QueueState::QueueState(std::chrono::milliseconds visibility_timeout)
    : visibility_timeout_(visibility_timeout.count() > 0 ? visibility_timeout
                                                          : std::chrono::milliseconds{0}) {}

void QueueState::add(Message msg) {
    msg.state = MessageState::Ready;
    msg.lock_until.reset();
    ready_.push_back(std::move(msg));
}

std::vector<Message> QueueState::lease(std::size_t count, Clock::time_point now) {
    const std::size_t n = std::min(count, ready_.size());
    std::vector<Message> out;
    out.reserve(n);

    std::optional<std::int64_t> lock_until;
    if (visibility_timeout_.count() > 0) {
        lock_until = to_unix_ms(now + visibility_timeout_);
    }

    for (std::size_t i = 0; i < n; ++i) {
        Message msg = std::move(ready_.front());
        ready_.pop_front();
        msg.state = MessageState::Processing;
        msg.lock_until = lock_until;
        out.push_back(msg);
        const MessageId id = msg.id;
        in_flight_.emplace(id, Lease{std::move(msg), next_seq_++});
    }
    return out;
}

std::unordered_map<MessageId, QueueState::Lease, MessageIdHash>::iterator
QueueState::find_held(const MessageId& id, const std::optional<std::int64_t>& lock_until) {
    auto it = in_flight_.find(id);
    if (it != in_flight_.end() && lock_until && it->second.msg.lock_until != lock_until) {
        return in_flight_.end();
    }
    return it;
}

std::size_t QueueState::remove(const std::vector<MessageId>& ids,
                               std::optional<std::int64_t> lock_until) {
    std::size_t removed = 0;
    for (const auto& id : ids) {
        auto it = find_held(id, lock_until);
        if (it == in_flight_.end()) continue;
        in_flight_.erase(it);
        ++removed;
    }
    return removed;
}

std::size_t QueueState::purge() {
    const std::size_t n = ready_.size() + in_flight_.size();
    ready_.clear();
    in_flight_.clear();
    return n;
}

std::size_t QueueState::retry(const std::vector<MessageId>& ids,
                              std::optional<std::int64_t> lock_until) {
    std::size_t moved = 0;
    for (const auto& id : ids) {
        auto it = find_held(id, lock_until);
        if (it == in_flight_.end()) continue;
        Message msg = std::move(it->second.msg);
        in_flight_.erase(it);
        requeue(std::move(msg));
        ++moved;
    }
    return moved;
}

std::vector<Message> QueueState::peek(std::size_t count) const {
    const std::size_t n = std::min(count, ready_.size());
    return std::vector<Message>(ready_.begin(), ready_.begin() + static_cast<std::ptrdiff_t>(n));
}

StoreStats QueueState::stats() const noexcept {
    return StoreStats{ready_.size(), in_flight_.size()};
}

std::size_t QueueState::reclaim_expired(Clock::time_point now) {
    if (visibility_timeout_.count() == 0 || in_flight_.empty()) return 0;

    const std::int64_t now_ms = to_unix_ms(now);
    std::vector<Lease> expired;
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        const auto& lock_until = it->second.msg.lock_until;
        if (lock_until && *lock_until <= now_ms) {
            expired.push_back(std::move(it->second));
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }

    std::sort(expired.begin(), expired.end(),
              [](const Lease& a, const Lease& b) { return a.seq < b.seq; });
    for (auto& lease : expired) {
        requeue(std::move(lease.msg));
    }
    return expired.size();
}

void QueueState::requeue(Message msg) {
    ++msg.retry_count;
    msg.state = MessageState::Ready;
    msg.lock_until.reset();
    ready_.push_back(std::move(msg));
}
