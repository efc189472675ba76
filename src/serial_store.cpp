// filename: src/serial_store.cpp
#include <core/serial_store.hpp>
#include <core/log.hpp>
#include <exception>

SerialStore::SerialStore(std::chrono::milliseconds visibility_timeout)
    : state_(visibility_timeout),
      work_(boost::asio::make_work_guard(io_)) {
    worker_ = std::thread([this] {
        for (;;) {
            try {
                io_.run();
                return;
            } catch (const std::exception& e) {
                // packaged_task captures handler exceptions, so this is an
                // asio internal failure; keep serving.
                spdlog::error("[serial_store] worker error: {}", e.what());
            }
        }
    });
}

SerialStore::~SerialStore() {
    shutdown();
}

void SerialStore::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return;
        stopped_ = true;
    }
    work_.reset();
    if (worker_.joinable()) worker_.join();
}

void SerialStore::add(Message msg) {
    run([m = std::move(msg)](QueueState& s) mutable {
        s.reclaim_expired(QueueState::Clock::now());
        s.add(std::move(m));
    });
}

std::vector<Message> SerialStore::lease(std::size_t count) {
    return run([count](QueueState& s) {
        const auto now = QueueState::Clock::now();
        s.reclaim_expired(now);
        return s.lease(count, now);
    });
}

std::size_t SerialStore::remove(const std::vector<MessageId>& ids,
                                std::optional<std::int64_t> lock_until) {
    return run([&ids, lock_until](QueueState& s) {
        s.reclaim_expired(QueueState::Clock::now());
        return s.remove(ids, lock_until);
    });
}

std::size_t SerialStore::purge() {
    return run([](QueueState& s) { return s.purge(); });
}

std::size_t SerialStore::retry(const std::vector<MessageId>& ids,
                               std::optional<std::int64_t> lock_until) {
    return run([&ids, lock_until](QueueState& s) {
        s.reclaim_expired(QueueState::Clock::now());
        return s.retry(ids, lock_until);
    });
}

std::vector<Message> SerialStore::peek(std::size_t count) {
    return run([count](QueueState& s) {
        s.reclaim_expired(QueueState::Clock::now());
        return s.peek(count);
    });
}

StoreStats SerialStore::stats() {
    return run([](QueueState& s) {
        s.reclaim_expired(QueueState::Clock::now());
        return s.stats();
    });
}
