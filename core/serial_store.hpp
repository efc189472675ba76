// filename: core/serial_store.hpp
#pragma once
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <core/message_store.hpp>
#include <core/queue_state.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

// SerialStore: the partitions are owned by one worker thread running a
// private io_context. Each call is posted to it as a command and the caller
// blocks on the result, so commands execute one at a time in post order.
// Must not be called from the worker thread itself.
class SerialStore : public MessageStore {
public:
    explicit SerialStore(std::chrono::milliseconds visibility_timeout = std::chrono::milliseconds{0});
    ~SerialStore();

    SerialStore(const SerialStore&) = delete;
    SerialStore& operator=(const SerialStore&) = delete;

    void add(Message msg) override;
    std::vector<Message> lease(std::size_t count) override;
    std::size_t remove(const std::vector<MessageId>& ids,
                       std::optional<std::int64_t> lock_until = std::nullopt) override;
    std::size_t purge() override;
    std::size_t retry(const std::vector<MessageId>& ids,
                      std::optional<std::int64_t> lock_until = std::nullopt) override;
    std::vector<Message> peek(std::size_t count) override;
    StoreStats stats() override;

    // Drains queued commands and joins the worker. Later calls throw StoreError.
    void shutdown();

private:
    template <class F>
    auto run(F&& f) -> decltype(f(std::declval<QueueState&>())) {
        using R = decltype(f(std::declval<QueueState&>()));
        auto task = std::make_shared<std::packaged_task<R()>>(
            [this, fn = std::forward<F>(f)]() mutable { return fn(state_); });
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stopped_) throw StoreError("store is shut down");
            boost::asio::post(io_, [task] { (*task)(); });
        }
        return result.get();
    }

    QueueState state_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::mutex mu_;
    bool stopped_{false};
    std::thread worker_;
};
