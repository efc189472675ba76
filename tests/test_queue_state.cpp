// filename: tests/test_queue_state.cpp
#include <gtest/gtest.h>
#include <chrono>
#include <vector>
#include "core/queue_state.hpp"

namespace {

using Clock = QueueState::Clock;
using namespace std::chrono_literals;

std::vector<std::string> bodies(const std::vector<Message>& batch) {
    std::vector<std::string> out;
    for (const auto& m : batch) out.push_back(m.body);
    return out;
}

} // namespace

TEST(QueueState, LeaseIsFifoAndMarksProcessing) {
    QueueState q;
    q.add(Message("a"));
    q.add(Message("b"));
    q.add(Message("c"));

    auto batch = q.lease(2, Clock::now());
    EXPECT_EQ(bodies(batch), (std::vector<std::string>{"a", "b"}));
    for (const auto& m : batch) {
        EXPECT_EQ(m.state, MessageState::Processing);
        EXPECT_FALSE(m.lock_until.has_value());
    }
    EXPECT_EQ(q.stats().ready, 1u);
    EXPECT_EQ(q.stats().in_flight, 2u);
}

TEST(QueueState, LeaseReturnsWhatIsAvailable) {
    QueueState q;
    EXPECT_TRUE(q.lease(5, Clock::now()).empty());
    q.add(Message("only"));
    auto batch = q.lease(5, Clock::now());
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].body, "only");
    EXPECT_TRUE(q.lease(0, Clock::now()).empty());
}

TEST(QueueState, RemoveIsIdempotent) {
    QueueState q;
    q.add(Message("x"));
    auto batch = q.lease(1, Clock::now());
    ASSERT_EQ(batch.size(), 1u);

    EXPECT_EQ(q.remove({batch[0].id}), 1u);
    EXPECT_EQ(q.remove({batch[0].id}), 0u);
    EXPECT_EQ(q.remove({make_message_id()}), 0u);
    EXPECT_EQ(q.stats().ready, 0u);
    EXPECT_EQ(q.stats().in_flight, 0u);
}

TEST(QueueState, RemoveIgnoresReadyMessages) {
    QueueState q;
    Message m("ready");
    const MessageId id = m.id;
    q.add(std::move(m));
    EXPECT_EQ(q.remove({id}), 0u);
    EXPECT_EQ(q.stats().ready, 1u);
}

TEST(QueueState, RetryAppendsToTailAndCounts) {
    QueueState q;
    q.add(Message("a"));
    q.add(Message("b"));
    auto first = q.lease(1, Clock::now());
    ASSERT_EQ(first.size(), 1u);
    const Message leased = first[0];

    EXPECT_EQ(q.retry({leased.id}), 1u);
    auto view = q.peek(10);
    EXPECT_EQ(bodies(view), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(view[1].id, leased.id);
    EXPECT_EQ(view[1].retry_count, 1);
    EXPECT_EQ(view[1].state, MessageState::Ready);

    // not in flight any more
    EXPECT_EQ(q.retry({leased.id}), 0u);
    EXPECT_EQ(q.peek(10)[1].retry_count, 1);
}

TEST(QueueState, RetryFollowsRequestOrder) {
    QueueState q;
    q.add(Message("a"));
    q.add(Message("b"));
    q.add(Message("c"));
    auto batch = q.lease(3, Clock::now());
    ASSERT_EQ(batch.size(), 3u);

    EXPECT_EQ(q.retry({batch[2].id, make_message_id(), batch[0].id}), 2u);
    EXPECT_EQ(bodies(q.peek(10)), (std::vector<std::string>{"c", "a"}));
    EXPECT_EQ(q.stats().in_flight, 1u);
}

TEST(QueueState, PeekIsNonDestructive) {
    QueueState q;
    q.add(Message("a"));
    q.add(Message("b"));
    for (int i = 0; i < 3; ++i) {
        auto view = q.peek(1);
        ASSERT_EQ(view.size(), 1u);
        EXPECT_EQ(view[0].body, "a");
        EXPECT_EQ(view[0].state, MessageState::Ready);
    }
    EXPECT_EQ(q.peek(10).size(), 2u);
    EXPECT_EQ(q.stats().ready, 2u);
    EXPECT_EQ(q.stats().in_flight, 0u);
}

TEST(QueueState, PurgeClearsBothPartitions) {
    QueueState q;
    q.add(Message("a"));
    q.add(Message("b"));
    q.add(Message("c"));
    q.lease(1, Clock::now());
    EXPECT_EQ(q.purge(), 3u);
    EXPECT_EQ(q.stats().ready, 0u);
    EXPECT_EQ(q.stats().in_flight, 0u);
    EXPECT_EQ(q.purge(), 0u);
}

TEST(QueueState, Scenario) {
    QueueState q;
    Message a("A");
    Message b("B");
    const MessageId a_id = a.id;
    const MessageId b_id = b.id;
    q.add(std::move(a));
    q.add(std::move(b));
    EXPECT_EQ(bodies(q.peek(10)), (std::vector<std::string>{"A", "B"}));

    auto got = q.lease(1, Clock::now());
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].body, "A");
    EXPECT_EQ(got[0].state, MessageState::Processing);
    EXPECT_EQ(bodies(q.peek(10)), (std::vector<std::string>{"B"}));

    q.retry({a_id});
    auto view = q.peek(10);
    EXPECT_EQ(bodies(view), (std::vector<std::string>{"B", "A"}));
    EXPECT_EQ(view[1].retry_count, 1);

    got = q.lease(2, Clock::now());
    EXPECT_EQ(bodies(got), (std::vector<std::string>{"B", "A"}));

    q.remove({b_id});
    EXPECT_EQ(q.stats().in_flight, 1u);
    EXPECT_EQ(q.stats().ready, 0u);

    q.purge();
    EXPECT_EQ(q.stats().in_flight, 0u);
    EXPECT_EQ(q.stats().ready, 0u);
}

TEST(QueueState, ExpiryDisabledByDefault) {
    QueueState q;
    q.add(Message("a"));
    const auto t0 = Clock::now();
    q.lease(1, t0);
    EXPECT_EQ(q.reclaim_expired(t0 + 24h), 0u);
    EXPECT_EQ(q.stats().in_flight, 1u);
}

TEST(QueueState, LeaseSetsLockUntil) {
    QueueState q(30s);
    q.add(Message("a"));
    const auto t0 = Clock::now();
    auto batch = q.lease(1, t0);
    ASSERT_EQ(batch.size(), 1u);
    ASSERT_TRUE(batch[0].lock_until.has_value());
    EXPECT_EQ(*batch[0].lock_until, to_unix_ms(t0 + 30s));
}

TEST(QueueState, ExpiredLeasesReturnToTailInLeaseOrder) {
    QueueState q(10s);
    q.add(Message("a"));
    q.add(Message("b"));
    q.add(Message("c"));
    const auto t0 = Clock::now();
    q.lease(2, t0);

    EXPECT_EQ(q.reclaim_expired(t0 + 9s), 0u);
    EXPECT_EQ(q.stats().in_flight, 2u);

    EXPECT_EQ(q.reclaim_expired(t0 + 10s), 2u);
    auto view = q.peek(10);
    EXPECT_EQ(bodies(view), (std::vector<std::string>{"c", "a", "b"}));
    EXPECT_EQ(view[1].retry_count, 1);
    EXPECT_EQ(view[2].retry_count, 1);
    EXPECT_FALSE(view[1].lock_until.has_value());
    EXPECT_EQ(q.stats().in_flight, 0u);
}

TEST(QueueState, RetryClearsLockUntil) {
    QueueState q(10s);
    q.add(Message("a"));
    auto batch = q.lease(1, Clock::now());
    ASSERT_EQ(batch.size(), 1u);
    q.retry({batch[0].id});
    auto view = q.peek(1);
    ASSERT_EQ(view.size(), 1u);
    EXPECT_FALSE(view[0].lock_until.has_value());
}

TEST(QueueState, StaleLeaseHolderCannotRetryOrDelete) {
    QueueState q(10s);
    q.add(Message("a"));
    const auto t0 = Clock::now();

    auto first = q.lease(1, t0);
    ASSERT_EQ(first.size(), 1u);
    const MessageId id = first[0].id;
    const auto stale = first[0].lock_until;

    // first holder's lease lapses, a second consumer takes the message
    EXPECT_EQ(q.reclaim_expired(t0 + 10s), 1u);
    auto second = q.lease(1, t0 + 10s);
    ASSERT_EQ(second.size(), 1u);
    ASSERT_EQ(second[0].id, id);
    EXPECT_NE(second[0].lock_until, stale);

    // late calls from the first holder are ignored
    EXPECT_EQ(q.retry({id}, stale), 0u);
    EXPECT_EQ(q.remove({id}, stale), 0u);
    EXPECT_EQ(q.stats().in_flight, 1u);
    EXPECT_TRUE(q.lease(1, t0 + 11s).empty());

    // the current holder still can
    EXPECT_EQ(q.remove({id}, second[0].lock_until), 1u);
    EXPECT_EQ(q.stats().in_flight, 0u);
    EXPECT_EQ(q.stats().ready, 0u);
}

TEST(QueueState, TokenOnlyMatchesItsOwnBatch) {
    QueueState q(10s);
    q.add(Message("a"));
    q.add(Message("b"));
    const auto t0 = Clock::now();
    auto first = q.lease(1, t0);
    auto second = q.lease(1, t0 + 1s);
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);

    EXPECT_EQ(q.retry({first[0].id, second[0].id}, first[0].lock_until), 1u);
    EXPECT_EQ(bodies(q.peek(10)), (std::vector<std::string>{"a"}));
    EXPECT_EQ(q.stats().in_flight, 1u);

    // without a token the id alone addresses the current lease
    EXPECT_EQ(q.remove({second[0].id}), 1u);
    EXPECT_EQ(q.stats().in_flight, 0u);
}
