// filename: tests/test_message.cpp
#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <thread>
#include <vector>
#include <boost/uuid/uuid_io.hpp>
#include "core/message.hpp"

TEST(MessageId, VersionAndVariantBits) {
    MessageId id = make_message_id();
    EXPECT_EQ(id.data[6] >> 4, 0x7);
    EXPECT_EQ(id.data[8] & 0xC0, 0x80);
}

TEST(MessageId, TimestampPrefixIsNonDecreasing) {
    MessageId a = make_message_id();
    MessageId b = make_message_id();
    std::string sa = message_id_text(a).substr(0, 13);
    std::string sb = message_id_text(b).substr(0, 13);
    EXPECT_LE(sa, sb);
}

TEST(MessageId, StrictlyIncreasingWithinOneMillisecond) {
    // far more ids than fit in one millisecond's wall clock
    MessageId prev = make_message_id();
    for (int i = 0; i < 10000; ++i) {
        MessageId next = make_message_id();
        ASSERT_LT(prev, next) << message_id_text(prev) << " !< " << message_id_text(next);
        ASSERT_LT(message_id_text(prev), message_id_text(next));
        prev = next;
    }
}

TEST(MessageId, IncreasingAcrossThreads) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 2000;
    std::vector<std::vector<MessageId>> ids(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&ids, t] {
            for (int i = 0; i < kPerThread; ++i) ids[t].push_back(make_message_id());
        });
    }
    for (auto& th : threads) th.join();

    std::set<MessageId> all;
    for (const auto& v : ids) {
        for (std::size_t i = 1; i < v.size(); ++i) EXPECT_LT(v[i - 1], v[i]);
        all.insert(v.begin(), v.end());
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(MessageId, TextMatchesBoostCanonicalForm) {
    // both names are visible here, as in any caller that includes uuid_io
    MessageId id = make_message_id();
    EXPECT_EQ(message_id_text(id), boost::uuids::to_string(id));
    std::string via_adl = to_string(id);
    EXPECT_EQ(via_adl, message_id_text(id));
}

TEST(MessageId, CanonicalFormIsLowercaseHyphenated) {
    std::string s = message_id_text(make_message_id());
    ASSERT_EQ(s.size(), 36u);
    EXPECT_EQ(s[8], '-');
    EXPECT_EQ(s[13], '-');
    EXPECT_EQ(s[14], '7');
    for (char c : s) {
        EXPECT_TRUE(c == '-' || std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f'));
    }
}

TEST(MessageId, UniqueAcrossManyCalls) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(message_id_text(make_message_id())).second);
    }
}

TEST(MessageId, ParseAcceptsCommonSpellings) {
    MessageId id = make_message_id();
    std::string canon = message_id_text(id);

    std::string plain = canon;
    plain.erase(std::remove(plain.begin(), plain.end(), '-'), plain.end());
    std::string upper = canon;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const std::string& text : {canon, plain, "{" + canon + "}", upper}) {
        auto parsed = parse_message_id(text);
        ASSERT_TRUE(parsed.has_value()) << text;
        EXPECT_EQ(*parsed, id) << text;
    }
}

TEST(MessageId, ParseRejectsMalformed) {
    EXPECT_FALSE(parse_message_id("").has_value());
    EXPECT_FALSE(parse_message_id("not-a-uuid").has_value());
    EXPECT_FALSE(parse_message_id("0190a0f1-2b3c-7d4e-8f50-61728394a5b").has_value());
    EXPECT_FALSE(parse_message_id("0190a0f1-2b3c-7d4e-8f50-61728394a5b6f").has_value());
    EXPECT_FALSE(parse_message_id("0190a0f1-2b3c-7d4e-8f50-61728394a5bz").has_value());
}

TEST(Message, NewMessageDefaults) {
    Message m("hello");
    EXPECT_EQ(m.body, "hello");
    EXPECT_EQ(m.state, MessageState::Ready);
    EXPECT_FALSE(m.lock_until.has_value());
    EXPECT_EQ(m.retry_count, 0);

    Message other("hello");
    EXPECT_NE(m.id, other.id);
}

TEST(Message, JsonShape) {
    Message m("payload");
    nlohmann::json j = m;
    EXPECT_EQ(j.at("id"), message_id_text(m.id));
    EXPECT_EQ(j.at("body"), "payload");
    EXPECT_EQ(j.at("state"), "Ready");
    EXPECT_TRUE(j.at("lock_until").is_null());
    EXPECT_EQ(j.at("retry_count"), 0);

    m.state = MessageState::Processing;
    m.lock_until = 1700000000000;
    m.retry_count = 2;
    j = m;
    EXPECT_EQ(j.at("state"), "Processing");
    EXPECT_EQ(j.at("lock_until"), 1700000000000);
    EXPECT_EQ(j.at("retry_count"), 2);
}
