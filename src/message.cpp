// filename: src/message.cpp
#include <core/message.hpp>
#include <boost/functional/hash.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <mutex>
#include <stdexcept>

namespace {
    // Last timestamp handed out and the 12-bit sequence within it (rand_a).
    // Shared by all threads so ids from one process sort in creation order.
    std::mutex g_id_mu;
    std::uint64_t g_last_ms = 0;
    std::uint16_t g_seq = 0;
}

MessageId make_message_id() {
    // random_generator is not thread-safe
    thread_local boost::uuids::random_generator gen;
    MessageId id = gen();

    const auto now_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    std::uint64_t ms;
    std::uint16_t seq;
    {
        std::lock_guard<std::mutex> lk(g_id_mu);
        if (now_ms > g_last_ms) {
            g_last_ms = now_ms;
            g_seq = 0;
        } else if (++g_seq > 0x0FFF) {
            // sequence exhausted (or clock went back): borrow the next millisecond
            ++g_last_ms;
            g_seq = 0;
        }
        ms = g_last_ms;
        seq = g_seq;
    }

    // 48-bit big-endian timestamp, version 7 + 12-bit sequence, RFC 4122 variant
    for (int i = 0; i < 6; ++i) {
        id.data[i] = static_cast<std::uint8_t>(ms >> (8 * (5 - i)));
    }
    id.data[6] = static_cast<std::uint8_t>(0x70 | (seq >> 8));
    id.data[7] = static_cast<std::uint8_t>(seq & 0xFF);
    id.data[8] = static_cast<std::uint8_t>((id.data[8] & 0x3F) | 0x80);
    return id;
}

std::optional<MessageId> parse_message_id(std::string_view text) {
    if (text.empty()) return std::nullopt;
    try {
        boost::uuids::string_generator gen;
        return gen(text.begin(), text.end());
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

std::string message_id_text(const MessageId& id) {
    return boost::uuids::to_string(id);
}

std::size_t MessageIdHash::operator()(const MessageId& id) const noexcept {
    return boost::hash_range(id.begin(), id.end());
}

const char* message_state_name(MessageState state) {
    switch (state) {
        case MessageState::Processing: return "Processing";
        case MessageState::Done:       return "Done";
        default:                       return "Ready";
    }
}

Message::Message(std::string message_body)
    : id(make_message_id()), body(std::move(message_body)) {}

void to_json(nlohmann::json& j, const Message& msg) {
    j = nlohmann::json{
        {"id", message_id_text(msg.id)},
        {"body", msg.body},
        {"state", message_state_name(msg.state)},
        {"lock_until", nullptr},
        {"retry_count", msg.retry_count},
    };
    if (msg.lock_until) j["lock_until"] = *msg.lock_until;
}
