// filename: core/message.hpp
#pragma once
#include <boost/uuid/uuid.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Time-ordered UUID (version 7); the only handle for delete/retry.
using MessageId = boost::uuids::uuid;

MessageId make_message_id();

// Accepts hyphenated, plain 32-hex and braced spellings.
std::optional<MessageId> parse_message_id(std::string_view text);

// Canonical lowercase hyphenated form.
std::string message_id_text(const MessageId& id);

struct MessageIdHash {
    std::size_t operator()(const MessageId& id) const noexcept;
};

enum class MessageState { Ready, Processing, Done };

const char* message_state_name(MessageState state);

// Passive record. State transitions are made by the store only.
struct Message {
    explicit Message(std::string message_body);

    MessageId id;
    std::string body;
    MessageState state{MessageState::Ready};
    // Unix milliseconds; set only while leased with a visibility timeout.
    std::optional<std::int64_t> lock_until;
    std::int32_t retry_count{0};
};

void to_json(nlohmann::json& j, const Message& msg);
