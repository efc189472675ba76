// filename: store_factory.hpp
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <message_store.hpp>

enum class StoreKind {Memory, Serial};

// "memory" or "serial"
std::optional<StoreKind> parse_store_kind(std::string_view name);
const char* store_kind_name(StoreKind kind);

std::shared_ptr<MessageStore> make_store(StoreKind kind,
                                         std::chrono::milliseconds visibility_timeout);
