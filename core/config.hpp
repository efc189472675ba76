// filename: core/config.hpp
#pragma once
#include <core/log.hpp>
#include <core/store_factory.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string_view>

// Process configuration, built once in main and passed down.
struct Config {
    static constexpr unsigned short kDefaultPort = 1337;
    static constexpr std::size_t kDefaultMaxMessageSize = 64 * 1024;
    // Larger SMQL_MAX_MESSAGE_SIZE values are clamped to this.
    static constexpr std::size_t kMaxMessageSizeCap = std::size_t{1} << 30;

    unsigned short port{kDefaultPort};
    std::size_t max_message_size{kDefaultMaxMessageSize};
    spdlog::level::level_enum log_level{spdlog::level::info};
    std::size_t threads{1};
    StoreKind store{StoreKind::Memory};
    std::chrono::seconds visibility_timeout{0};

    // Reads SMQL_* variables through `lookup` (std::getenv by default).
    // Invalid values are reported and the default is kept.
    static Config from_env(const std::function<const char*(const char*)>& lookup = std::getenv);
};

// "<n>" bytes or "<n>K"/"<n>k" kibibytes; zero is rejected.
std::optional<std::size_t> parse_size(std::string_view value);

// Strict positive decimal; surrounding whitespace is allowed.
std::optional<std::uint64_t> parse_positive(std::string_view value);

std::size_t default_thread_count();
std::size_t max_thread_count();
