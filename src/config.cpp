// filename: src/config.cpp
#include <core/config.hpp>
#include <cctype>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <thread>

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<std::uint64_t> parse_decimal(std::string_view s) {
    if (s.empty()) return std::nullopt;
    std::uint64_t v = 0;
    const char* b = s.data();
    const char* e = s.data() + s.size();
    auto res = std::from_chars(b, e, v, 10);
    if (res.ec != std::errc{} || res.ptr != e) return std::nullopt;
    return v;
}

} // namespace

std::optional<std::uint64_t> parse_positive(std::string_view value) {
    auto v = parse_decimal(trim(value));
    if (!v || *v == 0) return std::nullopt;
    return v;
}

std::optional<std::size_t> parse_size(std::string_view value) {
    value = trim(value);
    if (value.empty()) return std::nullopt;

    std::uint64_t multiplier = 1;
    if (value.back() == 'K' || value.back() == 'k') {
        multiplier = 1024;
        value.remove_suffix(1);
    }
    auto n = parse_decimal(value);
    if (!n || *n == 0) return std::nullopt;
    if (*n > std::numeric_limits<std::size_t>::max() / multiplier) return std::nullopt;
    return static_cast<std::size_t>(*n * multiplier);
}

std::size_t default_thread_count() {
    const std::size_t hw = std::thread::hardware_concurrency();
    return hw ? hw : 1;
}

std::size_t max_thread_count() {
    return std::min<std::size_t>(default_thread_count() * 4, 256);
}

Config Config::from_env(const std::function<const char*(const char*)>& lookup) {
    Config cfg;
    cfg.threads = default_thread_count();

    if (const char* env = lookup("SMQL_PORT")) {
        auto v = parse_positive(env);
        if (!v || *v > std::numeric_limits<unsigned short>::max()) {
            spdlog::warn("[config] ignoring SMQL_PORT (not a valid port): '{}'", env);
        } else {
            cfg.port = static_cast<unsigned short>(*v);
        }
    }

    if (const char* env = lookup("SMQL_MAX_MESSAGE_SIZE")) {
        if (auto v = parse_size(env)) {
            cfg.max_message_size = std::min(*v, kMaxMessageSizeCap);
            if (*v > kMaxMessageSizeCap) {
                spdlog::warn("[config] SMQL_MAX_MESSAGE_SIZE={} too large; clamping to {}", *v, kMaxMessageSizeCap);
            }
        } else {
            spdlog::warn("[config] ignoring SMQL_MAX_MESSAGE_SIZE (expected <n> or <n>K): '{}'", env);
        }
    }

    if (const char* env = lookup("SMQL_LOG_LEVEL")) {
        cfg.log_level = parse_log_level(env);
    }

    if (const char* env = lookup("SMQL_THREADS")) {
        auto v = parse_positive(env);
        if (!v) {
            spdlog::warn("[config] ignoring SMQL_THREADS (not a positive integer): '{}'", env);
        } else {
            cfg.threads = static_cast<std::size_t>(std::min<std::uint64_t>(*v, max_thread_count()));
            if (*v > max_thread_count()) {
                spdlog::warn("[config] SMQL_THREADS={} too large; clamping to {}", *v, max_thread_count());
            }
        }
    }

    if (const char* env = lookup("SMQL_STORE")) {
        if (auto kind = parse_store_kind(trim(env))) {
            cfg.store = *kind;
        } else {
            spdlog::warn("[config] ignoring SMQL_STORE (expected memory or serial): '{}'", env);
        }
    }

    if (const char* env = lookup("SMQL_VISIBILITY_TIMEOUT")) {
        const std::string_view s = trim(env);
        if (s == "0") {
            cfg.visibility_timeout = std::chrono::seconds{0};
        } else if (auto v = parse_positive(s)) {
            cfg.visibility_timeout = std::chrono::seconds{static_cast<std::chrono::seconds::rep>(*v)};
        } else {
            spdlog::warn("[config] ignoring SMQL_VISIBILITY_TIMEOUT (expected seconds): '{}'", env);
        }
    }

    return cfg;
}
