// filename: core/metrics.hpp
#pragma once
#include <atomic>
#include <cstdint>

// Message counts since start; rejected counts requests failing validation.
struct Metrics {
    std::atomic<uint64_t> added{0};
    std::atomic<uint64_t> leased{0};
    std::atomic<uint64_t> deleted{0};
    std::atomic<uint64_t> retried{0};
    std::atomic<uint64_t> purged{0};
    std::atomic<uint64_t> rejected{0};
};
