// filename: src/io_workers.cpp
#include <core/io_workers.hpp>
#include <core/log.hpp>
#include <exception>
#include <thread>
#include <vector>

namespace {

void worker_loop(boost::asio::io_context& io_context) {
    for (;;) {
        try {
            io_context.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("[io] handler threw: {}", e.what());
        }
    }
}

} // namespace

void run_io_workers(boost::asio::io_context& io_context, std::size_t threads) {
    if (threads == 0) threads = 1;
    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (std::size_t i = 1; i < threads; ++i) {
        workers.emplace_back([&io_context] { worker_loop(io_context); });
    }
    // the calling thread is the last worker
    worker_loop(io_context);
    for (auto& t : workers) t.join();
}
