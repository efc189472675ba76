// filename: core/io_workers.hpp
#pragma once
#include <boost/asio/io_context.hpp>
#include <cstddef>

// Runs io_context on `threads` threads (at least one) and joins them.
// A handler that throws is logged and its thread re-enters run(), so a
// failing request never shrinks the pool. Returns once every run() returns,
// i.e. after io_context.stop() or when the context runs out of work.
void run_io_workers(boost::asio::io_context& io_context, std::size_t threads);
