// filename: src/server_main.cpp
#include <core/config.hpp>
#include <core/http_server.hpp>
#include <core/io_workers.hpp>
#include <core/log.hpp>
#include <core/queue_service.hpp>
#include <core/store_factory.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>

int main() {
    Config cfg = Config::from_env();
    init_logging(cfg.log_level);

    spdlog::info("[smql] starting: port={} max_message_size={} log_level={} threads={} store={} "
                 "visibility_timeout={}s",
                 cfg.port, cfg.max_message_size, spdlog::level::to_string_view(cfg.log_level),
                 cfg.threads, store_kind_name(cfg.store), cfg.visibility_timeout.count());

    try {
        auto store = make_store(cfg.store, cfg.visibility_timeout);
        QueueService service(store, cfg);

        boost::asio::io_context io_context;
        HttpServer server(io_context, cfg.port, service, request_body_limit(cfg.max_message_size));
        server.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&server](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            spdlog::info("[smql] signal {} received, shutting down", signo);
            server.stop();
        });

        // returns once server.stop() has closed the acceptor and stopped io_context
        run_io_workers(io_context, cfg.threads);
    } catch (const std::exception& e) {
        spdlog::error("[smql] fatal: {}", e.what());
        return 1;
    }

    spdlog::info("[smql] stopped");
    return 0;
}
