// filename: core/http_server.hpp
#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <core/http_api.hpp>
#include <core/queue_service.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

// Parser body limit for a given message size limit: room for JSON escaping
// (up to 6 bytes per body byte) plus the envelope, never below 1 MiB.
// Saturates instead of wrapping.
std::uint64_t request_body_limit(std::size_t max_message_size);

class HttpServer {
public:
    // io_context: async operations, may be run by several threads
    // body_limit caps the raw request body the parser accepts
    HttpServer(boost::asio::io_context& io_context,
               unsigned short port,
               QueueService& service,
               std::uint64_t body_limit);

    ~HttpServer();

    // Start accepting connections
    void start();
    // Close the acceptor, then stop io_context. Safe from any thread,
    // including a signal handler running on io_context.
    void stop();

    unsigned short local_port() const;

private:
    void do_accept();
    void setup_acceptor(unsigned short port);

    static constexpr unsigned kBackoffBaseMs = 10;
    static constexpr unsigned kBackoffMaxMs = 1000;

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    // serialize accept handlers and the retry timer
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer acceptor_retry_timer_;
    unsigned backoff_pow2_{0};

    QueueService& service_;
    std::uint64_t body_limit_;

    // one HTTP/1.1 connection; lives as long as an async op holds it
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(boost::asio::ip::tcp::socket socket,
                QueueService& service,
                std::uint64_t body_limit)
        : stream_(std::move(socket)),
          service_(service),
          body_limit_(body_limit) {
            boost::system::error_code ip_ec;
            auto ep = stream_.socket().remote_endpoint(ip_ec);
            peer_ = ip_ec ? std::string("<unknown>") : ep.address().to_string();
        }

        void start();

    private:
        void read_request();
        void on_read(boost::system::error_code ec, std::size_t bytes);
        void send(HttpResponse res);
        void fail(const char* where, const boost::system::error_code& ec);
        void close();

        static constexpr std::chrono::seconds kIdleTimeout{30};

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
        QueueService& service_;
        std::uint64_t body_limit_;
        std::string peer_;
    };
};
