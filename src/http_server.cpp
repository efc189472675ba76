// filename: src/http_server.cpp
#include <core/http_server.hpp>
#include <core/log.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/socket_base.hpp>
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <string_view>

namespace http = boost::beast::http;

namespace {
    // "\u0000" per byte is the worst case for escaping
    constexpr std::uint64_t kEscapeFactor = 6;
    constexpr std::uint64_t kEnvelopeOverhead = 4096;
    constexpr std::uint64_t kMinBodyLimit = 1 * 1024 * 1024;
}

std::uint64_t request_body_limit(std::size_t max_message_size) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    const auto size = static_cast<std::uint64_t>(max_message_size);
    if (size > (kMax - kEnvelopeOverhead) / kEscapeFactor) return kMax;
    return std::max(kMinBodyLimit, size * kEscapeFactor + kEnvelopeOverhead);
}

// Binds the acceptor; start() arms it
HttpServer::HttpServer(boost::asio::io_context& io_context,
                       unsigned short port,
                       QueueService& service,
                       std::uint64_t body_limit)
    : io_context_(io_context),
      acceptor_(io_context),
      strand_(io_context.get_executor()),
      acceptor_retry_timer_(io_context),
      service_(service),
      body_limit_(body_limit)
{
    setup_acceptor(port);
}

HttpServer::~HttpServer() {
    boost::system::error_code ignore;
    acceptor_retry_timer_.cancel();
    acceptor_.cancel(ignore);
    acceptor_.close(ignore);
}

void HttpServer::setup_acceptor(unsigned short port)
{
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    boost::system::error_code ec;

    // Try dual-stack IPv6 first
    tcp::endpoint ep6(tcp::v6(), port);
    acceptor_.open(ep6.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(asio::socket_base::reuse_address(true), ec); ec.clear();
        acceptor_.set_option(asio::ip::v6_only(false), ec); ec.clear();
        acceptor_.bind(ep6, ec);
        if (!ec) {
            acceptor_.listen(asio::socket_base::max_listen_connections, ec);
            if (!ec) {
                asio::ip::v6_only v6only_opt;
                bool v6only_value = true;
                acceptor_.get_option(v6only_opt, ec);
                if (!ec) v6only_value = v6only_opt.value();

                spdlog::info("[server] listening on [::]:{} ({})", local_port(),
                             v6only_value ? "IPv6-only" : "dual-stack");
                return;
            }
        }
        boost::system::error_code ignore;
        acceptor_.close(ignore);
    }

    // Fallback to IPv4-only
    ec.clear();
    tcp::endpoint ep4(tcp::v4(), port);
    acceptor_.open(ep4.protocol(), ec);
    if (ec) {
        spdlog::error("[server] FAILED to open acceptor (v4): {}", ec.message());
        throw boost::system::system_error(ec);
    }
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec); ec.clear();
    acceptor_.bind(ep4, ec);
    if (ec) {
        spdlog::error("[server] FAILED to bind 0.0.0.0:{} (v4): {}", port, ec.message());
        throw boost::system::system_error(ec);
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[server] FAILED to listen (v4): {}", ec.message());
        throw boost::system::system_error(ec);
    }
    spdlog::info("[server] listening on 0.0.0.0:{} (IPv4-only fallback)", local_port());
}

unsigned short HttpServer::local_port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void HttpServer::start() {
    boost::asio::post(strand_, [this] { do_accept(); });
}

void HttpServer::stop() {
    boost::asio::post(strand_, [this] {
        boost::system::error_code ignore;
        acceptor_retry_timer_.cancel();
        acceptor_.close(ignore);
        // only now, so the close above is never skipped by an early stop
        io_context_.stop();
    });
}

// Asynchronously accept connections and re-arm
void HttpServer::do_accept() {
    using tcp = boost::asio::ip::tcp;

    acceptor_.async_accept(
        boost::asio::make_strand(io_context_),
        boost::asio::bind_executor(strand_,
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                    return; // shutting down
                }
                // backoff = min(kMaxMs, kBaseMs << pow2), with jitter ±25%
                backoff_pow2_ = std::min<unsigned>(backoff_pow2_ + 1, 7);
                unsigned delay_ms = std::min<unsigned>(kBackoffMaxMs,
                                                       kBackoffBaseMs << backoff_pow2_);
                unsigned jitter = delay_ms / 4;
                unsigned rand0  = static_cast<unsigned>(std::rand()) % (2 * jitter + 1);
                unsigned delay_with_jitter = delay_ms - jitter + rand0;

                spdlog::warn("[server] accept error: {} (retry in {} ms)", ec.message(), delay_with_jitter);

                acceptor_retry_timer_.expires_after(std::chrono::milliseconds(delay_with_jitter));
                acceptor_retry_timer_.async_wait(
                    boost::asio::bind_executor(
                        strand_,
                        [this](const boost::system::error_code& tec) {
                            if (!tec) do_accept();
                        }));
                return;
            }

            // Success: reset backoff
            backoff_pow2_ = 0;

            auto session = std::make_shared<Session>(std::move(socket), service_, body_limit_);
            session->start();

            // Re-arm
            do_accept();
        }));
}

void HttpServer::Session::start() {
    spdlog::debug("[session] connected {}", peer_);
    boost::asio::dispatch(stream_.get_executor(),
        [self = shared_from_this()] { self->read_request(); });
}

void HttpServer::Session::read_request() {
    // A fresh parser per request, since body_limit applies per message
    parser_.emplace();
    parser_->body_limit(body_limit_);
    stream_.expires_after(kIdleTimeout);

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
        [this, self](boost::system::error_code ec, std::size_t bytes) {
            on_read(ec, bytes);
        });
}

void HttpServer::Session::on_read(boost::system::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        close();
        return;
    }
    if (ec == http::error::body_limit) {
        spdlog::warn("[session] {} request body exceeds {} bytes", peer_, body_limit_);
        send(make_response(http::status::payload_too_large,
                           error_body("Request body too large"), 11, false));
        return;
    }
    if (ec) { fail("read", ec); return; }

    HttpRequest req = parser_->release();
    HttpResponse res = handle_request(service_, req);
    spdlog::debug("[http] {} {} -> {}",
                  std::string_view(req.method_string().data(), req.method_string().size()),
                  std::string_view(req.target().data(), req.target().size()),
                  res.result_int());
    send(std::move(res));
}

void HttpServer::Session::send(HttpResponse res) {
    auto msg = std::make_shared<HttpResponse>(std::move(res));
    const bool close_after = msg->need_eof();
    auto self = shared_from_this();
    http::async_write(stream_, *msg,
        [this, self, msg, close_after](boost::system::error_code ec, std::size_t) {
            if (ec) { fail("write", ec); return; }
            if (close_after) { close(); return; }
            read_request();
        });
}

// Centralized error handling for session reads and writes
void HttpServer::Session::fail(const char* where, const boost::system::error_code& ec) {
    if (ec == boost::beast::error::timeout) {
        spdlog::debug("[session] {} idle timeout", peer_);
    } else if (ec != boost::asio::error::operation_aborted) {
        spdlog::warn("[session] {} {} error: {} (code={})", peer_, where, ec.message(), ec.value());
    }
    close();
}

void HttpServer::Session::close() {
    // Best-effort shutdown then close; ignore errors if already closed.
    boost::system::error_code ignore;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    stream_.socket().close(ignore);
    buffer_.clear();
    // Do NOT re-arm another read; let shared_ptr go out of scope naturally.
}
