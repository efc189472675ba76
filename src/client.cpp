// filename: src/client.cpp
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace http = boost::beast::http;
using boost::asio::ip::tcp;

namespace {

void usage() {
    std::cerr << "Usage: smql_client <host> <port> <command> [args...]\n"
              << "  hello | stats | purge\n"
              << "  add <body>\n"
              << "  get [count] | peek [count]\n"
              << "  delete <id>... [--lock-until <ms>] | retry <id>... [--lock-until <ms>]\n";
}

// Returns false on malformed arguments.
bool build_request(const std::string& cmd, const std::vector<std::string>& args,
                   http::verb& method, std::string& target, nlohmann::json& body) {
    method = http::verb::post;
    target = "/" + cmd;
    body = nlohmann::json::object();

    if (cmd == "hello" || cmd == "stats") {
        method = http::verb::get;
        return args.empty();
    }
    if (cmd == "purge") return args.empty();
    if (cmd == "add") {
        if (args.size() != 1) return false;
        body["body"] = args[0];
        return true;
    }
    if (cmd == "get" || cmd == "peek") {
        if (args.size() > 1) return false;
        if (args.size() == 1) {
            try {
                std::size_t pos = 0;
                unsigned long long n = std::stoull(args[0], &pos);
                if (pos != args[0].size()) return false;
                body["count"] = n;
            } catch (const std::exception&) {
                return false;
            }
        }
        return true;
    }
    if (cmd == "delete" || cmd == "retry") {
        std::vector<std::string> ids;
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (args[i] != "--lock-until") {
                ids.push_back(args[i]);
                continue;
            }
            if (++i == args.size()) return false;
            try {
                std::size_t pos = 0;
                long long token = std::stoll(args[i], &pos);
                if (pos != args[i].size()) return false;
                body["lock_until"] = token;
            } catch (const std::exception&) {
                return false;
            }
        }
        if (ids.empty()) return false;
        body["ids"] = ids;
        return true;
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        usage();
        return 1;
    }

    const char* host = argv[1];
    const char* port = argv[2];
    const std::string cmd = argv[3];
    const std::vector<std::string> args(argv + 4, argv + argc);

    http::verb method;
    std::string target;
    nlohmann::json body;
    if (!build_request(cmd, args, method, target, body)) {
        usage();
        return 1;
    }

    try {
        boost::asio::io_context io;
        boost::beast::tcp_stream stream(io);
        boost::system::error_code ec;
        const int max_attempts = 6;
        const int base_backoff_ms = 200;
        const int max_backoff_ms = 5000;
        bool connected = false;

        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            tcp::resolver resolver(io);
            auto results = resolver.resolve(host, port, ec);
            if (ec) {
                std::cerr << "[client] resolve failed (attempt " << attempt << "/" << max_attempts
                          << "): " << ec.message() << "\n";
            } else {
                stream.connect(results, ec);
                if (!ec) { connected = true; break; }
                std::cerr << "[client] connect failed (attempt " << attempt << "/" << max_attempts
                          << "): " << ec.message() << "\n";
            }
            int backoff = std::min(max_backoff_ms, base_backoff_ms << (attempt - 1));
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
        }
        if (!connected) {
            std::cerr << "[client] giving up after " << max_attempts << " attempts\n";
            return 1;
        }

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, host);
        req.set(http::field::user_agent, "smql_client");
        if (method == http::verb::post) {
            req.set(http::field::content_type, "application/json");
            req.body() = body.dump();
        }
        req.prepare_payload();

        http::write(stream, req);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        std::cout << res.body() << "\n";

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return res.result_int() / 100 == 2 ? 0 : 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
