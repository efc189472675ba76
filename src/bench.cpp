// filename: src/bench.cpp
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace http = boost::beast::http;

namespace {

constexpr std::size_t kBatch = 100;

nlohmann::json call(boost::beast::tcp_stream& stream, const std::string& host,
                    const char* target, const nlohmann::json& body) {
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.keep_alive(true);
    req.body() = body.dump();
    req.prepare_payload();
    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    if (res.result() != http::status::ok) {
        throw std::runtime_error(std::string(target) + " failed: " + res.body());
    }
    return nlohmann::json::parse(res.body());
}

void report(const char* phase, std::size_t count, std::chrono::steady_clock::duration d) {
    auto dur_ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    double mps = dur_ms > 0 ? (double)count / (dur_ms / 1000.0) : 0.0;
    std::cout << phase << "=" << count << " msgs in " << dur_ms << " ms => " << mps << " msg/s\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 5) {
        std::cerr << "Usage: smql_bench <host> <port> <msg_size> <count>\n";
        return 1;
    }
    const std::string host = argv[1];
    const char* port = argv[2];
    std::size_t msg_size = 0;
    std::size_t count = 0;
    try {
        msg_size = std::stoul(argv[3]);
        count = std::stoul(argv[4]);
    } catch (const std::exception&) {
        std::cerr << "msg_size and count must be integers\n";
        return 1;
    }

    try {
        boost::asio::io_context io;
        boost::asio::ip::tcp::resolver resolver(io);
        boost::beast::tcp_stream stream(io);
        stream.connect(resolver.resolve(host, port));

        const nlohmann::json add_body{{"body", std::string(msg_size, 'X')}};

        auto start = std::chrono::steady_clock::now();
        for (std::size_t i = 0; i < count; ++i) {
            call(stream, host, "/add", add_body);
        }
        report("added", count, std::chrono::steady_clock::now() - start);

        std::size_t consumed = 0;
        start = std::chrono::steady_clock::now();
        while (consumed < count) {
            auto res = call(stream, host, "/get", nlohmann::json{{"count", kBatch}});
            const auto& batch = res.at("data");
            if (batch.empty()) break;
            std::vector<std::string> ids;
            for (const auto& m : batch) ids.push_back(m.at("id").get<std::string>());
            call(stream, host, "/delete", nlohmann::json{{"ids", ids}});
            consumed += ids.size();
        }
        report("consumed", consumed, std::chrono::steady_clock::now() - start);

        boost::system::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
