// filename: src/http_api.cpp
#include <core/http_api.hpp>
#include <core/log.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace http = boost::beast::http;

namespace {

// Malformed request: bad JSON or a missing/mistyped field.
class BadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

nlohmann::json parse_object(const HttpRequest& req) {
    if (req.body().empty()) return nlohmann::json::object();
    nlohmann::json j = nlohmann::json::parse(req.body(), nullptr, false);
    if (j.is_discarded()) throw BadRequest("Invalid JSON body");
    if (!j.is_object()) throw BadRequest("Request body must be a JSON object");
    return j;
}

std::size_t count_field(const nlohmann::json& j) {
    auto it = j.find("count");
    if (it == j.end() || it->is_null()) return 1;
    if (!it->is_number_unsigned()) throw BadRequest("Field 'count' must be a non-negative integer");
    return it->get<std::size_t>();
}

std::vector<std::string> ids_field(const nlohmann::json& j) {
    auto it = j.find("ids");
    if (it == j.end() || !it->is_array()) throw BadRequest("Field 'ids' must be an array of strings");
    std::vector<std::string> ids;
    ids.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_string()) throw BadRequest("Field 'ids' must be an array of strings");
        ids.push_back(v.get<std::string>());
    }
    return ids;
}

// Optional lease token echoed back from a /get response.
std::optional<std::int64_t> lock_until_field(const nlohmann::json& j) {
    auto it = j.find("lock_until");
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) throw BadRequest("Field 'lock_until' must be an integer");
    return it->get<std::int64_t>();
}

std::string body_field(const nlohmann::json& j) {
    auto it = j.find("body");
    if (it == j.end() || !it->is_string()) throw BadRequest("Field 'body' must be a string");
    return it->get<std::string>();
}

nlohmann::json messages_json(const std::vector<Message>& batch) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : batch) arr.push_back(m);
    return arr;
}

nlohmann::json stats_json(const ServiceStats& s) {
    return nlohmann::json{
        {"ready", s.store.ready},
        {"in_flight", s.store.in_flight},
        {"added", s.added},
        {"leased", s.leased},
        {"deleted", s.deleted},
        {"retried", s.retried},
        {"purged", s.purged},
        {"rejected", s.rejected},
    };
}

struct Route {
    std::string_view path;
    http::verb method;
};

constexpr Route kRoutes[] = {
    {"/hello", http::verb::get},
    {"/stats", http::verb::get},
    {"/add", http::verb::post},
    {"/get", http::verb::post},
    {"/delete", http::verb::post},
    {"/purge", http::verb::post},
    {"/retry", http::verb::post},
    {"/peek", http::verb::post},
};

nlohmann::json route_request(QueueService& service, std::string_view path, const HttpRequest& req) {
    if (path == "/hello") return "Hello World";
    if (path == "/stats") return stats_json(service.stats());
    if (path == "/purge") {
        service.purge();
        return "Success";
    }

    const nlohmann::json j = parse_object(req);
    if (path == "/add") return service.add(body_field(j));
    if (path == "/get") return messages_json(service.get(count_field(j)));
    if (path == "/peek") return messages_json(service.peek(count_field(j)));
    if (path == "/delete") {
        service.remove(ids_field(j), lock_until_field(j));
        return "Success";
    }
    // "/retry"
    service.retry(ids_field(j), lock_until_field(j));
    return "Success";
}

} // namespace

nlohmann::json success_body(nlohmann::json data) {
    return nlohmann::json{{"success", true}, {"data", std::move(data)}};
}

nlohmann::json error_body(const std::string& message) {
    return nlohmann::json{{"success", false}, {"message", message}};
}

HttpResponse make_response(http::status status,
                           const nlohmann::json& body,
                           unsigned version,
                           bool keep_alive) {
    HttpResponse res{status, version};
    res.set(http::field::server, "smql");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "*");
    res.set(http::field::access_control_allow_headers, "*");
    res.keep_alive(keep_alive);
    if (status != http::status::no_content) {
        res.set(http::field::content_type, "application/json");
        res.body() = body.dump();
    }
    res.prepare_payload();
    return res;
}

HttpResponse handle_request(QueueService& service, const HttpRequest& req) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    std::string_view target(req.target().data(), req.target().size());
    const std::string_view path = target.substr(0, target.find('?'));
    const std::string_view method(req.method_string().data(), req.method_string().size());

    if (req.method() == http::verb::options) {
        return make_response(http::status::no_content, nullptr, version, keep_alive);
    }

    const Route* route = nullptr;
    for (const auto& r : kRoutes) {
        if (r.path == path) { route = &r; break; }
    }
    if (!route) {
        return make_response(http::status::not_found, error_body("Not found"), version, keep_alive);
    }
    if (route->method != req.method()) {
        return make_response(http::status::method_not_allowed,
                             error_body("Method not allowed"), version, keep_alive);
    }

    try {
        return make_response(http::status::ok,
                             success_body(route_request(service, path, req)),
                             version, keep_alive);
    } catch (const BadRequest& e) {
        spdlog::debug("[http] {} {} bad request: {}", method, path, e.what());
        return make_response(http::status::bad_request, error_body(e.what()), version, keep_alive);
    } catch (const ServiceError& e) {
        spdlog::debug("[http] {} {} rejected: {}", method, path, e.what());
        return make_response(http::status::bad_request, error_body(e.what()), version, keep_alive);
    } catch (const std::exception& e) {
        spdlog::error("[http] {} {} failed: {}", method, path, e.what());
        return make_response(http::status::internal_server_error,
                             error_body("Internal server error"), version, keep_alive);
    }
}
