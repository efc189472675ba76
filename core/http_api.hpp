// filename: core/http_api.hpp
#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <core/queue_service.hpp>
#include <nlohmann/json.hpp>
#include <string>

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Envelopes: {"success":true,"data":...} / {"success":false,"message":"..."}
nlohmann::json success_body(nlohmann::json data);
nlohmann::json error_body(const std::string& message);

// Builds a complete JSON response carrying the CORS headers.
HttpResponse make_response(boost::beast::http::status status,
                           const nlohmann::json& body,
                           unsigned version,
                           bool keep_alive);

// Routes one request to the service. Never throws: every failure is turned
// into an error envelope with the matching status.
HttpResponse handle_request(QueueService& service, const HttpRequest& req);
