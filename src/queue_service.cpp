// filename: src/queue_service.cpp
#include <core/queue_service.hpp>
#include <core/log.hpp>
#include <utility>

ServiceError::ServiceError(ServiceErrc code, const std::string& message, std::string value)
    : std::runtime_error(message), code_(code), value_(std::move(value)) {}

ServiceError ServiceError::body_too_large() {
    return ServiceError(ServiceErrc::BodyTooLarge, "Message body size is too large", {});
}

ServiceError ServiceError::no_ids() {
    return ServiceError(ServiceErrc::NoIds, "No message IDs provided", {});
}

ServiceError ServiceError::invalid_id(std::string id) {
    const std::string message = "Invalid message ID: " + id;
    return ServiceError(ServiceErrc::InvalidId, message, std::move(id));
}

ServiceError ServiceError::storage_failure(const std::string& what) {
    return ServiceError(ServiceErrc::StorageFailure, what, what);
}

QueueService::QueueService(std::shared_ptr<MessageStore> store, const Config& cfg)
    : store_(std::move(store)), max_message_size_(cfg.max_message_size) {
    if (!store_) throw std::invalid_argument("QueueService requires a store");
}

Message QueueService::add(std::string body) {
    if (body.size() > max_message_size_) {
        metrics_.rejected.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[service] rejecting body of {} bytes (limit {})", body.size(), max_message_size_);
        throw ServiceError::body_too_large();
    }

    Message msg(std::move(body));
    with_store([&msg](MessageStore& s) { s.add(msg); });
    metrics_.added.fetch_add(1, std::memory_order_relaxed);
    spdlog::trace("[service] added {}", message_id_text(msg.id));
    return msg;
}

std::vector<Message> QueueService::get(std::size_t count) {
    auto batch = with_store([count](MessageStore& s) { return s.lease(count); });
    metrics_.leased.fetch_add(batch.size(), std::memory_order_relaxed);
    spdlog::trace("[service] leased {}/{}", batch.size(), count);
    return batch;
}

void QueueService::remove(const std::vector<std::string>& ids,
                          std::optional<std::int64_t> lock_until) {
    const auto parsed = validate_ids(ids);
    const auto n = with_store([&parsed, lock_until](MessageStore& s) {
        return s.remove(parsed, lock_until);
    });
    metrics_.deleted.fetch_add(n, std::memory_order_relaxed);
    spdlog::trace("[service] deleted {}/{}", n, parsed.size());
}

void QueueService::purge() {
    const auto n = with_store([](MessageStore& s) { return s.purge(); });
    metrics_.purged.fetch_add(n, std::memory_order_relaxed);
    spdlog::info("[service] purged {} messages", n);
}

void QueueService::retry(const std::vector<std::string>& ids,
                         std::optional<std::int64_t> lock_until) {
    const auto parsed = validate_ids(ids);
    const auto n = with_store([&parsed, lock_until](MessageStore& s) {
        return s.retry(parsed, lock_until);
    });
    metrics_.retried.fetch_add(n, std::memory_order_relaxed);
    spdlog::trace("[service] retried {}/{}", n, parsed.size());
}

std::vector<Message> QueueService::peek(std::size_t count) {
    return with_store([count](MessageStore& s) { return s.peek(count); });
}

ServiceStats QueueService::stats() {
    ServiceStats out;
    out.store = with_store([](MessageStore& s) { return s.stats(); });
    out.added = metrics_.added.load(std::memory_order_relaxed);
    out.leased = metrics_.leased.load(std::memory_order_relaxed);
    out.deleted = metrics_.deleted.load(std::memory_order_relaxed);
    out.retried = metrics_.retried.load(std::memory_order_relaxed);
    out.purged = metrics_.purged.load(std::memory_order_relaxed);
    out.rejected = metrics_.rejected.load(std::memory_order_relaxed);
    return out;
}

std::vector<MessageId> QueueService::validate_ids(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        metrics_.rejected.fetch_add(1, std::memory_order_relaxed);
        throw ServiceError::no_ids();
    }

    std::vector<MessageId> parsed;
    parsed.reserve(ids.size());
    for (const auto& id : ids) {
        auto v = parse_message_id(id);
        if (!v) {
            metrics_.rejected.fetch_add(1, std::memory_order_relaxed);
            throw ServiceError::invalid_id(id);
        }
        parsed.push_back(*v);
    }
    return parsed;
}
