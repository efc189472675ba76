// filename: core/queue_service.hpp
#pragma once
#include <core/config.hpp>
#include <core/message.hpp>
#include <core/message_store.hpp>
#include <core/metrics.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class ServiceErrc { BodyTooLarge, NoIds, InvalidId, StorageFailure };

class ServiceError : public std::runtime_error {
public:
    static ServiceError body_too_large();
    static ServiceError no_ids();
    static ServiceError invalid_id(std::string id);
    static ServiceError storage_failure(const std::string& what);

    ServiceErrc code() const noexcept { return code_; }
    // Offending id for InvalidId, store message for StorageFailure.
    const std::string& value() const noexcept { return value_; }

private:
    ServiceError(ServiceErrc code, const std::string& message, std::string value);

    ServiceErrc code_;
    std::string value_;
};

struct ServiceStats {
    StoreStats store;
    uint64_t added{0};
    uint64_t leased{0};
    uint64_t deleted{0};
    uint64_t retried{0};
    uint64_t purged{0};
    uint64_t rejected{0};
};

// Validates requests and forwards them to the store. Validation always
// happens before the store is touched, so a rejected call changes nothing.
// Each call is a single attempt; errors are thrown as ServiceError.
class QueueService {
public:
    QueueService(std::shared_ptr<MessageStore> store, const Config& cfg);

    // Returns the stored message so the caller learns its id.
    Message add(std::string body);
    std::vector<Message> get(std::size_t count = 1);
    // lock_until, when given, restricts the call to messages still held
    // under the lease that returned that value.
    void remove(const std::vector<std::string>& ids,
                std::optional<std::int64_t> lock_until = std::nullopt);
    void purge();
    void retry(const std::vector<std::string>& ids,
               std::optional<std::int64_t> lock_until = std::nullopt);
    std::vector<Message> peek(std::size_t count = 1);
    ServiceStats stats();

    std::size_t max_message_size() const noexcept { return max_message_size_; }

private:
    // Fails on the first malformed id; returns canonical ids otherwise.
    std::vector<MessageId> validate_ids(const std::vector<std::string>& ids);

    template <class F>
    auto with_store(F&& f) -> decltype(f(std::declval<MessageStore&>())) {
        try {
            return f(*store_);
        } catch (const StoreError& e) {
            throw ServiceError::storage_failure(e.what());
        }
    }

    std::shared_ptr<MessageStore> store_;
    std::size_t max_message_size_;
    Metrics metrics_;
};
