#include <store_factory.hpp>
#include <memory_store.hpp>
#include <serial_store.hpp>

std::optional<StoreKind> parse_store_kind(std::string_view name) {
    if (name == "memory") return StoreKind::Memory;
    if (name == "serial") return StoreKind::Serial;
    return std::nullopt;
}

const char* store_kind_name(StoreKind kind) {
    return kind == StoreKind::Serial ? "serial" : "memory";
}

std::shared_ptr<MessageStore> make_store(StoreKind kind,
                                         std::chrono::milliseconds visibility_timeout) {
    switch (kind) {
        case StoreKind::Serial:
            return std::make_shared<SerialStore>(visibility_timeout);
        default:
            return std::make_shared<MemoryStore>(visibility_timeout);
    }
}
