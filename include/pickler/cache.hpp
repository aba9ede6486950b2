#pragma once

#include "pickler.hpp"
#include "types.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>

namespace pickler {

// Caller-owned memo of picklers keyed by root type. Each pickler is built at
// most once, even when several threads ask for it at the same time; a build
// that throws leaves the slot empty for the next caller to retry.
class PicklerCache {
public:
    explicit PicklerCache(Config config = Config::from_environment());

    PicklerCache(const PicklerCache&) = delete;
    PicklerCache& operator=(const PicklerCache&) = delete;

    template <root_type T>
    std::shared_ptr<const Pickler<T>> get() {
        std::shared_ptr<Slot> slot = slot_for(typeid(T));
        std::call_once(slot->once, [this, &slot] {
            slot->pickler = std::make_shared<const Pickler<T>>(config_);
            slot->ready.store(true, std::memory_order_release);
            builds_.fetch_add(1, std::memory_order_relaxed);
        });
        return std::static_pointer_cast<const Pickler<T>>(slot->pickler);
    }

    size_t size() const;
    uint32_t builds() const { return builds_.load(std::memory_order_relaxed); }
    const Config& config() const { return config_; }

private:
    struct Slot {
        std::once_flag once;
        std::shared_ptr<const void> pickler;
        std::atomic<bool> ready{false};
    };

    std::shared_ptr<Slot> slot_for(std::type_index type);

    Config config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<Slot>> slots_;
    std::atomic<uint32_t> builds_{0};
};

} // namespace pickler
