#include "pickler/cache.hpp"

namespace pickler {

PicklerCache::PicklerCache(Config config) : config_(config) {}

std::shared_ptr<PicklerCache::Slot> PicklerCache::slot_for(std::type_index type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[type];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

size_t PicklerCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t built = 0;
    for (const auto& [type, slot] : slots_) {
        if (slot->ready.load(std::memory_order_acquire)) {
            ++built;
        }
    }
    return built;
}

} // namespace pickler
