#include "geoalign/path_lock.hpp"

namespace geoalign {

std::unique_lock<std::mutex> PathLockRegistry::lock(const std::string& path) {
    std::shared_ptr<std::mutex> path_mutex;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto& slot = locks_[path];
        if (!slot) slot = std::make_shared<std::mutex>();
        path_mutex = slot;
    }
    // Entries are never erased, so the mutex outlives the returned lock.
    return std::unique_lock<std::mutex>(*path_mutex);
}

size_t PathLockRegistry::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return locks_.size();
}

} // namespace geoalign
