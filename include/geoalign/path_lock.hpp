#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace geoalign {

// Hands out one mutex per output path so that concurrent raster parses never
// write the same reprojection file twice. Entries live as long as the registry.
class PathLockRegistry {
public:
    PathLockRegistry() = default;
    PathLockRegistry(const PathLockRegistry&) = delete;
    PathLockRegistry& operator=(const PathLockRegistry&) = delete;

    // Blocks until the path's mutex is held.
    std::unique_lock<std::mutex> lock(const std::string& path);

    size_t size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
    mutable std::mutex mutex_;
};

} // namespace geoalign
