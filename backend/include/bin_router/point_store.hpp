#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace bin_router
{

// In-memory stand-in for the point database. Insertion ordered; every
// read returns a copy so callers work on a stable snapshot.
class PointStore
{
public:
    void load(const std::vector<RawPoint> &points);
    RawPoint upsert(const RawPoint &point);
    std::vector<RawPoint> find(const std::optional<std::string> &group_id) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<RawPoint> points_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace bin_router
