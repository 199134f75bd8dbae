#include "bin_router/point_store.hpp"

#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bin_router
{

void PointStore::load(const std::vector<RawPoint> &points)
{
    std::lock_guard<std::mutex> lock(mutex_);

    points_.clear();
    index_.clear();
    points_.reserve(points.size());

    for (const auto &point : points)
    {
        const auto it = index_.find(point.id);
        if (it != index_.end())
        {
            std::cerr << "Duplicate binId " << point.id << ", keeping the later record." << std::endl;
            points_[it->second] = point;
            continue;
        }

        index_[point.id] = points_.size();
        points_.push_back(point);
    }

    std::cout << "Loaded " << points_.size() << " bins into the store." << std::endl;
}

RawPoint PointStore::upsert(const RawPoint &point)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = index_.find(point.id);
    if (it == index_.end())
    {
        index_[point.id] = points_.size();
        points_.push_back(point);
        return point;
    }

    // Only fields carried by the update replace the stored ones.
    RawPoint &stored = points_[it->second];
    if (point.location)
    {
        stored.location = point.location;
    }
    if (point.category)
    {
        stored.category = point.category;
    }
    if (point.latitude)
    {
        stored.latitude = point.latitude;
    }
    if (point.longitude)
    {
        stored.longitude = point.longitude;
    }
    if (point.group_id)
    {
        stored.group_id = point.group_id;
    }
    return stored;
}

std::vector<RawPoint> PointStore::find(const std::optional<std::string> &group_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (!group_id || group_id->empty())
    {
        return points_;
    }

    std::vector<RawPoint> matches;
    for (const auto &point : points_)
    {
        if (point.group_id && *point.group_id == *group_id)
        {
            matches.push_back(point);
        }
    }
    return matches;
}

std::size_t PointStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return points_.size();
}

} // namespace bin_router
