#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bin_router
{

// A collection point as it arrives from storage. Coordinates may be
// missing or non-finite; see filter_eligible().
struct RawPoint
{
    std::string id;
    std::optional<std::string> location;
    std::optional<std::string> category;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<std::string> group_id;
};

// A routable point: both coordinates present and finite.
struct Point
{
    std::string id;
    std::optional<std::string> location;
    std::optional<std::string> category;
    double latitude{};
    double longitude{};
    std::optional<std::string> group_id;

    bool operator==(const Point &other) const
    {
        return id == other.id && location == other.location && category == other.category &&
               latitude == other.latitude && longitude == other.longitude && group_id == other.group_id;
    }

    bool operator!=(const Point &other) const
    {
        return !(*this == other);
    }
};

struct Stop
{
    std::size_t order{};
    Point point;
};

using Tour = std::vector<Point>;

} // namespace bin_router
