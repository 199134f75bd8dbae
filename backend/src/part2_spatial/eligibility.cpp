#include "bin_router/eligibility.hpp"

#include <cmath>
#include <iostream>
#include <utility>
#include <vector>

namespace bin_router
{

bool is_eligible(const RawPoint &raw)
{
    return raw.latitude.has_value() && raw.longitude.has_value() &&
           std::isfinite(*raw.latitude) && std::isfinite(*raw.longitude);
}

std::vector<Point> filter_eligible(const std::vector<RawPoint> &raw_points)
{
    std::vector<Point> eligible;
    eligible.reserve(raw_points.size());

    for (const auto &raw : raw_points)
    {
        if (!is_eligible(raw))
        {
            continue;
        }

        Point point;
        point.id = raw.id;
        point.location = raw.location;
        point.category = raw.category;
        point.latitude = *raw.latitude;
        point.longitude = *raw.longitude;
        point.group_id = raw.group_id;
        eligible.push_back(std::move(point));
    }

    if (eligible.size() != raw_points.size())
    {
        std::cout << "Skipped " << raw_points.size() - eligible.size()
                  << " points without valid coordinates." << std::endl;
    }

    return eligible;
}

} // namespace bin_router
