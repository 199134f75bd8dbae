#include "bin_router/geometry.hpp"

#include <cmath>

namespace bin_router
{

double planar_distance(double lat1, double lon1, double lat2, double lon2)
{
    const double delta_lat = lat1 - lat2;
    const double delta_lon = lon1 - lon2;
    return std::sqrt(delta_lat * delta_lat + delta_lon * delta_lon);
}

double distance(const Point &a, const Point &b)
{
    return planar_distance(a.latitude, a.longitude, b.latitude, b.longitude);
}

} // namespace bin_router
