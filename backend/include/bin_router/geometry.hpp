#pragma once

#include "types.hpp"

namespace bin_router
{

// Flat Euclidean distance over raw latitude/longitude degrees. Not a
// geodesic distance: only meaningful for relative comparisons at city
// scale. Route ordering depends on this exact metric.
double planar_distance(double lat1, double lon1, double lat2, double lon2);
double distance(const Point &a, const Point &b);

} // namespace bin_router
