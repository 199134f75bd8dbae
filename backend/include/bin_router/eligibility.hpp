#pragma once

#include <vector>

#include "types.hpp"

namespace bin_router
{

bool is_eligible(const RawPoint &raw);
std::vector<Point> filter_eligible(const std::vector<RawPoint> &raw_points);

} // namespace bin_router
