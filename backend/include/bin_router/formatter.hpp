#pragma once

#include <vector>

#include "types.hpp"

namespace bin_router
{

std::vector<Stop> format_route(const Tour &tour);

} // namespace bin_router
