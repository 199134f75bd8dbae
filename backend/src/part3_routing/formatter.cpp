#include "bin_router/formatter.hpp"

#include <cstddef>
#include <vector>

namespace bin_router
{

std::vector<Stop> format_route(const Tour &tour)
{
    std::vector<Stop> stops;
    stops.reserve(tour.size());

    for (std::size_t index = 0; index < tour.size(); ++index)
    {
        stops.push_back({index + 1, tour[index]});
    }

    return stops;
}

} // namespace bin_router
