#include "bin_router/tour.hpp"

#include <chrono>
#include <cstddef>
#include <iostream>
#include <limits>
#include <vector>

#include "bin_router/geometry.hpp"

namespace bin_router
{

std::size_t NearestNeighbourSelector::select_next(const Point &current,
                                                  const std::vector<Point> &points,
                                                  const std::vector<std::size_t> &unvisited) const
{
    double best_distance = std::numeric_limits<double>::infinity();
    std::size_t best_position = 0;

    // Strict comparison keeps the first minimum, so equidistant candidates
    // resolve to the earliest one in input order.
    for (std::size_t position = 0; position < unvisited.size(); ++position)
    {
        const double candidate = distance(current, points[unvisited[position]]);
        if (candidate < best_distance)
        {
            best_distance = candidate;
            best_position = position;
        }
    }

    return best_position;
}

Tour build_tour(const std::vector<Point> &points)
{
    NearestNeighbourSelector selector;
    return build_tour(points, selector);
}

Tour build_tour(const std::vector<Point> &points, const NextStopSelector &selector)
{
    Tour tour;
    if (points.empty())
    {
        return tour;
    }

    const auto start_time = std::chrono::high_resolution_clock::now();

    tour.reserve(points.size());
    tour.push_back(points.front());

    std::vector<std::size_t> unvisited;
    unvisited.reserve(points.size() - 1);
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        unvisited.push_back(i);
    }

    while (!unvisited.empty())
    {
        std::size_t position = selector.select_next(tour.back(), points, unvisited);
        if (position >= unvisited.size())
        {
            std::cerr << "Selector returned position " << position << " of "
                      << unvisited.size() << ", using first unvisited point." << std::endl;
            position = 0;
        }

        tour.push_back(points[unvisited[position]]);
        // erase() keeps the remaining candidates in input order for tie-breaking.
        unvisited.erase(unvisited.begin() + static_cast<std::ptrdiff_t>(position));
    }

    const auto end_time = std::chrono::high_resolution_clock::now();
    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    std::cout << "Tour complete: " << tour.size() << " stops in " << total_ms << " ms." << std::endl;

    return tour;
}

double tour_length(const Tour &tour)
{
    double total = 0.0;
    for (std::size_t i = 1; i < tour.size(); ++i)
    {
        total += distance(tour[i - 1], tour[i]);
    }
    return total;
}

} // namespace bin_router
