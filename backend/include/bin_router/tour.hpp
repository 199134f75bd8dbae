#pragma once

#include <cstddef>
#include <vector>

#include "types.hpp"

namespace bin_router
{

// Chooses the next stop of a tour under construction.
class NextStopSelector
{
public:
    virtual ~NextStopSelector() = default;

    // `unvisited` holds indices into `points` in original input order and is
    // never empty. Returns a position within `unvisited`.
    virtual std::size_t select_next(const Point &current,
                                    const std::vector<Point> &points,
                                    const std::vector<std::size_t> &unvisited) const = 0;
};

// Closest unvisited point; ties go to the earliest in input order.
class NearestNeighbourSelector : public NextStopSelector
{
public:
    std::size_t select_next(const Point &current,
                            const std::vector<Point> &points,
                            const std::vector<std::size_t> &unvisited) const override;
};

// Precondition: every point is eligible (finite coordinates). Callers must
// run filter_eligible() first; non-finite coordinates are not detected here.
// Starts at points.front() and returns a permutation of `points`.
Tour build_tour(const std::vector<Point> &points);
Tour build_tour(const std::vector<Point> &points, const NextStopSelector &selector);

double tour_length(const Tour &tour);

} // namespace bin_router
