#include "bin_router/route_service.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "bin_router/eligibility.hpp"
#include "bin_router/formatter.hpp"
#include "bin_router/json_codec.hpp"
#include "bin_router/tour.hpp"

namespace bin_router
{
namespace
{

using json = nlohmann::json;

json empty_route(const json &area_echo, const std::string &message)
{
    json response;
    response["optimizedRoute"] = json::array();
    response["totalBins"] = 0;
    response["areaId"] = area_echo;
    response["message"] = message;
    return response;
}

} // namespace

std::optional<std::string> area_from_request(const json &body)
{
    if (!body.is_object())
    {
        return std::nullopt;
    }

    const auto it = body.find("areaId");
    if (it == body.end())
    {
        return std::nullopt;
    }

    // Numeric areas match records whose numeric areaId was stored as text.
    if (it->is_number())
    {
        return it->dump();
    }
    if (!it->is_string() || it->get_ref<const std::string &>().empty())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json optimize_route(const PointStore &store, const std::optional<std::string> &area)
{
    const json area_echo = area ? json(*area) : json("all");
    std::cout << "Optimizing route for area " << area_echo.get<std::string>() << "..." << std::endl;

    const auto total_start = std::chrono::high_resolution_clock::now();

    const auto fetch_start = std::chrono::high_resolution_clock::now();
    const std::vector<RawPoint> raw_points = store.find(area);
    const auto fetch_end = std::chrono::high_resolution_clock::now();

    if (raw_points.empty())
    {
        return empty_route(area_echo, "No bins found for the specified area");
    }

    const std::vector<Point> eligible = filter_eligible(raw_points);
    if (eligible.empty())
    {
        return empty_route(area_echo, "No bins with valid coordinates found");
    }

    const auto tour_start = std::chrono::high_resolution_clock::now();
    const Tour tour = build_tour(eligible);
    const std::vector<Stop> stops = format_route(tour);
    const auto tour_end = std::chrono::high_resolution_clock::now();
    const auto total_end = std::chrono::high_resolution_clock::now();

    const auto fetch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(fetch_end - fetch_start).count();
    const auto tour_ms = std::chrono::duration_cast<std::chrono::milliseconds>(tour_end - tour_start).count();
    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(total_end - total_start).count();

    json response;
    response["optimizedRoute"] = stops_to_json(stops);
    response["totalBins"] = stops.size();
    response["areaId"] = area_echo;
    response["totalDistance"] = tour_length(tour);
    response["timing"] = {
        {"fetch_bins_ms", fetch_ms},
        {"build_tour_ms", tour_ms},
        {"total_ms", total_ms}};

    return response;
}

} // namespace bin_router
