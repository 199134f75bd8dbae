#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace bin_router
{

RawPoint raw_point_from_json(const nlohmann::json &record);
std::vector<RawPoint> raw_points_from_json(const nlohmann::json &payload);

nlohmann::json raw_point_to_json(const RawPoint &raw);
nlohmann::json stop_to_json(const Stop &stop);
nlohmann::json stops_to_json(const std::vector<Stop> &stops);

} // namespace bin_router
