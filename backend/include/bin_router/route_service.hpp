#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "point_store.hpp"

namespace bin_router
{

// Area filter from an optimize request body; absent, null and "" all mean
// "every area". Numeric areas are read as their text form.
std::optional<std::string> area_from_request(const nlohmann::json &body);

nlohmann::json optimize_route(const PointStore &store, const std::optional<std::string> &area);

} // namespace bin_router
