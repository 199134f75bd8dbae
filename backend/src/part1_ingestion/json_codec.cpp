#include "bin_router/json_codec.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bin_router
{
namespace
{

using json = nlohmann::json;

std::optional<double> parse_coordinate(const json &value)
{
    if (value.is_number())
    {
        return value.get<double>();
    }

    if (!value.is_string())
    {
        return std::nullopt;
    }

    // Numeric strings are cast the way the document store casts them;
    // blank or partially numeric strings count as missing.
    const auto &text = value.get_ref<const std::string &>();
    const char *begin = text.c_str();
    char *end = nullptr;
    const double parsed = std::strtod(begin, &end);
    if (end == begin)
    {
        return std::nullopt;
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)))
    {
        ++end;
    }
    if (*end != '\0')
    {
        return std::nullopt;
    }
    return parsed;
}

std::optional<std::string> parse_text(const json &value)
{
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    if (value.is_number())
    {
        return value.dump();
    }
    return std::nullopt;
}

std::optional<double> coordinate_field(const json &record, const char *key)
{
    const auto it = record.find(key);
    return it == record.end() ? std::nullopt : parse_coordinate(*it);
}

std::optional<std::string> text_field(const json &record, const char *key)
{
    const auto it = record.find(key);
    return it == record.end() ? std::nullopt : parse_text(*it);
}

void set_optional(json &target, const char *key, const std::optional<std::string> &value)
{
    if (value)
    {
        target[key] = *value;
    }
}

} // namespace

RawPoint raw_point_from_json(const json &record)
{
    if (!record.is_object())
    {
        throw std::runtime_error("Bin record must be a JSON object.");
    }

    RawPoint raw;
    const auto id = text_field(record, "binId");
    if (!id || id->empty())
    {
        throw std::runtime_error("Bin record is missing binId.");
    }

    raw.id = *id;
    raw.location = text_field(record, "location");
    raw.category = text_field(record, "category");
    raw.latitude = coordinate_field(record, "latitude");
    raw.longitude = coordinate_field(record, "longitude");
    raw.group_id = text_field(record, "areaId");
    return raw;
}

std::vector<RawPoint> raw_points_from_json(const json &payload)
{
    const json *records = &payload;
    if (payload.is_object() && payload.contains("bins"))
    {
        records = &payload.at("bins");
    }

    if (!records->is_array())
    {
        throw std::runtime_error("Expected a JSON array of bins or an object with a \"bins\" array.");
    }

    std::vector<RawPoint> points;
    points.reserve(records->size());
    for (const auto &record : *records)
    {
        points.push_back(raw_point_from_json(record));
    }
    return points;
}

json raw_point_to_json(const RawPoint &raw)
{
    json record;
    record["binId"] = raw.id;
    set_optional(record, "location", raw.location);
    set_optional(record, "category", raw.category);
    record["latitude"] = raw.latitude ? json(*raw.latitude) : json();
    record["longitude"] = raw.longitude ? json(*raw.longitude) : json();
    set_optional(record, "areaId", raw.group_id);
    return record;
}

json stop_to_json(const Stop &stop)
{
    json stop_json;
    stop_json["order"] = stop.order;
    stop_json["binId"] = stop.point.id;
    set_optional(stop_json, "location", stop.point.location);
    set_optional(stop_json, "category", stop.point.category);
    stop_json["latitude"] = stop.point.latitude;
    stop_json["longitude"] = stop.point.longitude;
    set_optional(stop_json, "areaId", stop.point.group_id);
    return stop_json;
}

json stops_to_json(const std::vector<Stop> &stops)
{
    json stops_json = json::array();
    for (const auto &stop : stops)
    {
        stops_json.push_back(stop_to_json(stop));
    }
    return stops_json;
}

} // namespace bin_router
