#include "bin_router/json_codec.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "test_points.hpp"

namespace bin_router
{
namespace
{

using json = nlohmann::json;
using test_support::make_point;

TEST(JsonCodecTest, DecodesFullRecord)
{
    const auto raw = raw_point_from_json(json::parse(R"({
        "binId": "BIN-001", "location": "Galle Face", "category": "general",
        "latitude": 6.9271, "longitude": 79.8612, "areaId": "COLOMBO-CENTRAL"
    })"));

    EXPECT_EQ(raw.id, "BIN-001");
    EXPECT_EQ(raw.location, std::optional<std::string>("Galle Face"));
    EXPECT_EQ(raw.category, std::optional<std::string>("general"));
    ASSERT_TRUE(raw.latitude.has_value());
    EXPECT_DOUBLE_EQ(*raw.latitude, 6.9271);
    ASSERT_TRUE(raw.longitude.has_value());
    EXPECT_DOUBLE_EQ(*raw.longitude, 79.8612);
    EXPECT_EQ(raw.group_id, std::optional<std::string>("COLOMBO-CENTRAL"));
}

TEST(JsonCodecTest, MissingAndNullCoordinatesDecodeAsAbsent)
{
    const auto missing = raw_point_from_json(json::parse(R"({"binId": "A"})"));
    EXPECT_FALSE(missing.latitude.has_value());
    EXPECT_FALSE(missing.longitude.has_value());
    EXPECT_FALSE(missing.group_id.has_value());

    const auto nulls = raw_point_from_json(json::parse(R"({"binId": "B", "latitude": null, "longitude": null})"));
    EXPECT_FALSE(nulls.latitude.has_value());
    EXPECT_FALSE(nulls.longitude.has_value());
}

TEST(JsonCodecTest, NumericStringsAreConverted)
{
    const auto raw = raw_point_from_json(json::parse(R"({"binId": "A", "latitude": "6.5", "longitude": " 79.25 "})"));

    ASSERT_TRUE(raw.latitude.has_value());
    EXPECT_DOUBLE_EQ(*raw.latitude, 6.5);
    ASSERT_TRUE(raw.longitude.has_value());
    EXPECT_DOUBLE_EQ(*raw.longitude, 79.25);
}

TEST(JsonCodecTest, NonNumericCoordinatesDecodeAsAbsent)
{
    const auto raw = raw_point_from_json(json::parse(R"({"binId": "A", "latitude": "north", "longitude": ""})"));
    EXPECT_FALSE(raw.latitude.has_value());
    EXPECT_FALSE(raw.longitude.has_value());

    const auto partial = raw_point_from_json(json::parse(R"({"binId": "B", "latitude": "6.5abc", "longitude": true})"));
    EXPECT_FALSE(partial.latitude.has_value());
    EXPECT_FALSE(partial.longitude.has_value());
}

TEST(JsonCodecTest, RejectsRecordWithoutId)
{
    EXPECT_THROW(raw_point_from_json(json::parse(R"({"latitude": 1.0})")), std::runtime_error);
    EXPECT_THROW(raw_point_from_json(json::parse(R"({"binId": ""})")), std::runtime_error);
    EXPECT_THROW(raw_point_from_json(json::array()), std::runtime_error);
}

TEST(JsonCodecTest, AcceptsArrayOrBinsObject)
{
    const auto from_array = raw_points_from_json(json::parse(R"([{"binId": "A"}, {"binId": "B"}])"));
    ASSERT_EQ(from_array.size(), 2u);
    EXPECT_EQ(from_array[1].id, "B");

    const auto from_object = raw_points_from_json(json::parse(R"({"bins": [{"binId": "C"}]})"));
    ASSERT_EQ(from_object.size(), 1u);
    EXPECT_EQ(from_object[0].id, "C");

    EXPECT_THROW(raw_points_from_json(json::parse(R"({"elements": []})")), std::runtime_error);
}

TEST(JsonCodecTest, StopCarriesOrderAndPointAttributes)
{
    const Stop stop{2, make_point("BIN-009", 6.9, 79.8, "DEHIWALA")};
    const auto stop_json = stop_to_json(stop);

    EXPECT_EQ(stop_json["order"], 2);
    EXPECT_EQ(stop_json["binId"], "BIN-009");
    EXPECT_EQ(stop_json["location"], "Location BIN-009");
    EXPECT_EQ(stop_json["category"], "general");
    EXPECT_DOUBLE_EQ(stop_json["latitude"].get<double>(), 6.9);
    EXPECT_DOUBLE_EQ(stop_json["longitude"].get<double>(), 79.8);
    EXPECT_EQ(stop_json["areaId"], "DEHIWALA");
}

TEST(JsonCodecTest, StopOmitsAbsentArea)
{
    const auto stop_json = stop_to_json({1, make_point("A", 0.0, 0.0)});
    EXPECT_FALSE(stop_json.contains("areaId"));
}

TEST(JsonCodecTest, RawPointWritesNullForMissingCoordinates)
{
    RawPoint raw;
    raw.id = "A";
    raw.latitude = 1.5;

    const auto record = raw_point_to_json(raw);
    EXPECT_EQ(record["binId"], "A");
    EXPECT_DOUBLE_EQ(record["latitude"].get<double>(), 1.5);
    EXPECT_TRUE(record["longitude"].is_null());
    EXPECT_FALSE(record.contains("location"));
}

} // namespace
} // namespace bin_router
