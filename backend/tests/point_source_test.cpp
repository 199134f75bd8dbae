#include "bin_router/point_source.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace bin_router
{
namespace
{

TEST(PointSourceTest, NoUrlsGivesEmptyPayload)
{
    EXPECT_EQ(fetch_points_payload({}), "");
}

TEST(PointSourceTest, UnreachableStoresGiveEmptyPayload)
{
    EXPECT_EQ(fetch_points_payload({"http://127.0.0.1:1/bins", "http://127.0.0.1:1/api/bins"}, 2), "");
}

TEST(PointSourceTest, ReadsLocalSeedFile)
{
    const auto path = std::filesystem::temp_directory_path() / "bin_router_points_test.json";
    {
        std::ofstream out(path);
        out << R"([{"binId": "A"}])";
    }

    const std::string payload = read_points_file(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(payload, R"([{"binId": "A"}])");
}

TEST(PointSourceTest, MissingSeedFileThrows)
{
    EXPECT_THROW(read_points_file("/nonexistent/bin_router/bins.json"), std::runtime_error);
}

} // namespace
} // namespace bin_router
