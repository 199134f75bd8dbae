#pragma once

#include <string>
#include <vector>

namespace bin_router
{

std::string fetch_points_payload(const std::vector<std::string> &urls, long timeout_seconds = 30);
std::string read_points_file(const std::string &path);

} // namespace bin_router
