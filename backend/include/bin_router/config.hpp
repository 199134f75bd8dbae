#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bin_router
{

struct ServerConfig
{
    std::string host{"0.0.0.0"};
    int port{8080};
    std::string points_file{"data/bins.json"};
    std::vector<std::string> points_urls;
    long fetch_timeout_seconds{30};
};

ServerConfig config_from_json(const nlohmann::json &body);
ServerConfig load_server_config(const std::string &path, bool required);
void apply_env_overrides(ServerConfig &config);

} // namespace bin_router
