#include "bin_router/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace bin_router
{

using json = nlohmann::json;

namespace
{

constexpr long long kMinPort = 1;
constexpr long long kMaxPort = 65535;

// Range-checked before narrowing so out-of-range numbers cannot wrap into
// a valid port.
int read_port(const json &body, int default_port)
{
    const auto it = body.find("port");
    if (it == body.end())
    {
        return default_port;
    }

    if (it->is_number_float())
    {
        throw std::runtime_error("port must be an integer.");
    }
    if (it->is_number_unsigned() && it->get<unsigned long long>() > static_cast<unsigned long long>(kMaxPort))
    {
        throw std::runtime_error("Invalid port " + it->dump());
    }

    const long long port = it->get<long long>();
    if (port < kMinPort || port > kMaxPort)
    {
        throw std::runtime_error("Invalid port " + it->dump());
    }
    return static_cast<int>(port);
}

} // namespace

ServerConfig config_from_json(const json &body)
{
    if (!body.is_object())
    {
        throw std::runtime_error("Server config must be a JSON object.");
    }

    ServerConfig config;
    config.host = body.value("host", config.host);
    config.port = read_port(body, config.port);
    config.points_file = body.value("points_file", config.points_file);
    config.points_urls = body.value("points_urls", config.points_urls);
    config.fetch_timeout_seconds = body.value("fetch_timeout_seconds", config.fetch_timeout_seconds);

    if (config.fetch_timeout_seconds <= 0)
    {
        throw std::runtime_error("fetch_timeout_seconds must be positive.");
    }

    return config;
}

ServerConfig load_server_config(const std::string &path, bool required)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        if (required)
        {
            throw std::runtime_error("Unable to open config " + path);
        }
        std::cout << "No config at " << path << ", using defaults." << std::endl;
        return ServerConfig{};
    }

    return config_from_json(json::parse(in));
}

void apply_env_overrides(ServerConfig &config)
{
    const char *port = std::getenv("BIN_ROUTER_PORT");
    if (port == nullptr || *port == '\0')
    {
        return;
    }

    char *end = nullptr;
    errno = 0;
    const long parsed = std::strtol(port, &end, 10);
    if (end == port || *end != '\0' || errno == ERANGE || parsed < kMinPort || parsed > kMaxPort)
    {
        throw std::runtime_error(std::string("Invalid BIN_ROUTER_PORT ") + port);
    }
    config.port = static_cast<int>(parsed);
}

} // namespace bin_router
