#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "bin_router/config.hpp"
#include "bin_router/json_codec.hpp"
#include "bin_router/point_source.hpp"
#include "bin_router/point_store.hpp"
#include "bin_router/route_service.hpp"

namespace bin_router
{
namespace
{

using json = nlohmann::json;

void send_error(httplib::Response &res, int status, const std::string &message, const std::string &detail)
{
    json error;
    error["status"] = "error";
    error["message"] = message;
    if (!detail.empty())
    {
        error["error"] = detail;
    }
    res.status = status;
    res.set_content(error.dump(), "application/json");
}

json parse_body(const std::string &body)
{
    if (body.empty())
    {
        return json::object();
    }
    return json::parse(body);
}

void load_initial_points(const ServerConfig &config, PointStore &store)
{
    std::string payload = fetch_points_payload(config.points_urls, config.fetch_timeout_seconds);

    if (payload.empty())
    {
        std::cout << "Loading bins from " << config.points_file << "..." << std::endl;
        try
        {
            payload = read_points_file(config.points_file);
        }
        catch (const std::exception &ex)
        {
            std::cerr << ex.what() << ", starting with an empty store." << std::endl;
            return;
        }
    }

    store.load(raw_points_from_json(json::parse(payload)));
}

} // namespace
} // namespace bin_router

int main(int argc, char **argv)
{
    using namespace bin_router;

    ServerConfig config;
    PointStore store;

    try
    {
        const bool explicit_path = argc > 1;
        config = load_server_config(explicit_path ? argv[1] : "config/server.json", explicit_path);
        apply_env_overrides(config);
        load_initial_points(config, store);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Startup failed: " << ex.what() << std::endl;
        return 1;
    }

    httplib::Server server;

    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });

    server.Post("/routes/optimize", [&store](const httplib::Request &req, httplib::Response &res)
                {
        json body;
        try
        {
            body = parse_body(req.body);
        }
        catch (const json::parse_error &ex)
        {
            send_error(res, 400, "Invalid request body", ex.what());
            return;
        }

        try
        {
            const auto response = optimize_route(store, area_from_request(body));
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error optimizing routes: " << ex.what() << std::endl;
            send_error(res, 500, "Error optimizing routes", ex.what());
        } });

    server.Get("/bins", [&store](const httplib::Request &req, httplib::Response &res)
               {
        try
        {
            std::optional<std::string> area;
            if (req.has_param("areaId"))
            {
                area = req.get_param_value("areaId");
            }

            json bins = json::array();
            for (const auto &point : store.find(area))
            {
                bins.push_back(raw_point_to_json(point));
            }

            json response;
            response["status"] = "success";
            response["count"] = bins.size();
            response["bins"] = bins;
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, 500, "Error listing bins", ex.what());
        } });

    server.Post("/bins", [&store](const httplib::Request &req, httplib::Response &res)
                {
        RawPoint point;
        try
        {
            point = raw_point_from_json(parse_body(req.body));
        }
        catch (const std::exception &ex)
        {
            send_error(res, 400, "Invalid bin record", ex.what());
            return;
        }

        try
        {
            const RawPoint stored = store.upsert(point);
            res.status = 201;
            res.set_content(raw_point_to_json(stored).dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, 500, "Error saving bin", ex.what());
        } });

    std::cout << "Server starting on http://" << config.host << ":" << config.port
              << " with " << store.size() << " bins" << std::endl;
    if (!server.listen(config.host, config.port))
    {
        std::cerr << "Unable to listen on " << config.host << ":" << config.port << std::endl;
        return 1;
    }
    return 0;
}
