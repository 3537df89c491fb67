#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "site_planner/cells.hpp"
#include "site_planner/config.hpp"
#include "site_planner/pipeline.hpp"
#include "site_planner/result_json.hpp"
#include "site_planner/types.hpp"

namespace site_planner
{
namespace
{

using json = nlohmann::json;

struct ServerOptions
{
    std::string host{"0.0.0.0"};
    int port{8080};
    std::string config_path;
};

ServerOptions parse_arguments(int argc, char **argv)
{
    ServerOptions options;

    for (int i = 1; i < argc; i++)
    {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--host" && has_value)
        {
            options.host = argv[++i];
        }
        else if (arg == "--port" && has_value)
        {
            options.port = std::stoi(argv[++i]);
        }
        else if (arg == "--config" && has_value)
        {
            options.config_path = argv[++i];
        }
        else
        {
            throw std::invalid_argument("Unrecognized argument: " + arg);
        }
    }

    return options;
}

void send_error(httplib::Response &res, const std::string &message)
{
    json error;
    error["status"] = "error";
    error["message"] = message;
    res.set_content(error.dump(), "application/json");
}

const json &cells_payload(const json &body)
{
    if (body.contains("cells"))
    {
        return body["cells"];
    }
    return body;
}

OptimizerConfig request_config(const json &body, const OptimizerConfig &defaults)
{
    if (body.contains("config") && body["config"].is_object())
    {
        return parse_config(body["config"], defaults);
    }
    return defaults;
}

} // namespace
} // namespace site_planner

int main(int argc, char **argv)
{
    using namespace site_planner;

    ServerOptions options;
    OptimizerConfig defaults = default_config();

    try
    {
        options = parse_arguments(argc, argv);
        if (!options.config_path.empty())
        {
            defaults = load_config_file(options.config_path, defaults);
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Startup failed: " << ex.what() << std::endl;
        std::cerr << "Usage: site_planner_server [--host H] [--port P] [--config defaults.json]" << std::endl;
        return EXIT_FAILURE;
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

    server.Get("/health", [](const httplib::Request &, httplib::Response &res)
               {
        json response;
        response["status"] = "ok";
        res.set_content(response.dump(), "application/json"); });

    server.Post("/analyze", [&defaults](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            const auto body = json::parse(req.body);
            const OptimizerConfig config = request_config(body, defaults);

            const auto parse_start = std::chrono::high_resolution_clock::now();
            const CellDataset dataset = parse_cells(cells_payload(body));
            DomainStatistics statistics = compute_statistics(dataset.cells, config.high_need_risk_threshold);
            statistics.skipped_records = dataset.skipped_records;
            const auto parse_end = std::chrono::high_resolution_clock::now();

            json response;
            response["status"] = "success";
            response["statistics"] = statistics_to_json(statistics);
            response["unpopulatedCells"] = dataset.unpopulated_cells;
            response["timing"] = {
                {"analyze_ms", std::chrono::duration_cast<std::chrono::milliseconds>(parse_end - parse_start).count()}};

            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Post("/optimize", [&defaults](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            const auto body = json::parse(req.body);
            const OptimizerConfig config = request_config(body, defaults);

            const auto parse_start = std::chrono::high_resolution_clock::now();
            const CellDataset dataset = parse_cells(cells_payload(body));
            const auto parse_end = std::chrono::high_resolution_clock::now();

            OptimizationResult result = run_optimization(dataset.cells, config);
            result.statistics.skipped_records += dataset.skipped_records;

            json response = result_to_json(result);
            response["timing"]["parse_ms"] =
                std::chrono::duration_cast<std::chrono::milliseconds>(parse_end - parse_start).count();

            std::cout << "Optimization finished with status " << response["status"].get<std::string>()
                      << " (" << result.facilities.size() << " facilities)." << std::endl;

            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Post("/validate", [&defaults](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            const auto body = json::parse(req.body);
            const OptimizerConfig config = request_config(body, defaults);

            if (!body.contains("facilities"))
            {
                throw std::runtime_error("Missing required field 'facilities'.");
            }

            const CellDataset dataset = parse_cells(cells_payload(body));
            const std::vector<Facility> facilities = facilities_from_json(body["facilities"]);

            OptimizationResult result = revalidate(facilities, dataset.cells, config);
            result.statistics.skipped_records += dataset.skipped_records;

            res.set_content(result_to_json(result).dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    std::cout << "Server starting on http://" << options.host << ":" << options.port << std::endl;
    if (!server.listen(options.host, options.port))
    {
        std::cerr << "Unable to bind " << options.host << ":" << options.port << std::endl;
        return EXIT_FAILURE;
    }
    return 0;
}
