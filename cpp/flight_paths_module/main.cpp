#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "algorithm/errors.hpp"
#include "algorithm/leg_graph.hpp"
#include "algorithm/procedures.hpp"
#include "flight_paths_module.hpp"
#include "util/conversions.hpp"
#include "util/options.hpp"

namespace {

constexpr const int kExitError = 1;
constexpr const int kExitNoRoute = 2;

void SetLogLevel(const flight_paths::util::Options& options) {
    const auto level_name = options.String(flight_paths::kOptionLogLevel).value_or("info");
    const auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        throw std::invalid_argument(fmt::format("unknown log level '{}'", level_name));
    }
    spdlog::set_level(level);
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        fmt::print(stderr, "usage: {} <config.json>\n", argv[0]);
        return kExitError;
    }

    try {
        const auto options = flight_paths::util::Options::FromFile(argv[1]);
        SetLogLevel(options);

        const auto legs_file = options.String(flight_paths::kOptionLegsFile);
        if (!legs_file) {
            throw std::invalid_argument(fmt::format("option '{}' is required", flight_paths::kOptionLegsFile));
        }
        const auto graph = flight_paths::LegGraph::Load(flight_paths::util::LoadLegRecords(*legs_file));
        const auto query = flight_paths::util::RouteQueryFromOptions(options);

        const auto routes = flight_paths::FindRoutes(graph, query);
        for (const auto& route : routes) {
            fmt::print("{}\n", flight_paths::FormatRoute(route));
        }
        std::cout << flight_paths::util::RoutesToJson(routes).dump(2) << std::endl;
    } catch (const flight_paths::NoPathFoundError& e) {
        spdlog::error("No valid path found between selected airports. ({})", e.what());
        return kExitNoRoute;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitError;
    }

    return 0;
}
