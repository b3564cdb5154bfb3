#include "flight_paths_module.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "algorithm/yens.hpp"

namespace flight_paths {

namespace {

// Relative tolerance when comparing the weights found by the two searches.
constexpr const double kCrossCheckTolerance = 1e-9;

void CrossCheck(const LegGraph& graph, const Path<>& dijkstra_path, const Path<>& bellman_ford_path) {
    const double scale = std::max(1.0, std::abs(dijkstra_path.total_cost));
    if (std::abs(dijkstra_path.total_cost - bellman_ford_path.total_cost) > kCrossCheckTolerance * scale) {
        throw std::logic_error(fmt::format(
            "searches disagree: Dijkstra found {} ({}), Bellman-Ford found {} ({})",
            fmt::join(graph.Codes(dijkstra_path.nodes), " -> "), dijkstra_path.total_cost,
            fmt::join(graph.Codes(bellman_ford_path.nodes), " -> "), bellman_ford_path.total_cost
        ));
    }
}

} // namespace

RouteResult MakeRouteResult(const LegGraph& graph, std::string label, const Path<>& path, const WeightVector& weights) {
    RouteResult result{std::move(label), graph.Codes(path.nodes), ScorePath(graph, path, weights), {}};
    result.segments.reserve(path.size());
    for (size_t i = 0; i + 1 < path.nodes.size(); i++) {
        // ScorePath has already checked that every leg exists.
        const auto& leg = graph.GetLeg(graph.FindEdge(path.nodes[i], path.nodes[i + 1]).value());
        result.segments.push_back(RouteSegment{
            graph.Code(leg.from), graph.Code(leg.to), leg.from_coords, leg.to_coords,
            leg.cost, leg.time_minutes, leg.co2_kg
        });
    }
    return result;
}

std::vector<RouteResult> FindRoutes(const LegGraph& graph, const RouteQuery& query, const CheckAbortFunc& check_abort) {
    spdlog::info("FindRoutes: {} -> {}", query.source, query.target);

    const auto source_id = graph.NodeId(query.source);
    const auto target_id = graph.NodeId(query.target);
    const WeightedLegView view(graph, query.weights);

    std::vector<RouteResult> routes;
    std::vector<Path<>> search_paths;
    for (auto algorithm : {SearchAlgorithm::kDijkstra, SearchAlgorithm::kBellmanFord}) {
        auto sp_func = GetShortestPathFunc(algorithm);
        search_paths.push_back(sp_func(view, source_id, target_id, {}, {}, check_abort));
        routes.push_back(MakeRouteResult(graph, std::string(AlgorithmName(algorithm)), search_paths.back(), query.weights));
    }
    CrossCheck(graph, search_paths[0], search_paths[1]);

    YensPathfinder<> enumerator(view, source_id, target_id, query.threads);
    const auto paths = enumerator.take(query.alternatives, check_abort);
    for (size_t path_index = 0; path_index < paths.size(); path_index++) {
        auto label = path_index == 0 ? kLabelBest : kLabelAlternative;
        routes.push_back(MakeRouteResult(graph, std::string(label), paths[path_index], query.weights));
    }

    spdlog::info("Found {} routes", routes.size());
    for (const auto& route : routes) {
        spdlog::debug("{}", FormatRoute(route));
    }
    return routes;
}

std::string FormatRoute(const RouteResult& route) {
    return fmt::format(
        "{}: {} | Score {:.2f}, Cost {}, Time {} min, CO2 {} kg, Layovers {}",
        route.label, fmt::join(route.path, " -> "), route.score.combined_score,
        route.score.total_cost, route.score.total_time_minutes, route.score.total_co2_kg, route.score.layover_count
    );
}

} // namespace flight_paths
