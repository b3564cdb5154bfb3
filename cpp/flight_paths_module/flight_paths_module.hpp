#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "algorithm/leg_graph.hpp"
#include "algorithm/path.hpp"
#include "algorithm/procedures.hpp"
#include "algorithm/scoring.hpp"
#include "algorithm/shortest_path.hpp"
#include "algorithm/weighting.hpp"

namespace flight_paths {

/// @brief One leg of a returned route with what a renderer needs to draw it.
struct RouteSegment {
    std::string from;
    std::string to;
    Coordinates from_coords;
    Coordinates to_coords;
    double cost;
    double time_minutes;
    double co2_kg;
};

/// @brief A labelled path with its score, as handed to the route renderer.
struct RouteResult {
    std::string label;
    LegGraph::CodeVec path;
    PathScore score;
    std::vector<RouteSegment> segments;
};

struct RouteQuery {
    std::string source;
    std::string target;
    WeightVector weights = WeightVector::FromPreferences(
        kDefaultPreference, kDefaultPreference, kDefaultPreference, kDefaultPreference
    );
    /// @brief Number of enumerated paths to return, the first one labelled "Best".
    std::uint64_t alternatives = kDefaultAlternatives;
    /// @brief Threads used by the enumerator. Values `<= 0` use the hardware concurrency.
    int threads = 1;
};

/// @brief Builds the renderer record of a path.
/// @throws DisconnectedPathError if the path uses a leg that is not in the graph.
RouteResult MakeRouteResult(const LegGraph& graph, std::string label, const Path<>& path, const WeightVector& weights);

/// @brief Answers a route query.
///
/// The combined weights are computed for this query only, the graph is never modified, so
/// concurrent queries may share a graph. Routes are returned in this order: the Dijkstra
/// result, the Bellman-Ford result, then up to `query.alternatives` enumerated paths labelled
/// "Best" and "Alternative".
/// @throws UnknownAirportError if the source or target airport is not in the graph.
/// @throws NoPathFoundError if the target cannot be reached from the source.
/// @throws std::logic_error if the two searches disagree on the minimum weight.
std::vector<RouteResult> FindRoutes(
    const LegGraph& graph, const RouteQuery& query, const CheckAbortFunc& check_abort = CheckAbortNoop
);

/// @brief One line summary of a route, e.g. "Best: A -> B | Score 311.00, Cost 150, ...".
std::string FormatRoute(const RouteResult& route);

} // namespace flight_paths
