#pragma once

#include <cstdint>

#include "leg_graph.hpp"
#include "path.hpp"
#include "weighting.hpp"

namespace flight_paths {

/// @brief Totals of a path, used to annotate search results for presentation.
struct PathScore {
    /// @brief Weighted sum of the totals with one layover weight per intermediate stop.
    ///
    /// Searches charge the layover weight on every leg, so for a path with at least one leg the
    /// searched weight is this score plus one layover weight.
    double combined_score;
    double total_cost;
    double total_time_minutes;
    double total_co2_kg;
    /// @brief Number of intermediate stops.
    std::int64_t layover_count;

    bool operator==(const PathScore&) const = default;
};

/// @brief Scores a path given as airport codes, independent of how it was produced.
/// @param graph Graph holding the legs of the path.
/// @param path Airport codes in travel order. A single code scores as all zeroes.
/// @param weight_vector Weights of the current query.
/// @throws std::invalid_argument if the path is empty.
/// @throws UnknownAirportError if a code is not in the graph.
/// @throws DisconnectedPathError if two consecutive airports are not connected by a leg.
PathScore ScorePath(const LegGraph& graph, const LegGraph::CodeVec& path, const WeightVector& weight_vector);

/// @brief Scores a path of node IDs produced by a pathfinder.
/// @throws DisconnectedPathError if two consecutive nodes are not connected by a leg.
PathScore ScorePath(const LegGraph& graph, const Path<>& path, const WeightVector& weight_vector);

} // namespace flight_paths
