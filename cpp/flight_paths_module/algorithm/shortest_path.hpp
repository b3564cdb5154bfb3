#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "path.hpp"
#include "weighting.hpp"

namespace flight_paths {

// Types used by helper functions

/// @brief A type for representing sets of edge Ids for exclusion during pathfinding.
using EdgeIdSet = std::unordered_set<std::uint64_t>;
/// @brief A type for representing sets of node Ids for exclusion during pathfinding.
using NodeIdSet = std::unordered_set<std::uint64_t>;

/// @brief Signature of a function used to check if the execution should be aborted.
///     The function is expected to throw an exception if the execution should be aborted,
///     and do nothing otherwise.
using CheckAbortFunc = std::function<void()>;

/// @brief Signature for functions that compute the shortest path between two nodes in a graph.
///    The two set arguments are sets of edges and nodes to ignore, respectively.
///    Implementations throw NoPathFoundError when the target cannot be reached.
using ShortestPathFunc = std::function<
    Path<>(
        const WeightedLegView &, std::uint64_t, std::uint64_t,
        const EdgeIdSet&, const NodeIdSet&,
        const CheckAbortFunc&
    )
>;

/// @brief Algorithms able to answer a single-source single-target query.
enum class SearchAlgorithm {
    /// @brief Dijkstra's algorithm, requires non-negative weights.
    kDijkstra,
    /// @brief Queue based Bellman-Ford, tolerates negative weights.
    kBellmanFord
};

/// @brief No-op function for passing in to pathfinders when no checking is required.
void CheckAbortNoop();

/// @brief Returns the pathfinding function implementing `algorithm`.
ShortestPathFunc GetShortestPathFunc(SearchAlgorithm algorithm);

/// @brief Human readable name of an algorithm, as used for route labels.
std::string_view AlgorithmName(SearchAlgorithm algorithm);

/// @brief Computes the minimum combined weight path between two airports.
/// @param graph The graph with the combined weights of the current query.
/// @param source Code of the departure airport.
/// @param target Code of the arrival airport.
/// @param algorithm Algorithm used for the search.
/// @param check_abort Function that should throw an exception if execution should be aborted.
/// @return The path. If source and target are the same airport the path holds just that node.
/// @throws UnknownAirportError if either airport is not in the graph.
/// @throws NoPathFoundError if the target cannot be reached from the source.
Path<> ShortestPath(
    const WeightedLegView& graph, std::string_view source, std::string_view target,
    SearchAlgorithm algorithm, const CheckAbortFunc& check_abort = CheckAbortNoop
);

} // namespace flight_paths
