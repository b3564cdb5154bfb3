#include "shortest_path.hpp"
#include "bellman_ford.hpp"
#include "dijkstra.hpp"

#include <stdexcept>

namespace flight_paths {

ShortestPathFunc GetShortestPathFunc(SearchAlgorithm algorithm) {
    switch (algorithm) {
        case SearchAlgorithm::kDijkstra:
            return Dijkstra;
        case SearchAlgorithm::kBellmanFord:
            return BellmanFord;
    }
    throw std::invalid_argument("unknown search algorithm");
}

std::string_view AlgorithmName(SearchAlgorithm algorithm) {
    switch (algorithm) {
        case SearchAlgorithm::kDijkstra:
            return "Dijkstra";
        case SearchAlgorithm::kBellmanFord:
            return "Bellman-Ford";
    }
    throw std::invalid_argument("unknown search algorithm");
}

Path<> ShortestPath(
    const WeightedLegView& graph, std::string_view source, std::string_view target,
    SearchAlgorithm algorithm, const CheckAbortFunc& check_abort
) {
    const auto source_id = graph.Graph().NodeId(source);
    const auto target_id = graph.Graph().NodeId(target);
    auto sp_func = GetShortestPathFunc(algorithm);
    return sp_func(graph, source_id, target_id, {}, {}, check_abort);
}

} // namespace flight_paths
