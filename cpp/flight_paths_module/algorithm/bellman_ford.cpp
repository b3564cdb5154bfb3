#include "bellman_ford.hpp"
#include "errors.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace flight_paths {

Path<> BellmanFord(
    const WeightedLegView& graph, std::uint64_t source_id, std::uint64_t sink_id,
    const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes,
    const CheckAbortFunc& check_abort
) {
    if (sink_id >= graph.Nodes().size()) {
        throw std::invalid_argument("target node not in graph");
    }
    BellmanFordPathfinder<> pathfinder;
    pathfinder.search(graph, source_id, ignored_edges, ignored_nodes, check_abort);
    if (pathfinder.has_negative_cycle()) {
        throw std::logic_error(fmt::format(
            "negative cycle reachable from {}", graph.Graph().Code(source_id)
        ));
    }
    if (!pathfinder.has_path_to(sink_id)) {
        throw NoPathFoundError(fmt::format(
            "no path from {} to {}", graph.Graph().Code(source_id), graph.Graph().Code(sink_id)
        ));
    }
    return pathfinder.path_to(sink_id);
}

} // namespace flight_paths
