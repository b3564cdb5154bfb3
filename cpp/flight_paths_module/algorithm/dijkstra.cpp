#include "shortest_path.hpp"
#include "dijkstra.hpp"
#include "errors.hpp"

#include <fmt/core.h>

namespace flight_paths {

void CheckAbortNoop() { }

Path<> Dijkstra(
    const WeightedLegView &graph, std::uint64_t source_id, std::uint64_t sink_id,
    const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes,
    const CheckAbortFunc& check_abort
) {
    DijkstraPathfinder<> pathfinder;
    pathfinder.search(graph, source_id, sink_id, ignored_edges, ignored_nodes, check_abort);
    if (!pathfinder.has_path_to(sink_id)) {
        throw NoPathFoundError(fmt::format(
            "no path from {} to {}", graph.Graph().Code(source_id), graph.Graph().Code(sink_id)
        ));
    }
    return pathfinder.path_to(sink_id);
}

} // namespace flight_paths
