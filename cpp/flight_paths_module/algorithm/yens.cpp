#include "yens.hpp"

namespace flight_paths {

AlternativePathEnumerator EnumeratePaths(
    const WeightedLegView& graph, std::string_view source, std::string_view target, int threads
) {
    return AlternativePathEnumerator(graph, graph.Graph().NodeId(source), graph.Graph().NodeId(target), threads);
}

std::vector<Path<>> KShortestPaths(
    const WeightedLegView &graph, std::uint64_t source_id, std::uint64_t sink_id,
    std::uint64_t K, const CheckAbortFunc& check_abort, int threads
) {
    YensPathfinder<> pathfinder(graph, source_id, sink_id, threads);
    return pathfinder.take(K, check_abort);
}

} // namespace flight_paths
