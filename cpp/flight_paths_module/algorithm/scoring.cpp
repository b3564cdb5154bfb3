#include "scoring.hpp"
#include "errors.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace flight_paths {

namespace {

PathScore ScoreNodes(const LegGraph& graph, const LegGraph::NodeIdVec& nodes, const WeightVector& weight_vector) {
    if (nodes.empty()) {
        throw std::invalid_argument("cannot score a path without nodes");
    }

    PathScore score{0.0, 0.0, 0.0, 0.0, 0};
    for (size_t i = 0; i + 1 < nodes.size(); i++) {
        auto edge_id = graph.FindEdge(nodes[i], nodes[i + 1]);
        if (!edge_id) {
            throw DisconnectedPathError(fmt::format(
                "no leg from {} to {} at position {} of the path", graph.Code(nodes[i]), graph.Code(nodes[i + 1]), i
            ));
        }
        const auto& leg = graph.GetLeg(*edge_id);
        score.total_cost += leg.cost;
        score.total_time_minutes += leg.time_minutes;
        score.total_co2_kg += leg.co2_kg;
    }
    score.layover_count = nodes.size() > 2 ? static_cast<std::int64_t>(nodes.size()) - 2 : 0;
    score.combined_score = weight_vector.cost() * score.total_cost
        + weight_vector.time() * score.total_time_minutes
        + weight_vector.co2() * score.total_co2_kg
        + weight_vector.layover() * static_cast<double>(score.layover_count);
    return score;
}

} // namespace

PathScore ScorePath(const LegGraph& graph, const LegGraph::CodeVec& path, const WeightVector& weight_vector) {
    return ScoreNodes(graph, graph.NodeIds(path), weight_vector);
}

PathScore ScorePath(const LegGraph& graph, const Path<>& path, const WeightVector& weight_vector) {
    return ScoreNodes(graph, path.nodes, weight_vector);
}

} // namespace flight_paths
