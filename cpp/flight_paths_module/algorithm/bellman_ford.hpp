#pragma once

#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <unordered_set>
#include <vector>

#include "shortest_path.hpp"
#include "cycles.hpp"

namespace flight_paths {

/// @brief Queue based Bellman-Ford search from a single airport.
///
/// Unlike Dijkstra's algorithm this label-correcting search remains correct when some combined weights are
/// negative, and reports a negative cycle instead of looping forever. The predecessor tree is checked for
/// a cycle after every `V` relaxations.
/// @tparam TSize Type used for node and edge IDs.
template<typename TSize = std::uint64_t>
class BellmanFordPathfinder {
public:
    /// @brief Type of graph view this object expects.
    using GraphViewType = WeightedLegView;
    using Self = BellmanFordPathfinder<TSize>;
    using EdgeIdSet = std::unordered_set<TSize>;
    using NodeIdSet = std::unordered_set<TSize>;

    using CycleFinder = PredecessorCycleFinder<TSize>;
    using Edge = typename CycleFinder::Edge;
    using PredecessorVec = typename CycleFinder::PredecessorVec;

    static constexpr const double EPSILON = 1e-14;
    static constexpr const double POS_INF = std::numeric_limits<double>::infinity();

private:
    TSize source_id = 0;
    // Tentative distance of every node from the source.
    std::vector<double> dist_to;
    // Leg leading into every node on its current best path.
    PredecessorVec edge_into;
    std::vector<bool> queued;
    std::deque<TSize> queue;
    size_t relaxations = 0;
    std::optional<Path<TSize>> cycle;

public:
    BellmanFordPathfinder() = default;
    BellmanFordPathfinder(const Self&) = default;
    BellmanFordPathfinder(Self&&) = default;
    Self& operator=(const Self&) = default;
    Self& operator=(Self&&) = default;

    /// @brief Searches `graph` from `source` to every reachable node.
    /// @throws std::invalid_argument if the source node is not in the graph.
    BellmanFordPathfinder(const GraphViewType& graph, TSize source, const CheckAbortFunc& check_abort = CheckAbortNoop) {
        search(graph, source, EdgeIdSet{}, NodeIdSet{}, check_abort);
    }

    /// @brief Discards any earlier results and searches `graph` from `source` to every reachable node,
    ///     treating legs in `ignored_edges` and airports in `ignored_nodes` as absent. Stops early if a
    ///     negative cycle is found.
    /// @throws std::invalid_argument if the source node is not in the graph.
    void search(
        const GraphViewType& graph, TSize source,
        const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes,
        const CheckAbortFunc& check_abort = CheckAbortNoop
    ) {
        const size_t num_vertex = graph.Nodes().size();
        if (source >= num_vertex) {
            throw std::invalid_argument("source node not in graph");
        }

        source_id = source;
        dist_to.assign(num_vertex, POS_INF);
        edge_into.assign(num_vertex, std::nullopt);
        queued.assign(num_vertex, false);
        queue.clear();
        relaxations = 0;
        cycle = std::nullopt;

        dist_to[source] = 0.0;
        enqueue(source);
        while (!queue.empty() && !has_negative_cycle()) {
            check_abort();

            const auto vertex = queue.front();
            queue.pop_front();
            queued[vertex] = false;
            relax(graph, vertex, ignored_edges, ignored_nodes);
        }
    }

    bool has_negative_cycle() const noexcept {
        return cycle.has_value();
    }

    /// @brief Returns the negative cycle that stopped the search, if any.
    std::optional<Path<TSize>> negative_cycle() const {
        return cycle;
    }

    bool has_path_to(TSize vertex) const {
        return vertex < dist_to.size() && dist_to[vertex] < POS_INF;
    }

    /// @brief Returns the lowest-cost path from the source to `vertex`.
    /// @return The found path, or a path holding only the source if no path exists.
    /// @throws std::logic_error if a negative cycle exists.
    Path<TSize> path_to(TSize vertex) const {
        if (has_negative_cycle()) {
            throw std::logic_error("negative cycle exists");
        }

        Path<TSize> result{source_id};
        if (!has_path_to(vertex)) {
            return result;
        }

        std::vector<Edge> legs;
        for (auto edge = edge_into[vertex]; edge.has_value(); edge = edge_into[edge->from]) {
            legs.push_back(edge.value());
        }
        for (const auto& edge : std::views::reverse(legs)) {
            result.add_edge(edge.id, edge.from, edge.to, dist_to[edge.to]);
        }
        return result;
    }

private:
    void enqueue(TSize vertex) {
        if (!queued[vertex]) {
            queue.push_back(vertex);
            queued[vertex] = true;
        }
    }

    void relax(const GraphViewType& graph, TSize vertex, const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes) {
        for (const auto& neighbor : graph.OutNeighbours(vertex)) {
            if (ignored_edges.contains(neighbor.edge_id) || ignored_nodes.contains(neighbor.node_id)) {
                continue;
            }

            const auto weight = graph.GetWeight(neighbor.edge_id);
            const auto distance = dist_to[vertex] + weight;
            if (dist_to[neighbor.node_id] > distance + EPSILON) {
                dist_to[neighbor.node_id] = distance;
                edge_into[neighbor.node_id] = Edge{neighbor.edge_id, vertex, neighbor.node_id, weight};
                enqueue(neighbor.node_id);
            }

            if (++relaxations % dist_to.size() == 0) {
                cycle = CycleFinder(edge_into).cycle();
                if (cycle) {
                    return;
                }
            }
        }
    }
};

/// @brief Calculates the shortest path between two nodes using the Bellman-Ford algorithm.
/// @param graph The current graph.
/// @param source_id ID of source node for pathfinding.
/// @param sink_id ID of target node for pathfinding.
/// @param ignored_edges IDs of edges to ignore during pathfinding.
/// @param ignored_nodes IDs of nodes to ignore during pathfinding.
/// @param check_abort Function used to periodically check whether execution should be aborted.
/// @return The path from source to sink.
/// @throws NoPathFoundError if the sink cannot be reached.
/// @throws std::logic_error if a negative cycle is reachable from the source.
Path<> BellmanFord(
    const WeightedLegView& graph, std::uint64_t source_id, std::uint64_t sink_id,
    const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes,
    const CheckAbortFunc& check_abort
);

} // namespace flight_paths
