#pragma once

#include <compare>
#include <limits>
#include <optional>
#include <ranges>
#include <stdexcept>

#include <boost/heap/fibonacci_heap.hpp>

#include "shortest_path.hpp"

namespace flight_paths {

/// @brief Point to point Dijkstra search over the combined weights of a query.
///
/// Nodes with equal distance are settled in increasing node ID order, and a node keeps the first
/// predecessor that reached it with its final distance, so results are deterministic.
/// @tparam TSize Type used for node and edge IDs.
template<typename TSize = std::uint64_t>
class DijkstraPathfinder {
public:
    /// @brief Type of graph view this pathfinder expects.
    using GraphViewType = WeightedLegView;
    using Self = DijkstraPathfinder<TSize>;
    using EdgeIdSet = std::unordered_set<TSize>;
    using NodeIdSet = std::unordered_set<TSize>;

    static constexpr const double POSITIVE_INFINITY = std::numeric_limits<double>::infinity();
    /// @brief A tentative distance is only replaced by one that is lower by more than this.
    static constexpr const double EPSILON = 1e-14;
    static constexpr const TSize INVALID_ID = std::numeric_limits<TSize>::max();

private:
    struct QueueEntry {
        TSize node_id;
        double distance;

        std::partial_ordering operator<=>(const QueueEntry& rhs) const {
            if (auto cmp = distance <=> rhs.distance; cmp != 0) {
                return cmp;
            }
            return node_id <=> rhs.node_id;
        }
    };

    // std::greater turns boost's max-heap into a min-heap on (distance, node ID).
    using QueueType = boost::heap::fibonacci_heap<QueueEntry, boost::heap::compare<std::greater<QueueEntry>>>;
    using QueueHandle = typename QueueType::handle_type;

    // Search state of one node.
    struct Label {
        double distance = POSITIVE_INFINITY;
        TSize parent = INVALID_ID;
        TSize edge_into = INVALID_ID;
        bool settled = false;
        std::optional<QueueHandle> handle;
    };

    std::vector<Label> labels;
    TSize source_id = INVALID_ID;
    TSize target_id = INVALID_ID;

public:
    DijkstraPathfinder() = default;
    DijkstraPathfinder(const Self&) = default;
    DijkstraPathfinder(Self&&) = default;
    Self& operator=(const Self&) = default;
    Self& operator=(Self&&) = default;

    /// @brief Searches `graph` for the cheapest path from `source` to `target`, discarding the
    ///     results of any earlier search. Stops as soon as `target` is settled.
    /// @throws std::invalid_argument if the source or target nodes are not in the graph.
    void search(const GraphViewType& graph, TSize source, TSize target, const CheckAbortFunc &check_abort = CheckAbortNoop) {
        search(graph, source, target, EdgeIdSet{}, NodeIdSet{}, check_abort);
    }

    /// @brief Same as the overload above, but legs in `ignored_edges` and airports in
    ///     `ignored_nodes` are treated as absent.
    void search(
        const GraphViewType& graph, TSize source, TSize target,
        const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes,
        const CheckAbortFunc &check_abort = CheckAbortNoop
    ) {
        const TSize num_nodes = graph.Nodes().size();
        if (source >= num_nodes) {
            throw std::invalid_argument("source node not in graph");
        }
        if (target >= num_nodes) {
            throw std::invalid_argument("target node not in graph");
        }

        labels.assign(num_nodes, Label{});
        source_id = source;
        target_id = target;
        run(graph, ignored_edges, ignored_nodes, check_abort);
    }

    bool has_path_to(TSize node) const {
        return node < labels.size() && labels[node].distance < POSITIVE_INFINITY;
    }

    /// @brief Returns the cheapest path found to `node`.
    /// @return The path, or a path holding only the source if `node` is the source or unreachable.
    Path<TSize> path_to(TSize node) const {
        Path<TSize> result(source_id);
        if (!has_path_to(node) || node == source_id) {
            return result;
        }

        std::vector<TSize> reversed_nodes;
        for (TSize current = node; current != source_id; current = labels[current].parent) {
            reversed_nodes.push_back(current);
        }
        for (auto current : std::views::reverse(reversed_nodes)) {
            const auto& label = labels[current];
            result.add_edge(label.edge_into, label.parent, current, label.distance);
        }
        return result;
    }

private:
    void run(
        const GraphViewType& graph,
        const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes,
        const CheckAbortFunc &check_abort
    ) {
        QueueType queue;
        labels[source_id].distance = 0.0;
        labels[source_id].handle = queue.push(QueueEntry{source_id, 0.0});

        while (!queue.empty()) {
            check_abort();

            const auto current = queue.top().node_id;
            queue.pop();
            labels[current].handle.reset();
            labels[current].settled = true;
            if (current == target_id) {
                break;
            }

            for (const auto& neighbor : graph.OutNeighbours(current)) {
                auto& next = labels[neighbor.node_id];
                if (next.settled || ignored_edges.contains(neighbor.edge_id) || ignored_nodes.contains(neighbor.node_id)) {
                    continue;
                }

                const double distance = labels[current].distance + graph.GetWeight(neighbor.edge_id);
                if (next.distance <= distance + EPSILON) {
                    continue;
                }
                next.distance = distance;
                next.parent = current;
                next.edge_into = neighbor.edge_id;
                if (next.handle) {
                    queue.update(*next.handle, QueueEntry{neighbor.node_id, distance});
                } else {
                    next.handle = queue.push(QueueEntry{neighbor.node_id, distance});
                }
            }
        }
    }
};

/// @brief Computes the shortest path from source to sink using Dijkstra's algorithm.
/// @param graph Current graph.
/// @param source_id ID of source node for path.
/// @param sink_id  ID of final node for path.
/// @param ignored_edges IDs of edges to ignore when pathfinding.
/// @param ignored_nodes IDs of nodes to ignore when pathfinding.
/// @param check_abort Function used to check if execution should be aborted.
/// @return Path from source to sink.
/// @throws NoPathFoundError if the sink cannot be reached.
Path<> Dijkstra(
    const WeightedLegView &graph, std::uint64_t source_id, std::uint64_t sink_id,
    const EdgeIdSet& ignored_edges, const NodeIdSet& ignored_nodes,
    const CheckAbortFunc& check_abort
);

} // namespace flight_paths
