#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

#include <omp.h>

#include "shortest_path.hpp"
#include "dijkstra.hpp"

namespace flight_paths {

/// @brief Class implementing Yen's K-shortest loopless paths algorithm as a lazy sequence.
///
/// Each call to `next` returns the next simple path from source to target in non-decreasing order
/// of total combined weight, starting with the shortest path, and an empty optional once every
/// simple path has been returned. Among pending candidates of equal weight the one with the
/// lexicographically smallest node ID sequence is returned first, so the sequence is deterministic.
/// The caller decides how many paths to pull.
///
/// Each step runs one spur search per node of the previously returned path, but with Lawler's
/// modification only from the node where that path deviated from its parent. The number of
/// simple paths, and so the total amount of work to exhaust the sequence, is exponential in the
/// worst case on dense graphs with many near-equal paths. Sparse flight networks stay small.
/// @tparam TSize Type used for node and edge IDs.
/// @tparam Pathfinder Pathfinder used to find shortest path between a given source and target.
template<typename TSize = std::uint64_t, typename Pathfinder = DijkstraPathfinder<TSize>>
class YensPathfinder {
public:
    /// @brief Type of graph view this pathfinder expects.
    using GraphViewType = WeightedLegView;
    using Self = YensPathfinder<TSize, Pathfinder>;
    /// @brief Represents a set of edges by ID.
    using EdgeIdSet = std::unordered_set<TSize>;
    /// @brief Represents a set of nodes by ID.
    using NodeIdSet = std::unordered_set<TSize>;
    /// @brief A vector of paths.
    using PathVec = std::vector<Path<TSize>>;

    /// @brief Prepares enumeration of the simple paths between two nodes. No search is done until
    ///     the first call to `next`.
    /// @param graph The graph to search. Must outlive the pathfinder.
    /// @param source_id ID of source node for pathfinding.
    /// @param target_id ID of target node for pathfinding.
    /// @param threads Maximum number of threads used for the spur searches of one step. Values
    ///     `<= 0` use the hardware concurrency.
    /// @throws std::invalid_argument if the source or target nodes are not in the graph.
    YensPathfinder(const GraphViewType& graph, TSize source_id, TSize target_id, int threads = 1):
        graph(&graph), source_id(source_id), target_id(target_id),
        threads(threads > 0 ? threads : static_cast<int>(std::max(1u, std::thread::hardware_concurrency())))
    {
        if (source_id >= graph.Nodes().size()) {
            throw std::invalid_argument("source node not in graph");
        }
        if (target_id >= graph.Nodes().size()) {
            throw std::invalid_argument("target node not in graph");
        }
    }

    YensPathfinder(const Self&) = delete;
    YensPathfinder(Self&&) = default;
    Self& operator=(const Self&) = delete;
    Self& operator=(Self&&) = default;

    /// @brief Computes the next path of the sequence.
    /// @param check_abort Function that should throw an exception if execution should be aborted.
    /// @return The next path, or an empty optional if no further simple path exists.
    std::optional<Path<TSize>> next(const CheckAbortFunc& check_abort = CheckAbortNoop) {
        if (done) {
            return std::nullopt;
        }

        if (!started) {
            started = true;
            Pathfinder pathfinder;
            pathfinder.search(*graph, source_id, target_id, check_abort);
            if (!pathfinder.has_path_to(target_id)) {
                // No paths found
                done = true;
                return std::nullopt;
            }
            result.push_back(pathfinder.path_to(target_id));
            deviations.push_back(0);
            return result.back();
        }

        add_spur_paths(check_abort);

        if (candidates.empty()) {
            // No spur paths left, the sequence is complete.
            done = true;
            return std::nullopt;
        }

        // Pop the minimum weighted path from the heap and add it to the result
        std::pop_heap(candidates.begin(), candidates.end(), greater_candidate);
        result.push_back(std::move(candidates.back().path));
        deviations.push_back(candidates.back().deviation);
        candidates.pop_back();
        return result.back();
    }

    /// @brief Pulls up to `count` further paths from the sequence.
    /// @return The paths pulled, fewer than `count` if the sequence ran out.
    PathVec take(size_t count, const CheckAbortFunc& check_abort = CheckAbortNoop) {
        PathVec paths;
        while (paths.size() < count) {
            auto path = next(check_abort);
            if (!path) {
                break;
            }
            paths.push_back(std::move(path.value()));
        }
        return paths;
    }

    /// @brief Returns true once `next` has reported the end of the sequence.
    bool exhausted() const noexcept {
        return done;
    }

    /// @brief All paths returned so far, in order.
    const PathVec& emitted() const noexcept {
        return result;
    }

    /// @brief Forgets all progress, so the following call to `next` returns the shortest path again.
    void restart() {
        result.clear();
        deviations.clear();
        candidates.clear();
        started = false;
        done = false;
    }

private:
    using PathfinderUniquePtr = std::unique_ptr<Pathfinder>;

    struct Candidate {
        Path<TSize> path;
        // Index of the node where this path leaves the path it was derived from.
        TSize deviation;
    };

    struct Task {
        TSize spur_index;
        Path<TSize> root_path;
        EdgeIdSet ignored_edges;
        NodeIdSet ignored_nodes;
    };

    const GraphViewType* graph;
    TSize source_id;
    TSize target_id;
    int threads;

    PathVec result;
    std::vector<TSize> deviations;
    // Using a heap instead of a priority_queue so that we can search the heap for
    // duplicate paths.
    std::vector<Candidate> candidates;
    bool started = false;
    bool done = false;
    // Re-used between steps to reduce the amount of memory allocation/freeing needed.
    std::vector<PathfinderUniquePtr> pathfinders;

    // Generates the spur paths of the most recently returned path and adds them to the candidates.
    void add_spur_paths(const CheckAbortFunc& check_abort) {
        const auto& prev_shortest = result.back();
        std::vector<Task> tasks;

        // Spurs from nodes before the deviation point share their root with the parent path and were
        // already generated when the parent was returned. (Lawler's modification)
        for (TSize spur_index = deviations.back(); spur_index < prev_shortest.size(); spur_index++) {
            // Check if we should abort before each shortest path call, as it could take a while
            check_abort();

            // Note: On this path, we are not taking the edge at prev_shortest[spur_index]
            // Re-use spur_index for the number of edges we want to keep.
            auto root_path = prev_shortest.prefix(spur_index);

            // Ignoring edges and nodes instead of removing them from the graph, as the graph is shared.
            EdgeIdSet ignored_edges;
            NodeIdSet ignored_nodes;

            // Find all previous shortest paths that share same root path edges and remove the edge
            // used to go to the next node in that path.
            for (const auto& prev_path : result) {
                if (prev_path.size() > spur_index && prev_path.has_prefix(root_path)) {
                    ignored_edges.insert(prev_path.edges[spur_index]);
                }
            }

            // Ignore all nodes in the root path except the spur node, so spur paths stay simple
            for (size_t i = 0; i < spur_index; i++) {
                ignored_nodes.insert(root_path.nodes[i]);
            }

            tasks.push_back(Task{spur_index, std::move(root_path), std::move(ignored_edges), std::move(ignored_nodes)});
        }

        // Add more pathfinders if needed
        for (size_t i = pathfinders.size(); i < tasks.size(); i++) {
            pathfinders.emplace_back(std::make_unique<Pathfinder>());
        }

        // Perform pathfinding for all tasks. Abort checks happen above, as exceptions must not escape
        // the parallel region.
        const bool parallel = threads > 1 && tasks.size() > 1;
        #pragma omp parallel for num_threads(threads) if(parallel)
        for (size_t task_id = 0; task_id < tasks.size(); task_id++) {
            const auto& task = tasks[task_id];
            pathfinders[task_id]->search(
                *graph, task.root_path.nodes.back(), target_id, task.ignored_edges, task.ignored_nodes
            );
        }

        // Process results for all tasks in order so the result does not depend on the thread count
        for (size_t task_id = 0; task_id < tasks.size(); task_id++) {
            if (!(pathfinders[task_id]->has_path_to(target_id))) {
                continue;
            }
            auto spur_path = pathfinders[task_id]->path_to(target_id);
            auto total_path = tasks[task_id].root_path.join(spur_path);

            if (!contains_path(total_path)) {
                candidates.push_back(Candidate{std::move(total_path), tasks[task_id].spur_index});
                std::push_heap(candidates.begin(), candidates.end(), greater_candidate);
            }
        }
    }

    // Returns true if lhs should come after rhs: greater total cost, then lexicographically greater nodes.
    static bool greater_candidate(const Candidate& lhs, const Candidate& rhs) {
        if (lhs.path.total_cost != rhs.path.total_cost) {
            return lhs.path.total_cost > rhs.path.total_cost;
        }
        return lhs.path.nodes > rhs.path.nodes;
    }

    // Check if the path was already returned or is waiting in the candidate heap.
    bool contains_path(const Path<TSize>& to_find) const {
        for (const auto& candidate : candidates) {
            if (candidate.path.edges == to_find.edges) {
                return true;
            }
        }
        for (const auto& path : result) {
            if (path.edges == to_find.edges) {
                return true;
            }
        }

        return false;
    }
};

/// @brief Lazy sequence of increasingly costly simple paths between two airports.
using AlternativePathEnumerator = YensPathfinder<>;

/// @brief Starts enumerating the simple paths between two airports.
/// @param graph Current graph. Must outlive the returned enumerator.
/// @param source Code of the departure airport.
/// @param target Code of the arrival airport.
/// @param threads Maximum number of threads used per step.
/// @throws UnknownAirportError if either airport is not in the graph.
AlternativePathEnumerator EnumeratePaths(
    const WeightedLegView& graph, std::string_view source, std::string_view target, int threads = 1
);

/// @brief Computes the K shortest simple paths in the graph from source to sink.
/// @param graph Current graph.
/// @param source_id ID of source node for paths.
/// @param sink_id ID of final node for paths.
/// @param K Number of shortest paths to compute.
/// @param check_abort Function used to check if execution should be aborted.
/// @param threads Number of threads to use during pathfinding.
/// @return Up to K paths in order of non-decreasing total cost. Empty if the sink is unreachable.
std::vector<Path<>> KShortestPaths(
    const WeightedLegView &graph, std::uint64_t source_id, std::uint64_t sink_id,
    std::uint64_t K, const CheckAbortFunc& check_abort, int threads = 1
);

} // namespace flight_paths
