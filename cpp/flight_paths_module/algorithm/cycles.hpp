#pragma once

#include <cstdint>
#include <optional>
#include <ranges>
#include <vector>

#include "path.hpp"

namespace flight_paths {

/// @brief Class that looks for a cycle in the predecessor tree built by a label-correcting search.
///
/// Every vertex has at most one predecessor edge, so any cycle is found by walking predecessor
/// chains. While the search is still running the tree may contain a cycle, and any such cycle
/// has a negative total weight.
/// @tparam TSize Type of Node and Edge IDs in the graph.
template<typename TSize = std::uint64_t>
class PredecessorCycleFinder {
public:
    struct Edge {
        TSize id;
        TSize from;
        TSize to;
        double weight;
    };

    using PredecessorVec = std::vector<std::optional<Edge>>;

private:
    enum class Mark { kUnvisited, kOnWalk, kDone };

    std::vector<Mark> marks;
    // The found cycle, if any.
    std::optional<Path<TSize>> cycle_;

public:
    /// @brief Searches the predecessor tree for a cycle.
    /// @param predecessors `predecessors[v]` is the edge leading into `v`, if any.
    explicit PredecessorCycleFinder(const PredecessorVec& predecessors):
        marks(predecessors.size(), Mark::kUnvisited),
        cycle_(std::nullopt)
    {
        for (TSize start = 0; start < predecessors.size() && !cycle_; start++) {
            walk(predecessors, start);
        }
    }

    /// @brief Returns the cycle if one was found.
    std::optional<Path<TSize>> cycle() const noexcept {
        return cycle_;
    }

private:
    void walk(const PredecessorVec& predecessors, TSize start) {
        std::vector<TSize> visited;
        TSize vertex = start;
        while (marks[vertex] == Mark::kUnvisited) {
            marks[vertex] = Mark::kOnWalk;
            visited.push_back(vertex);
            if (!predecessors[vertex]) {
                break;
            }
            vertex = predecessors[vertex]->from;
        }

        if (marks[vertex] == Mark::kOnWalk && predecessors[vertex]) {
            // Walked back onto the current chain, trace the cycle through `vertex`.
            std::vector<Edge> stack;
            Edge cur_edge = predecessors[vertex].value();
            stack.push_back(cur_edge);
            while (cur_edge.from != vertex) {
                cur_edge = predecessors[cur_edge.from].value();
                stack.push_back(cur_edge);
            }

            Path<TSize> cycle_path{vertex};
            double distance = 0.0;
            for (const auto& edge : std::views::reverse(stack)) {
                distance += edge.weight;
                cycle_path.add_edge(edge.id, edge.from, edge.to, distance);
            }
            cycle_ = cycle_path;
        }

        for (auto node : visited) {
            marks[node] = Mark::kDone;
        }
    }
};

} // namespace flight_paths
