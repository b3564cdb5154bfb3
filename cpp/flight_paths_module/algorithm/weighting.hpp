#pragma once

#include <cstdint>
#include <vector>

#include "leg_graph.hpp"

namespace flight_paths {

/// @brief Lowest importance a user can give a criterion.
constexpr const std::int64_t kMinPreference = 1;
/// @brief Highest importance a user can give a criterion.
constexpr const std::int64_t kMaxPreference = 10;
/// @brief Importance used when a preference is not given.
constexpr const std::int64_t kDefaultPreference = 5;

/// @brief Importance of each cost criterion for one query.
class WeightVector {
public:
    /// @brief Constructs a weight vector. Components may be any finite non-negative number.
    /// @throws std::invalid_argument if a component is negative or not finite.
    WeightVector(double cost, double time, double layover, double co2);

    /// @brief Builds a weight vector from user preferences, each of which must be within
    ///     [kMinPreference, kMaxPreference].
    /// @throws std::invalid_argument if a preference is out of range.
    static WeightVector FromPreferences(std::int64_t cost, std::int64_t time, std::int64_t layover, std::int64_t co2);

    double cost() const noexcept { return cost_; }
    double time() const noexcept { return time_; }
    double layover() const noexcept { return layover_; }
    double co2() const noexcept { return co2_; }

    /// @brief Combined weight of a single leg: every leg counts as one layover.
    double Combine(double cost, double time_minutes, double co2_kg) const noexcept {
        return cost_ * cost + time_ * time_minutes + co2_ * co2_kg + layover_;
    }

    bool operator==(const WeightVector&) const = default;

private:
    double cost_;
    double time_;
    double layover_;
    double co2_;
};

/// @brief Combined weight of every leg, indexed by edge ID. Scoped to a single query.
using CombinedWeights = std::vector<double>;

/// @brief Recomputes the combined weight of every leg of `graph` into `weights`, discarding
///     whatever `weights` held before. Runs in O(E).
void RecomputeWeights(const LegGraph& graph, const WeightVector& weight_vector, CombinedWeights& weights);

/// @brief Returns the combined weight of every leg of `graph`.
CombinedWeights ComputeCombinedWeights(const LegGraph& graph, const WeightVector& weight_vector);

/// @brief Read-only view pairing an immutable LegGraph with the combined weights of one query.
///
/// This is the graph type consumed by the pathfinders. The view owns its weights and only
/// references the graph, so several views with different weight vectors can share one graph.
/// The graph must outlive the view.
class WeightedLegView {
public:
    /// @brief Creates a view with freshly computed weights.
    WeightedLegView(const LegGraph& graph, const WeightVector& weight_vector);

    /// @brief Creates a view over precomputed weights.
    /// @throws std::invalid_argument if there is not exactly one weight per leg.
    WeightedLegView(const LegGraph& graph, CombinedWeights weights);

    const LegGraph::CodeVec& Nodes() const noexcept { return graph_->Nodes(); }
    const std::vector<Leg>& Edges() const noexcept { return graph_->Edges(); }
    const std::vector<Neighbour>& OutNeighbours(std::uint64_t node) const { return graph_->OutNeighbours(node); }

    /// @brief Returns the combined weight of a leg.
    double GetWeight(std::uint64_t edge_id) const { return weights_.at(edge_id); }

    const LegGraph& Graph() const noexcept { return *graph_; }
    const CombinedWeights& Weights() const noexcept { return weights_; }

private:
    const LegGraph* graph_;
    CombinedWeights weights_;
};

} // namespace flight_paths
