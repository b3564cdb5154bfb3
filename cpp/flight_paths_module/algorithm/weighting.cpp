#include "weighting.hpp"

#include <cmath>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace flight_paths {

namespace {

double CheckComponent(std::string_view name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(fmt::format("{} weight must be a finite non-negative number, got {}", name, value));
    }
    return value;
}

double CheckPreference(std::string_view name, std::int64_t value) {
    if (value < kMinPreference || value > kMaxPreference) {
        throw std::invalid_argument(fmt::format(
            "{} preference must be within [{}, {}], got {}", name, kMinPreference, kMaxPreference, value
        ));
    }
    return static_cast<double>(value);
}

} // namespace

WeightVector::WeightVector(double cost, double time, double layover, double co2):
    cost_(CheckComponent("cost", cost)),
    time_(CheckComponent("time", time)),
    layover_(CheckComponent("layover", layover)),
    co2_(CheckComponent("co2", co2))
{}

WeightVector WeightVector::FromPreferences(std::int64_t cost, std::int64_t time, std::int64_t layover, std::int64_t co2) {
    return WeightVector(
        CheckPreference("cost", cost), CheckPreference("time", time),
        CheckPreference("layover", layover), CheckPreference("co2", co2)
    );
}

void RecomputeWeights(const LegGraph& graph, const WeightVector& weight_vector, CombinedWeights& weights) {
    const auto& legs = graph.Edges();
    weights.assign(legs.size(), 0.0);
    for (const auto& leg : legs) {
        weights[leg.id] = weight_vector.Combine(leg.cost, leg.time_minutes, leg.co2_kg);
    }
}

CombinedWeights ComputeCombinedWeights(const LegGraph& graph, const WeightVector& weight_vector) {
    CombinedWeights weights;
    RecomputeWeights(graph, weight_vector, weights);
    return weights;
}

WeightedLegView::WeightedLegView(const LegGraph& graph, const WeightVector& weight_vector):
    graph_(&graph), weights_(ComputeCombinedWeights(graph, weight_vector))
{}

WeightedLegView::WeightedLegView(const LegGraph& graph, CombinedWeights weights):
    graph_(&graph), weights_(std::move(weights))
{
    if (weights_.size() != graph.Edges().size()) {
        throw std::invalid_argument(fmt::format(
            "expected {} combined weights, got {}", graph.Edges().size(), weights_.size()
        ));
    }
}

} // namespace flight_paths
