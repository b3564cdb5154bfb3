#include "leg_graph.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace flight_paths {

namespace {

void CheckAttribute(std::size_t index, std::string_view field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidRecordError(fmt::format("record {} field '{}' is not a finite number", index, field));
    }
    if (value < 0.0) {
        throw InvalidRecordError(fmt::format("record {} field '{}' is negative ({})", index, field, value));
    }
}

void CheckCoordinate(std::size_t index, std::string_view field, double value, double limit) {
    if (!std::isfinite(value) || value < -limit || value > limit) {
        throw InvalidRecordError(fmt::format(
            "record {} field '{}' must be within [-{}, {}], got {}", index, field, limit, limit, value
        ));
    }
}

void ValidateRecord(std::size_t index, const LegRecord& record) {
    if (record.origin.empty()) {
        throw InvalidRecordError(fmt::format("record {} field 'source' is empty", index));
    }
    if (record.destination.empty()) {
        throw InvalidRecordError(fmt::format("record {} field 'dest' is empty", index));
    }
    if (record.origin == record.destination) {
        throw InvalidRecordError(fmt::format(
            "record {} is a loop from {} to itself", index, record.origin
        ));
    }
    CheckAttribute(index, "cost", record.cost);
    CheckAttribute(index, "time_minutes", record.time_minutes);
    CheckAttribute(index, "co2_kg", record.co2_kg);
    CheckCoordinate(index, "source_lat", record.origin_lat, 90.0);
    CheckCoordinate(index, "source_lon", record.origin_lon, 180.0);
    CheckCoordinate(index, "dest_lat", record.dest_lat, 90.0);
    CheckCoordinate(index, "dest_lon", record.dest_lon, 180.0);
}

} // namespace

LegGraph LegGraph::Load(const std::vector<LegRecord>& records) {
    // Validate everything up front so a bad row never leaves a half built graph behind.
    std::set<std::string> codes;
    for (std::size_t index = 0; index < records.size(); index++) {
        ValidateRecord(index, records[index]);
        codes.insert(records[index].origin);
        codes.insert(records[index].destination);
    }

    LegGraph graph;
    graph.codes_.assign(codes.begin(), codes.end());
    graph.out_.resize(graph.codes_.size());
    for (std::uint64_t node = 0; node < graph.codes_.size(); node++) {
        graph.ids_.emplace(graph.codes_[node], node);
    }

    for (const auto& record : records) {
        const auto from = graph.ids_.at(record.origin);
        const auto to = graph.ids_.at(record.destination);
        Leg leg{
            0, from, to,
            record.cost, record.time_minutes, record.co2_kg,
            Coordinates{record.origin_lat, record.origin_lon},
            Coordinates{record.dest_lat, record.dest_lon}
        };

        auto existing = graph.edge_index_.find({from, to});
        if (existing != graph.edge_index_.end()) {
            // Last write wins, the leg keeps its ID.
            spdlog::debug("leg {} -> {} overwritten by a later record", record.origin, record.destination);
            leg.id = existing->second;
            graph.legs_[leg.id] = leg;
            continue;
        }

        leg.id = graph.legs_.size();
        graph.edge_index_.emplace(NodePair{from, to}, leg.id);
        graph.out_[from].push_back(Neighbour{to, leg.id});
        graph.legs_.push_back(leg);
    }

    for (auto& neighbours : graph.out_) {
        std::sort(neighbours.begin(), neighbours.end(), [](const Neighbour& lhs, const Neighbour& rhs) {
            return lhs.node_id < rhs.node_id;
        });
    }

    spdlog::info("loaded {} airports and {} legs from {} records", graph.codes_.size(), graph.legs_.size(), records.size());
    return graph;
}

const std::vector<Neighbour>& LegGraph::OutNeighbours(std::uint64_t node) const {
    if (node >= out_.size()) {
        throw std::invalid_argument(fmt::format("node {} not in graph", node));
    }
    return out_[node];
}

bool LegGraph::HasAirport(std::string_view code) const {
    return ids_.contains(std::string(code));
}

std::uint64_t LegGraph::NodeId(std::string_view code) const {
    auto it = ids_.find(std::string(code));
    if (it == ids_.end()) {
        throw UnknownAirportError(fmt::format("unknown airport '{}'", code));
    }
    return it->second;
}

const std::string& LegGraph::Code(std::uint64_t node) const {
    if (node >= codes_.size()) {
        throw std::invalid_argument(fmt::format("node {} not in graph", node));
    }
    return codes_[node];
}

std::optional<std::uint64_t> LegGraph::FindEdge(std::uint64_t from, std::uint64_t to) const {
    auto it = edge_index_.find({from, to});
    if (it == edge_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Leg& LegGraph::GetLeg(std::uint64_t edge_id) const {
    if (edge_id >= legs_.size()) {
        throw std::invalid_argument(fmt::format("leg {} not in graph", edge_id));
    }
    return legs_[edge_id];
}

LegGraph::CodeVec LegGraph::Codes(const NodeIdVec& nodes) const {
    CodeVec result;
    result.reserve(nodes.size());
    for (auto node : nodes) {
        result.push_back(Code(node));
    }
    return result;
}

LegGraph::NodeIdVec LegGraph::NodeIds(const CodeVec& codes) const {
    NodeIdVec result;
    result.reserve(codes.size());
    for (const auto& code : codes) {
        result.push_back(NodeId(code));
    }
    return result;
}

} // namespace flight_paths
