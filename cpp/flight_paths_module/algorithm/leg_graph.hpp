#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/container_hash/hash.hpp>

namespace flight_paths {

/// @brief Geographic position of an airport. Only used for rendering.
struct Coordinates {
    double lat;
    double lon;

    bool operator==(const Coordinates&) const = default;
};

/// @brief One row supplied by the route data provider.
struct LegRecord {
    std::string origin;
    std::string destination;
    double cost;
    double time_minutes;
    double co2_kg;
    double origin_lat;
    double origin_lon;
    double dest_lat;
    double dest_lon;
};

/// @brief A directed flight leg between two airports of a LegGraph.
struct Leg {
    /// @brief ID of the leg, indexes LegGraph::Edges() and any CombinedWeights.
    std::uint64_t id;
    /// @brief Node ID of the origin airport.
    std::uint64_t from;
    /// @brief Node ID of the destination airport.
    std::uint64_t to;
    double cost;
    double time_minutes;
    double co2_kg;
    Coordinates from_coords;
    Coordinates to_coords;
};

/// @brief Entry of an adjacency list: the node reached and the leg used to reach it.
struct Neighbour {
    std::uint64_t node_id;
    std::uint64_t edge_id;
};

/// @brief Immutable directed graph of flight legs keyed by airport code.
///
/// Node IDs are dense and assigned in lexicographic order of the airport codes, so ordering
/// node ID sequences is the same as ordering airport code sequences. A graph holds at most one
/// leg per ordered pair of airports; when the input contains several rows for the same pair the
/// last one wins.
class LegGraph {
public:
    using NodeIdVec = std::vector<std::uint64_t>;
    using CodeVec = std::vector<std::string>;

    LegGraph() = default;
    LegGraph(const LegGraph&) = default;
    LegGraph(LegGraph&&) = default;
    LegGraph& operator=(const LegGraph&) = default;
    LegGraph& operator=(LegGraph&&) = default;

    /// @brief Builds a graph from leg records.
    /// @param records Rows from the route data provider, in load order.
    /// @return The constructed graph.
    /// @throws InvalidRecordError if any record has an empty code, a loop, a negative or non-finite
    ///     cost attribute or out of range coordinates. No graph is produced in that case.
    static LegGraph Load(const std::vector<LegRecord>& records);

    /// @brief Airport codes indexed by node ID.
    const CodeVec& Nodes() const noexcept { return codes_; }

    /// @brief Legs indexed by edge ID.
    const std::vector<Leg>& Edges() const noexcept { return legs_; }

    /// @brief Outgoing legs of `node`, sorted by the ID of the node they lead to.
    /// @throws std::invalid_argument if the node is not in the graph.
    const std::vector<Neighbour>& OutNeighbours(std::uint64_t node) const;

    bool HasAirport(std::string_view code) const;

    /// @brief Looks up the node ID of an airport.
    /// @throws UnknownAirportError if the airport is not in the graph.
    std::uint64_t NodeId(std::string_view code) const;

    /// @brief Returns the airport code of a node.
    /// @throws std::invalid_argument if the node is not in the graph.
    const std::string& Code(std::uint64_t node) const;

    /// @brief Returns the ID of the leg from `from` to `to`, if there is one.
    std::optional<std::uint64_t> FindEdge(std::uint64_t from, std::uint64_t to) const;

    /// @brief Returns the leg with the given ID.
    /// @throws std::invalid_argument if the leg is not in the graph.
    const Leg& GetLeg(std::uint64_t edge_id) const;

    /// @brief Sorted list of all airport codes.
    const CodeVec& Airports() const noexcept { return codes_; }

    CodeVec Codes(const NodeIdVec& nodes) const;

    /// @throws UnknownAirportError if any of the codes is not in the graph.
    NodeIdVec NodeIds(const CodeVec& codes) const;

private:
    using NodePair = std::pair<std::uint64_t, std::uint64_t>;

    CodeVec codes_;
    std::unordered_map<std::string, std::uint64_t> ids_;
    std::vector<Leg> legs_;
    std::vector<std::vector<Neighbour>> out_;
    std::unordered_map<NodePair, std::uint64_t, boost::hash<NodePair>> edge_index_;
};

} // namespace flight_paths
