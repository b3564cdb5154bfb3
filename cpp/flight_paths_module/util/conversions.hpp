#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../algorithm/leg_graph.hpp"
#include "../flight_paths_module.hpp"

namespace flight_paths {

void to_json(nlohmann::json &dst, const RouteSegment &src);

void to_json(nlohmann::json &dst, const RouteResult &src);

namespace util {

/// @brief Reads leg records from JSON, either an array of leg objects or an object with a
///     `legs` array.
/// @throws InvalidRecordError if a record is not an object or a field is missing or not of the expected type.
std::vector<LegRecord> LegRecordsFromJson(const nlohmann::json &json);

/// @brief Reads leg records from a JSON file.
/// @throws std::invalid_argument if the file cannot be read or parsed.
/// @throws InvalidRecordError if a record is malformed.
std::vector<LegRecord> LoadLegRecords(const std::string &path);

/// @brief Renders routes as the list of records consumed by the route renderer.
nlohmann::json RoutesToJson(const std::vector<RouteResult> &routes);

}  // namespace util
}  // namespace flight_paths
