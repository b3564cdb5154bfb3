#pragma once

#include <cstdint>
#include <string_view>

namespace flight_paths {

constexpr const std::string_view kLabelBest = "Best";
constexpr const std::string_view kLabelAlternative = "Alternative";

/// @brief Number of enumerated paths returned when a query does not say otherwise.
constexpr const std::uint64_t kDefaultAlternatives = 5;

constexpr const std::string_view kOptionLegsFile = "legs_file";
constexpr const std::string_view kOptionSource = "source";
constexpr const std::string_view kOptionTarget = "target";
constexpr const std::string_view kOptionWeights = "weights";
constexpr const std::string_view kOptionAlternatives = "alternatives";
constexpr const std::string_view kOptionThreads = "threads";
constexpr const std::string_view kOptionLogLevel = "log_level";

constexpr const std::string_view kWeightCost = "cost";
constexpr const std::string_view kWeightTime = "time";
constexpr const std::string_view kWeightLayover = "layover";
constexpr const std::string_view kWeightCo2 = "co2";

constexpr const std::string_view kFieldLegs = "legs";
constexpr const std::string_view kFieldSource = "source";
constexpr const std::string_view kFieldDest = "dest";
constexpr const std::string_view kFieldCost = "cost";
constexpr const std::string_view kFieldTimeMinutes = "time_minutes";
constexpr const std::string_view kFieldCo2Kg = "co2_kg";
constexpr const std::string_view kFieldSourceLat = "source_lat";
constexpr const std::string_view kFieldSourceLon = "source_lon";
constexpr const std::string_view kFieldDestLat = "dest_lat";
constexpr const std::string_view kFieldDestLon = "dest_lon";

constexpr const std::string_view kReturnLabel = "label";
constexpr const std::string_view kReturnPath = "path";
constexpr const std::string_view kReturnScore = "score";
constexpr const std::string_view kReturnCost = "cost";
constexpr const std::string_view kReturnTime = "time";
constexpr const std::string_view kReturnCo2 = "co2";
constexpr const std::string_view kReturnLayovers = "layovers";
constexpr const std::string_view kReturnSegments = "segments";
constexpr const std::string_view kReturnFrom = "from";
constexpr const std::string_view kReturnTo = "to";
constexpr const std::string_view kReturnFromLat = "from_lat";
constexpr const std::string_view kReturnFromLon = "from_lon";
constexpr const std::string_view kReturnToLat = "to_lat";
constexpr const std::string_view kReturnToLon = "to_lon";

} // namespace flight_paths
