#include "conversions.hpp"
#include "map.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/core.h>

#include "../algorithm/errors.hpp"
#include "../algorithm/procedures.hpp"

namespace flight_paths {

void to_json(nlohmann::json &dst, const RouteSegment &src) {
  dst[std::string(kReturnFrom)] = src.from;
  dst[std::string(kReturnTo)] = src.to;
  dst[std::string(kReturnFromLat)] = src.from_coords.lat;
  dst[std::string(kReturnFromLon)] = src.from_coords.lon;
  dst[std::string(kReturnToLat)] = src.to_coords.lat;
  dst[std::string(kReturnToLon)] = src.to_coords.lon;
  dst[std::string(kReturnCost)] = src.cost;
  dst[std::string(kReturnTime)] = src.time_minutes;
  dst[std::string(kReturnCo2)] = src.co2_kg;
}

void to_json(nlohmann::json &dst, const RouteResult &src) {
  dst[std::string(kReturnLabel)] = src.label;
  dst[std::string(kReturnPath)] = src.path;
  dst[std::string(kReturnScore)] = src.score.combined_score;
  dst[std::string(kReturnCost)] = src.score.total_cost;
  dst[std::string(kReturnTime)] = src.score.total_time_minutes;
  dst[std::string(kReturnCo2)] = src.score.total_co2_kg;
  dst[std::string(kReturnLayovers)] = src.score.layover_count;
  dst[std::string(kReturnSegments)] = src.segments;
}

namespace util {

namespace {

std::string RequiredCode(const nlohmann::json &record, size_t index, std::string_view field) {
  std::optional<std::string> value;
  try {
    value = MapGetStringOpt(record, field);
  } catch (const std::invalid_argument &) {
    throw InvalidRecordError(fmt::format("record {} field '{}' is not a string", index, field));
  }
  if (not value.has_value()) {
    throw InvalidRecordError(fmt::format("record {} is missing field '{}'", index, field));
  }
  return *value;
}

double RequiredNumber(const nlohmann::json &record, size_t index, std::string_view field) {
  std::optional<double> value;
  try {
    value = MapGetNumericOpt(record, field);
  } catch (const std::invalid_argument &) {
    throw InvalidRecordError(fmt::format("record {} field '{}' is not a number", index, field));
  }
  if (not value.has_value()) {
    throw InvalidRecordError(fmt::format("record {} is missing field '{}'", index, field));
  }
  return *value;
}

}  // namespace

std::vector<LegRecord> LegRecordsFromJson(const nlohmann::json &json) {
  const nlohmann::json *legs = &json;
  if (json.is_object()) {
    auto it = json.find(std::string(kFieldLegs));
    if (it == json.end()) {
      throw InvalidRecordError(fmt::format("expected a '{}' list of leg records", kFieldLegs));
    }
    legs = &(*it);
  }
  if (not legs->is_array()) {
    throw InvalidRecordError("leg records must be a list");
  }

  std::vector<LegRecord> records;
  records.reserve(legs->size());
  for (const auto &record : *legs) {
    const auto index = records.size();
    if (not record.is_object()) {
      throw InvalidRecordError(fmt::format("record {} is not an object", index));
    }
    records.push_back(LegRecord{
        RequiredCode(record, index, kFieldSource),
        RequiredCode(record, index, kFieldDest),
        RequiredNumber(record, index, kFieldCost),
        RequiredNumber(record, index, kFieldTimeMinutes),
        RequiredNumber(record, index, kFieldCo2Kg),
        RequiredNumber(record, index, kFieldSourceLat),
        RequiredNumber(record, index, kFieldSourceLon),
        RequiredNumber(record, index, kFieldDestLat),
        RequiredNumber(record, index, kFieldDestLon),
    });
  }

  return records;
}

std::vector<LegRecord> LoadLegRecords(const std::string &path) {
  std::ifstream file(path);
  if (not file) {
    throw std::invalid_argument(fmt::format("cannot open legs file '{}'", path));
  }
  auto json = nlohmann::json::parse(file, nullptr, false);
  if (json.is_discarded()) {
    throw std::invalid_argument(fmt::format("legs file '{}' is not valid JSON", path));
  }
  return LegRecordsFromJson(json);
}

nlohmann::json RoutesToJson(const std::vector<RouteResult> &routes) {
  auto result = nlohmann::json::array();
  for (const auto &route : routes) {
    result.push_back(nlohmann::json(route));
  }
  return result;
}

}  // namespace util
}  // namespace flight_paths
