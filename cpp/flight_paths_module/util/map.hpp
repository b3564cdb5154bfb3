#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flight_paths {
namespace util {

// Typed lookups in a JSON object. Each returns an empty optional if the key is absent or null
// and throws std::invalid_argument if the value has another type.

std::optional<double> MapGetNumericOpt(const nlohmann::json &map, std::string_view key);

std::optional<int64_t> MapGetIntOpt(const nlohmann::json &map, std::string_view key);

std::optional<std::string> MapGetStringOpt(const nlohmann::json &map, std::string_view key);

std::optional<nlohmann::json> MapGetObjectOpt(const nlohmann::json &map, std::string_view key);

}  // namespace util
}  // namespace flight_paths
