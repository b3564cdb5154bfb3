#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../flight_paths_module.hpp"

namespace flight_paths {
namespace util {

/// @brief Typed read access to a JSON configuration object.
class Options {
 public:
  Options();
  /// @throws std::invalid_argument if `json` is not an object.
  Options(nlohmann::json &&json);

  /// @brief Reads options from a JSON file.
  /// @throws std::invalid_argument if the file cannot be read or does not hold a JSON object.
  static Options FromFile(const std::string &path);

  std::optional<std::string> String(std::string_view key) const;
  std::optional<int64_t> Integer(std::string_view key) const;
  std::optional<Options> Object(std::string_view key) const;

 private:
  nlohmann::json _json;
};

/// @brief Builds a route query from the `source`, `target`, `weights`, `alternatives` and
///     `threads` options.
/// @throws std::invalid_argument if a required option is missing or a value is out of range.
RouteQuery RouteQueryFromOptions(const Options &options);

}  // namespace util
}  // namespace flight_paths
