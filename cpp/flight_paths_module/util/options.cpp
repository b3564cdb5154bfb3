#include "options.hpp"
#include "map.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace flight_paths {
namespace util {

namespace {

nlohmann::json CheckObject(nlohmann::json &&json) {
  if (!json.is_object()) {
    throw std::invalid_argument("options must be a JSON object");
  }
  return std::move(json);
}

std::string RequiredString(const Options &options, std::string_view key) {
  auto value = options.String(key);
  if (not value.has_value()) {
    throw std::invalid_argument(fmt::format("option '{}' is required", key));
  }
  return std::move(*value);
}

}  // namespace

Options::Options() : _json(nlohmann::json::object()) {}
Options::Options(nlohmann::json &&json) : _json(CheckObject(std::move(json))) {}

Options Options::FromFile(const std::string &path) {
  std::ifstream file(path);
  if (not file) {
    throw std::invalid_argument(fmt::format("cannot open options file '{}'", path));
  }
  auto json = nlohmann::json::parse(file, nullptr, false);
  if (json.is_discarded()) {
    throw std::invalid_argument(fmt::format("options file '{}' is not valid JSON", path));
  }
  return Options(std::move(json));
}

std::optional<std::string> Options::String(std::string_view key) const { return MapGetStringOpt(_json, key); }

std::optional<int64_t> Options::Integer(std::string_view key) const { return MapGetIntOpt(_json, key); }

std::optional<Options> Options::Object(std::string_view key) const {
  auto object = MapGetObjectOpt(_json, key);
  if (not object.has_value()) {
    return std::nullopt;
  }
  return Options(std::move(*object));
}

RouteQuery RouteQueryFromOptions(const Options &options) {
  RouteQuery query;
  query.source = RequiredString(options, kOptionSource);
  query.target = RequiredString(options, kOptionTarget);

  const auto weights = options.Object(kOptionWeights).value_or(Options());
  query.weights = WeightVector::FromPreferences(
      weights.Integer(kWeightCost).value_or(kDefaultPreference),
      weights.Integer(kWeightTime).value_or(kDefaultPreference),
      weights.Integer(kWeightLayover).value_or(kDefaultPreference),
      weights.Integer(kWeightCo2).value_or(kDefaultPreference));

  const auto alternatives = options.Integer(kOptionAlternatives).value_or(kDefaultAlternatives);
  if (alternatives < 0) {
    throw std::invalid_argument(fmt::format("option '{}' cannot be negative", kOptionAlternatives));
  }
  query.alternatives = static_cast<std::uint64_t>(alternatives);
  const auto threads = options.Integer(kOptionThreads).value_or(1);
  if (threads < std::numeric_limits<int>::min() || threads > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(fmt::format("option '{}' is out of range", kOptionThreads));
  }
  query.threads = static_cast<int>(threads);

  return query;
}

}  // namespace util
}  // namespace flight_paths
