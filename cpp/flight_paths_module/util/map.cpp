#include "map.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace flight_paths {
namespace util {

namespace {

const nlohmann::json *Find(const nlohmann::json &map, std::string_view key) {
  if (!map.is_object()) {
    throw std::invalid_argument(fmt::format("cannot look up '{}' in a value that is not an object", key));
  }
  auto it = map.find(std::string(key));
  if (it == map.end() || it->is_null()) {
    return nullptr;
  }
  return &(*it);
}

std::invalid_argument WrongType(std::string_view key, std::string_view expected) {
  return std::invalid_argument(fmt::format("'{}' is not {}", key, expected));
}

}  // namespace

std::optional<double> MapGetNumericOpt(const nlohmann::json &map, std::string_view key) {
  const auto *value = Find(map, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_number()) {
    throw WrongType(key, "a number");
  }
  return value->get<double>();
}

std::optional<int64_t> MapGetIntOpt(const nlohmann::json &map, std::string_view key) {
  const auto *value = Find(map, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_number_integer()) {
    throw WrongType(key, "an integer");
  }
  return value->get<int64_t>();
}

std::optional<std::string> MapGetStringOpt(const nlohmann::json &map, std::string_view key) {
  const auto *value = Find(map, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    throw WrongType(key, "a string");
  }
  return value->get<std::string>();
}

std::optional<nlohmann::json> MapGetObjectOpt(const nlohmann::json &map, std::string_view key) {
  const auto *value = Find(map, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_object()) {
    throw WrongType(key, "an object");
  }
  return *value;
}

}  // namespace util
}  // namespace flight_paths
