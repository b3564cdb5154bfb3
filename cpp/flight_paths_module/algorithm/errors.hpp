#pragma once

#include <stdexcept>
#include <string>

namespace flight_paths {

/// @brief Thrown when a leg record is missing a field or carries an invalid value.
class InvalidRecordError : public std::invalid_argument {
public:
    explicit InvalidRecordError(const std::string& what): std::invalid_argument(what) {}
};

/// @brief Thrown when an airport code is not a node of the graph.
class UnknownAirportError : public std::invalid_argument {
public:
    explicit UnknownAirportError(const std::string& what): std::invalid_argument(what) {}
};

/// @brief Thrown when the destination cannot be reached from the source.
class NoPathFoundError : public std::runtime_error {
public:
    explicit NoPathFoundError(const std::string& what): std::runtime_error(what) {}
};

/// @brief Thrown when a path handed to the scorer uses a leg that does not exist.
class DisconnectedPathError : public std::logic_error {
public:
    explicit DisconnectedPathError(const std::string& what): std::logic_error(what) {}
};

} // namespace flight_paths
