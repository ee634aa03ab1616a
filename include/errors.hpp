// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace traffic {

// Bad config or topology file. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// No usable classifier could be built. Fatal at startup.
class ClassifierFitFailure : public std::runtime_error {
public:
  explicit ClassifierFitFailure(const std::string& what) : std::runtime_error(what) {}
};

// The simulator link went away. Fatal for the run; state cannot be replayed.
class ConnectionLost : public std::runtime_error {
public:
  explicit ConnectionLost(const std::string& what) : std::runtime_error(what) {}
};

} // namespace traffic
