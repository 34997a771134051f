#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace pitwall {

// Base for every error the engine raises.
class Error : public std::runtime_error {
public:
  explicit Error(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Compound not present in the active compound table, or unparseable name.
class InvalidCompound : public Error {
public:
  using Error::Error;
};

// Operation attempted before start, after the final lap, or with no pending decision.
class InvalidStateError : public Error {
public:
  using Error::Error;
};

// Trigger priority table produced two winners. Programming error; never retried.
class AmbiguousTrigger : public Error {
public:
  using Error::Error;
};

// Bad configuration value or unreadable configuration file.
class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace pitwall
