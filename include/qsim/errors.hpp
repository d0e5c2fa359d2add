#pragma once

#include <stdexcept>
#include <string>

namespace qsim {

// Base class for every failure the engine reports to its caller.  Numeric
// degeneracies (division by zero, overflow, wipeouts) are not errors: they
// are clamped where they occur and surface through diagnostics instead.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Input data is missing, empty, unordered or lacks a required field.
class DataError : public Error {
public:
    explicit DataError(const std::string& what) : Error(what) {}
};

// Two sequences that must line up bar by bar do not.
class AlignmentError : public Error {
public:
    explicit AlignmentError(const std::string& what) : Error(what) {}
};

// A configuration value is out of its allowed range or unknown.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace qsim
