// exceptions.hpp
// Exception Types for the ALMA Supertrend Indicator Library
// Used by the loading and driver layers; the indicator core reports status values instead

#pragma once

#include <stdexcept>
#include <string>

namespace almatrend {

// ============================================================================
// Exception Types for Better Error Handling
// ============================================================================

class AlmaTrendException : public std::runtime_error {
public:
    explicit AlmaTrendException(const std::string& msg) : std::runtime_error(msg) {}
};

class DataException : public AlmaTrendException {
public:
    explicit DataException(const std::string& msg) : AlmaTrendException("Data Error: " + msg) {}
};

class ConfigException : public AlmaTrendException {
public:
    explicit ConfigException(const std::string& msg) : AlmaTrendException("Config Error: " + msg) {}
};

} // namespace almatrend
