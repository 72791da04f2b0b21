/**
 * @file MalformedConfiguration.hpp
 * @brief Fatal configuration fault raised while loading settings or the entity catalogue.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace worldpulse::domain {

/**
 * @class MalformedConfiguration
 * @brief Thrown only at load time. Analysis stages never raise it mid-cycle.
 */
class MalformedConfiguration : public std::runtime_error {
public:
    explicit MalformedConfiguration(const std::string& what)
        : std::runtime_error("Malformed configuration: " + what) {}
};

} // namespace worldpulse::domain
