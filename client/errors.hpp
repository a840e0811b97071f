#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Invalid profile, target or run configuration.
 * Raised before any virtual user is started.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief The active tag filter leaves no task to choose from.
 */
class NoEligibleTask : public std::runtime_error {
public:
    explicit NoEligibleTask(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief One or more user pools could not reach their target population.
 * Users that did start keep running.
 */
class PartialRampError : public std::runtime_error {
public:
    explicit PartialRampError(const std::string& what)
        : std::runtime_error(what) {}
};
