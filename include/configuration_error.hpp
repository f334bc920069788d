#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised for invalid strategy or backtest configuration.
 *
 * Thrown before any date's data is touched; the message names the offending
 * strategy and field.
 */
class ConfigurationError: public std::runtime_error {
   public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};
