#pragma once

#include <cmath>
#include <string>
#include "storefront/validation_error.hpp"

namespace storefront {
namespace validation {

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw ValidationError::invalid_configuration(field_name + " must not be empty");
    }
}

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw ValidationError::invalid_configuration(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw ValidationError::invalid_configuration(field_name + " must be non-negative");
    }
}

/**
 * Require that a floating point value is neither NaN nor infinite.
 */
inline void require_finite(double value, const std::string& field_name = "value") {
    if (!std::isfinite(value)) {
        throw ValidationError::invalid_configuration(field_name + " must be a finite number");
    }
}

} // namespace validation
} // namespace storefront
