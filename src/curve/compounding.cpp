// SPDX-License-Identifier: MIT
#include "spreadomatic/curve/compounding.hpp"
#include <cmath>

namespace spreadomatic {

int periods_per_year(Compounding comp) {
    switch (comp) {
        case Compounding::Annual:     return 1;
        case Compounding::Semiannual: return 2;
        case Compounding::Quarterly:  return 4;
        case Compounding::Monthly:    return 12;
        case Compounding::Continuous: return 0;
    }
    return 0;
}

std::expected<Compounding, ValidationError> compounding_from_frequency(int frequency) {
    switch (frequency) {
        case 1:  return Compounding::Annual;
        case 2:  return Compounding::Semiannual;
        case 4:  return Compounding::Quarterly;
        case 12: return Compounding::Monthly;
        default:
            return std::unexpected(ValidationError(
                ValidationErrorCode::InvalidFrequency, static_cast<double>(frequency)));
    }
}

std::expected<Compounding, ValidationError> parse_compounding(std::string_view name) {
    if (name == "annual")     return Compounding::Annual;
    if (name == "semiannual") return Compounding::Semiannual;
    if (name == "quarterly")  return Compounding::Quarterly;
    if (name == "monthly")    return Compounding::Monthly;
    if (name == "continuous") return Compounding::Continuous;
    return std::unexpected(ValidationError(ValidationErrorCode::InvalidCompounding));
}

std::string_view to_string(Compounding comp) {
    switch (comp) {
        case Compounding::Annual:     return "annual";
        case Compounding::Semiannual: return "semiannual";
        case Compounding::Quarterly:  return "quarterly";
        case Compounding::Monthly:    return "monthly";
        case Compounding::Continuous: return "continuous";
    }
    return "unknown";
}

double discount_factor(double rate, double t, Compounding comp) {
    if (comp == Compounding::Continuous) {
        return std::exp(-rate * t);
    }
    const double f = static_cast<double>(periods_per_year(comp));
    return std::pow(1.0 + rate / f, -f * t);
}

double to_continuous(double rate, Compounding comp) {
    if (comp == Compounding::Continuous) {
        return rate;
    }
    const double f = static_cast<double>(periods_per_year(comp));
    return f * std::log1p(rate / f);
}

double from_continuous(double rate, Compounding comp) {
    if (comp == Compounding::Continuous) {
        return rate;
    }
    const double f = static_cast<double>(periods_per_year(comp));
    return f * std::expm1(rate / f);
}

}  // namespace spreadomatic
