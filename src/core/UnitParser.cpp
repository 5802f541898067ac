#include "UnitParser.hpp"
#include "ColumnSpec.hpp"

#include <cctype>

namespace dsearch {

// ============================================================================
// UNIT CONVERSION
// ============================================================================

double UnitParser::to_meters_factor(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return 1.0;
        case DistanceUnit::KILOMETERS: return 1000.0;
        case DistanceUnit::FEET:       return 0.3048;
        case DistanceUnit::YARDS:      return 0.9144;
        case DistanceUnit::MILES:      return 1609.34;
    }
    throw UnitParseError("Unknown distance unit in to_meters_factor");
}

double UnitParser::convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit) {
    if (from_unit == to_unit) {
        return value;
    }
    double in_meters = value * to_meters_factor(from_unit);
    return in_meters / to_meters_factor(to_unit);
}

DistanceUnit UnitParser::parse_unit_string(const std::string& unit_str) {
    const std::string lower_unit = to_lower(unit_str);

    if (lower_unit == "m" || lower_unit == "meters" || lower_unit == "metres") {
        return DistanceUnit::METERS;
    } else if (lower_unit == "km" || lower_unit == "kilometers" || lower_unit == "kilometres") {
        return DistanceUnit::KILOMETERS;
    } else if (lower_unit == "ft" || lower_unit == "feet") {
        return DistanceUnit::FEET;
    } else if (lower_unit == "yd" || lower_unit == "yards") {
        return DistanceUnit::YARDS;
    } else if (lower_unit == "mi" || lower_unit == "miles") {
        return DistanceUnit::MILES;
    }

    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. " +
                         "Supported units: m, km, ft, yd, mi");
}

std::string UnitParser::unit_to_string(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return "m";
        case DistanceUnit::KILOMETERS: return "km";
        case DistanceUnit::FEET:       return "ft";
        case DistanceUnit::YARDS:      return "yd";
        case DistanceUnit::MILES:      return "mi";
    }
    return "unknown";
}

// ============================================================================
// AREA UNITS
// ============================================================================

AreaUnit UnitParser::parse_area_unit(const std::string& input) {
    const std::string lower_unit = to_lower(trim(input));

    if (lower_unit == "ha" || lower_unit == "hectares") {
        return AreaUnit::HECTARES;
    } else if (lower_unit == "m2" || lower_unit == "sqm" || lower_unit == "square_meters" ||
               lower_unit == "squaremeters") {
        return AreaUnit::SQUARE_METERS;
    } else if (lower_unit == "km2" || lower_unit == "sqkm" || lower_unit == "square_kilometers" ||
               lower_unit == "squarekilometers") {
        return AreaUnit::SQUARE_KILOMETERS;
    }

    throw UnitParseError("Invalid area unit: '" + input + "'. Use: ha, m2 or km2");
}

std::string UnitParser::area_unit_to_string(AreaUnit unit) {
    switch (unit) {
        case AreaUnit::HECTARES:          return "ha";
        case AreaUnit::SQUARE_METERS:     return "m2";
        case AreaUnit::SQUARE_KILOMETERS: return "km2";
    }
    return "ha";
}

// ============================================================================
// VALUE AND UNIT SPLITTING
// ============================================================================

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) const {
    const std::string trimmed = trim(input);
    if (trimmed.empty()) {
        throw UnitParseError("Empty input string");
    }

    // Find where numeric part ends
    size_t num_end = 0;
    bool found_decimal = false;
    bool found_digit = false;

    for (size_t i = 0; i < trimmed.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(trimmed[i]);

        if (std::isdigit(c)) {
            found_digit = true;
            num_end = i + 1;
        } else if (c == '.' && !found_decimal) {
            found_decimal = true;
            num_end = i + 1;
        } else if ((c == '-' || c == '+') && i == 0) {
            num_end = i + 1;
        } else {
            break;
        }
    }

    if (!found_digit) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }

    return {trimmed.substr(0, num_end), trim(trimmed.substr(num_end))};
}

// ============================================================================
// DISTANCE PARSING
// ============================================================================

ParsedValue UnitParser::parse_distance(const std::string& input, DistanceUnit default_unit) const {
    auto [value_str, unit_str] = split_value_and_unit(input);

    double value;
    try {
        value = std::stod(value_str);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid numeric value: '" + value_str + "'");
    }

    DistanceUnit source_unit = default_unit;
    const bool had_explicit_unit = !unit_str.empty();
    if (had_explicit_unit) {
        source_unit = parse_unit_string(unit_str);
    }

    return ParsedValue(convert_distance(value, source_unit, DistanceUnit::METERS),
                       source_unit, had_explicit_unit);
}

} // namespace dsearch
