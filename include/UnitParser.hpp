#pragma once

#include "data_search.hpp"

#include <string>
#include <stdexcept>
#include <utility>

namespace dsearch {

/**
 * @brief Exception thrown when unit parsing fails
 */
class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& message)
        : std::runtime_error("Unit parsing error: " + message) {}
};

/**
 * @brief Unit types for ground distances
 */
enum class DistanceUnit {
    METERS,      // m
    KILOMETERS,  // km
    FEET,        // ft
    YARDS,       // yd
    MILES        // mi
};

/**
 * @brief Result of parsing a value with units
 */
struct ParsedValue {
    double value;               // Numeric value in metres
    DistanceUnit original_unit; // Unit that was parsed
    bool had_explicit_unit;     // Whether unit was explicitly specified

    ParsedValue(double v, DistanceUnit u, bool explicit_unit = false)
        : value(v), original_unit(u), had_explicit_unit(explicit_unit) {}
};

/**
 * @brief Parses search radii and area units
 *
 * Distances take an optional unit suffix: "500" (default unit), "500m",
 * "2km", "1.5mi", "300ft", "200 yd". The radius text itself is kept by the
 * caller as the tag written to output rows; only the buffer uses the parsed
 * metres.
 *
 * Area units: "ha" / "hectares", "m2" / "sqm" / "square_meters",
 * "km2" / "sqkm" / "square_kilometers".
 */
class UnitParser {
public:
    UnitParser() = default;

    /**
     * @brief Parse a distance with optional unit suffix into metres
     *
     * Examples:
     *   parse_distance("200")      -> 200.0
     *   parse_distance("5km")      -> 5000.0
     *   parse_distance("10", FEET) -> 3.048
     */
    ParsedValue parse_distance(const std::string& input,
                               DistanceUnit default_unit = DistanceUnit::METERS) const;

    static AreaUnit parse_area_unit(const std::string& input);
    static std::string area_unit_to_string(AreaUnit unit);

    static double to_meters_factor(DistanceUnit unit);
    static double convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit);

    static DistanceUnit parse_unit_string(const std::string& unit_str);
    static std::string unit_to_string(DistanceUnit unit);

private:
    /**
     * @brief Split "5km" into {"5", "km"}
     */
    std::pair<std::string, std::string> split_value_and_unit(const std::string& input) const;
};

} // namespace dsearch
