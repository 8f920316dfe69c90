#ifndef ATMOSPHERE_SUBMODEL_HPP
#define ATMOSPHERE_SUBMODEL_HPP

#include <string>
#include <vector>

// Ambient air at a site, derived from altitude, temperature and humidity
struct AtmosphericConditions {
    double altitude;            // m
    double temperature;         // °C
    double relative_humidity;   // %
    double pressure;            // kPa
    double air_density;         // kg/m³
    double absolute_humidity;   // kg water / kg dry air
    double air_enthalpy;        // kJ/kg dry air
    double vapor_pressure;      // mmHg, saturation
    double oxygen_fraction;     // volume fraction
    double density_vs_sea_level; // % of standard sea-level density
    double oxygen_vs_sea_level;  // % of sea-level oxygen fraction
};

class Atmosphere {
public:
    static AtmosphericConditions custom_conditions(double altitude, double temperature,
        double relative_humidity);

    // Linear decrease with altitude, floored at 0.15
    static double oxygen_fraction(double altitude);

    // Volumetric flow correction relative to sea level
    static double altitude_correction_factor(double altitude);

    struct Validation {
        bool is_valid;
        std::vector<std::string> warnings;
        std::vector<std::string> errors;
    };

    static Validation validate_conditions(const AtmosphericConditions& conditions);

    struct QuantityChange {
        double base;
        double other;
        double difference;
        double percent_change;
    };

    struct Impact {
        std::string factor;
        std::string description;
        std::string recommendation;
    };

    struct Comparison {
        QuantityChange pressure;
        QuantityChange air_density;
        QuantityChange temperature;
        QuantityChange relative_humidity;
        std::vector<Impact> impacts;
        std::string overall_risk;   // Low, Medium or High
        bool needs_adjustment;
    };

    static Comparison compare_conditions(const AtmosphericConditions& base,
        const AtmosphericConditions& other);

    // Operating advice for firing at these conditions
    static std::vector<std::string> combustion_advice(const AtmosphericConditions& conditions);

private:
    static QuantityChange change(double base, double other);
};

#endif // ATMOSPHERE_SUBMODEL_HPP
