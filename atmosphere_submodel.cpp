#include "atmosphere_submodel.hpp"
#include "equations.hpp"
#include "furnace_constants.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

std::string format_one(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

} // namespace

AtmosphericConditions Atmosphere::custom_conditions(double altitude, double temperature,
    double relative_humidity) {
    AtmosphericConditions c;
    c.altitude = altitude;
    c.temperature = temperature;
    c.relative_humidity = relative_humidity;

    c.pressure = Equations::pressure_altitude(altitude);
    c.air_density = c.pressure * 1000.0 / (FurnaceConstants::R_AIR * (temperature + FurnaceConstants::KELVIN));
    c.absolute_humidity = Equations::absolute_humidity(relative_humidity, temperature, c.pressure);
    c.air_enthalpy = Equations::moist_air_enthalpy(temperature, c.absolute_humidity);
    c.vapor_pressure = Equations::saturated_vapor_pressure(temperature);
    c.oxygen_fraction = oxygen_fraction(altitude);
    c.density_vs_sea_level = c.air_density / FurnaceConstants::RHO_AIR_SEA_LEVEL * 100.0;
    c.oxygen_vs_sea_level = c.oxygen_fraction / FurnaceConstants::O2_VOLUME_FRACTION_SEA_LEVEL * 100.0;

    return c;
}

double Atmosphere::oxygen_fraction(double altitude) {
    return std::max(FurnaceConstants::O2_VOLUME_FRACTION_SEA_LEVEL - 5e-6 * altitude, 0.15);
}

double Atmosphere::altitude_correction_factor(double altitude) {
    // P0/P with both in kPa, not P0/(P/P0), so sea level gives exactly 1
    return FurnaceConstants::P0_KPA / Equations::pressure_altitude(altitude);
}

Atmosphere::Validation Atmosphere::validate_conditions(const AtmosphericConditions& conditions) {
    Validation v;

    if (conditions.altitude < 0.0 || conditions.altitude > 5000.0) {
        v.errors.push_back("Altitude out of range (0-5000 m)");
    }
    if (conditions.temperature < -20.0 || conditions.temperature > 50.0) {
        v.errors.push_back("Temperature out of range (-20 to 50 C)");
    }
    if (conditions.relative_humidity < 0.0 || conditions.relative_humidity > 100.0) {
        v.errors.push_back("Relative humidity must be between 0 and 100%");
    }
    v.is_valid = v.errors.empty();

    if (conditions.altitude > 3000.0) {
        v.warnings.push_back("High altitude may require significant air adjustments");
    }
    if (conditions.relative_humidity > 90.0) {
        v.warnings.push_back("High humidity may reduce combustion efficiency");
    }
    if (conditions.pressure < 70.0) {
        v.warnings.push_back("Low atmospheric pressure detected");
    }

    return v;
}

Atmosphere::QuantityChange Atmosphere::change(double base, double other) {
    QuantityChange q;
    q.base = base;
    q.other = other;
    q.difference = other - base;
    q.percent_change = base != 0.0 ? q.difference / base * 100.0 : 0.0;
    return q;
}

Atmosphere::Comparison Atmosphere::compare_conditions(const AtmosphericConditions& base,
    const AtmosphericConditions& other) {
    Comparison cmp;
    cmp.pressure = change(base.pressure, other.pressure);
    cmp.air_density = change(base.air_density, other.air_density);
    cmp.temperature = change(base.temperature, other.temperature);
    cmp.relative_humidity = change(base.relative_humidity, other.relative_humidity);

    const double density_pct = cmp.air_density.percent_change;
    if (std::abs(density_pct) > 5.0) {
        cmp.impacts.push_back({
            "Air density",
            format_one(density_pct) + "% change in available oxygen",
            density_pct > 0.0 ? "Adjust the air-fuel ratio" : "Reduce excess air"
        });
    }

    const double temp_diff = cmp.temperature.difference;
    if (std::abs(temp_diff) > 5.0) {
        cmp.impacts.push_back({
            "Ambient temperature",
            format_one(temp_diff) + " C change affects flame temperature",
            "Monitor flue gas temperature"
        });
    }

    const double rh_diff = cmp.relative_humidity.difference;
    if (std::abs(rh_diff) > 10.0) {
        cmp.impacts.push_back({
            "Relative humidity",
            format_one(rh_diff) + "% change in combustion air humidity",
            "Adjust the combustion water calculation"
        });
    }

    const size_t n = cmp.impacts.size();
    cmp.overall_risk = n > 2 ? "High" : (n > 0 ? "Medium" : "Low");
    cmp.needs_adjustment = n > 0;

    return cmp;
}

std::vector<std::string> Atmosphere::combustion_advice(const AtmosphericConditions& conditions) {
    std::vector<std::string> advice;
    if (conditions.altitude > 2000.0) {
        advice.push_back("High altitude: increase volumetric air by 15-25%");
    }
    if (conditions.relative_humidity > 80.0) {
        advice.push_back("High humidity: consider preheating the combustion air");
    }
    if (conditions.temperature < 10.0) {
        advice.push_back("Low temperature: allow a longer preheating time");
    }
    return advice;
}
