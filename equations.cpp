#include "equations.hpp"
#include "furnace_constants.hpp"
#include <cmath>

double Equations::pressure_altitude(double altitude) {
    typedef FurnaceConstants K;

    if (altitude < K::TROPOPAUSE) {
        double exponent = K::G * K::M_AIR / (K::R_UNIVERSAL * K::LAPSE_RATE);
        double temp_ratio = 1.0 - K::LAPSE_RATE * altitude / K::T0_STD;
        return K::P0_KPA * std::pow(temp_ratio, exponent);
    }
    return K::P0_KPA * std::exp(-altitude / K::SCALE_HEIGHT);
}

double Equations::saturated_vapor_pressure(double temp_celsius) {
    double log10_p = FurnaceConstants::ANTOINE_A -
        FurnaceConstants::ANTOINE_B / (FurnaceConstants::ANTOINE_C + temp_celsius);
    return std::pow(10.0, log10_p);
}

double Equations::absolute_humidity(double relative_humidity, double dry_bulb_temp,
    double atmospheric_pressure) {
    double p_sat = saturated_vapor_pressure(dry_bulb_temp);           // mmHg
    double p_v = relative_humidity / 100.0 * p_sat;                    // mmHg
    double p_v_kpa = p_v * FurnaceConstants::MMHG_TO_KPA;

    return 0.622 * p_v_kpa / (atmospheric_pressure - p_v_kpa);
}

double Equations::moist_air_enthalpy(double temp_celsius, double absolute_humidity) {
    double h_air = 1.006 * temp_celsius;
    double h_water = absolute_humidity * (2501.0 + 1.86 * temp_celsius);
    return h_air + h_water;
}

Equations::HeatingValue Equations::dulong_heating_value(double carbon, double hydrogen,
    double oxygen, double sulfur, double ash, double moisture) {

    double total = carbon + hydrogen + oxygen + sulfur + ash;
    if (total > 0.0 && total != 100.0) {
        double scale = 100.0 / total;
        carbon *= scale;
        hydrogen *= scale;
        oxygen *= scale;
        sulfur *= scale;
    }

    HeatingValue hv;
    hv.pcs = 338.2 * carbon + 1442.8 * (hydrogen - oxygen / 8.0) + 94.2 * sulfur;
    hv.water_from_combustion = 9.0 * hydrogen + moisture;
    hv.pci = hv.pcs - FurnaceConstants::HV_WATER * hv.water_from_combustion / 100.0;
    return hv;
}

double Equations::theoretical_air_fuel_ratio(double carbon, double hydrogen,
    double oxygen, double sulfur) {
    // Stoichiometric oxygen, kg O2 / kg fuel
    double o2_required = (2.667 * carbon + 8.0 * hydrogen - 1.333 * oxygen + 2.0 * sulfur) / 100.0;
    return o2_required / FurnaceConstants::O2_MASS_FRACTION_AIR;
}

Equations::CombustionProducts Equations::combustion_products(double carbon, double hydrogen,
    double oxygen, double sulfur, double moisture, double ash, double excess_air_percent) {

    double moisture_factor = (100.0 - moisture) / 100.0;

    CombustionProducts p;
    p.mass = Eigen::VectorXd::Zero(N_SPECIES);

    p.air_theoretical = theoretical_air_fuel_ratio(
        carbon * moisture_factor, hydrogen * moisture_factor,
        oxygen * moisture_factor, sulfur * moisture_factor);
    p.air_real = p.air_theoretical * (1.0 + excess_air_percent / 100.0);

    p.mass(CO2) = 3.67 * carbon * moisture_factor / 100.0;          // 44/12
    p.mass(H2O) = 9.0 * hydrogen * moisture_factor / 100.0 + moisture / 100.0;
    p.mass(SO2) = 2.0 * sulfur * moisture_factor / 100.0;           // 64/32
    p.mass(O2) = FurnaceConstants::O2_MASS_FRACTION_AIR * p.air_theoretical *
        excess_air_percent / 100.0;
    p.mass(N2) = FurnaceConstants::N2_MASS_FRACTION_AIR * p.air_real;

    p.ash = ash * moisture_factor / 100.0;
    p.total_gases = p.mass.sum();
    return p;
}

double Equations::gas_density(double temperature_k, double pressure_pa,
    const Eigen::VectorXd& species_mass) {
    // mol per kg-fuel basis; molar masses converted to kg/mol
    Eigen::VectorXd moles = species_mass.array() / (FurnaceConstants::molar_mass.array() / 1000.0);
    double total_moles = moles.sum();
    if (total_moles <= 0.0) {
        return 0.0;
    }

    double avg_molar_mass = species_mass.sum() / total_moles;
    return pressure_pa * avg_molar_mass / (FurnaceConstants::R_UNIVERSAL * temperature_k);
}

double Equations::reynolds_number(double velocity, double diameter, double density,
    double viscosity) {
    return density * velocity * diameter / viscosity;
}

SolverResult Equations::colebrook_friction_factor(double Re, double diameter,
    double roughness, int max_iter, double tol) {
    SolverResult result;

    if (Re <= 0.0) {
        // No flow
        result.converged = true;
        return result;
    }

    // Laminar 64/Re and the Colebrook branch do not meet at the transition
    if (Re < FurnaceConstants::LAMINAR_RE) {
        result.value = 64.0 / Re;
        result.converged = true;
        return result;
    }

    double relative_roughness = roughness / (3.7 * diameter);
    double f = 0.02;

    for (int iter = 0; iter < max_iter; ++iter) {
        double rhs = -2.0 * std::log10(relative_roughness + 2.51 / (Re * std::sqrt(f)));
        double f_new = 1.0 / (rhs * rhs);
        result.iterations = iter + 1;

        if (std::abs(f_new - f) < tol) {
            f = f_new;
            result.converged = true;
            break;
        }
        f = f_new;
    }

    result.value = f;
    return result;
}

double Equations::pressure_drop_per_length(double friction_factor, double density,
    double velocity, double diameter) {
    return friction_factor * (1.0 / diameter) * (density * velocity * velocity / 2.0);
}
