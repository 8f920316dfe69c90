#ifndef COMBUSTION_SUBMODEL_HPP
#define COMBUSTION_SUBMODEL_HPP

#include <Eigen/Dense>
#include "biomass_input.hpp"
#include "equations.hpp"

// Composition on wet basis, % of as-fired fuel
struct WetComposition {
    double carbon, hydrogen, oxygen, nitrogen, sulfur, ash, water;
};

struct CombustionResult {
    // Fuel properties
    double pcs;                       // kJ/kg
    double pci_calculated;            // kJ/kg
    WetComposition composition_wet;
    double water_combustion;          // 9H + moisture, %

    // Air properties
    double atmospheric_pressure;      // kPa
    double air_density;               // kg/m³
    double absolute_humidity;         // kg water / kg dry air
    double air_enthalpy;              // kJ/kg dry air

    // Stoichiometry, kg air / kg fuel
    double theoretical_air;
    double real_air;
    double excess_air_percentage;

    // Combustion products, kg / kg fuel
    double co2, h2o, so2, o2_excess, n2;
    double ash;
    double total_gas_mass;

    // Volumetric fractions, %
    double co2_fraction_vol, h2o_fraction_vol, so2_fraction_vol;
    double o2_fraction_vol, n2_fraction_vol;

    // Mass balance
    double flow_rate_kg_s;
    double mass_flow_gases;           // kg/s

    // Energy balance
    double total_energy_released;     // MW
    double useful_energy;             // MW
    double adiabatic_flame_temp;      // K
    bool flame_temp_converged;
    double outlet_gas_temp;           // K
    double chimney_losses;            // MW
    double real_efficiency;           // %

    // Fluid dynamics
    double gas_density;               // kg/m³
    double volumetric_flow;           // m³/s
    double duct_area;                 // m²
    double gas_velocity;              // m/s
    double reynolds_number;
    double friction_factor;
    bool friction_converged;
    double pressure_drop;             // Pa/m

    // Heat transfer, per metre of duct
    double thermal_resistance;        // K·m/W
    double heat_transfer_coefficient; // W/(m·K)
    double heat_loss_per_meter;       // W/m
    double external_wall_temp;        // °C
    double refractory_gradient;       // K
    double insulation_efficiency;     // %

    // Emissions
    double co2_emission_factor;       // kg CO2 / kg fuel
    double co2_concentration_dry;     // %
    double volumetric_heating_value;  // kJ/m³
};

class Combustion {
public:
    Combustion() = default;

    // Runs all stages in order. Pure: equal inputs give equal results.
    CombustionResult calculate_all(const BiomassInput& input) const;

    struct FuelProperties {
        WetComposition composition_wet;
        double pcs;
        double pci_calculated;
        double theoretical_air;
        double real_air;
        double water_combustion;
    };

    struct AirProperties {
        double atmospheric_pressure;
        double air_density;
        double absolute_humidity;
        double air_enthalpy;
    };

    struct MassBalance {
        double flow_rate_kg_s;
        double mass_flow_gases;
        double total_gas_mass;
    };

    struct EnergyBalance {
        double total_energy;      // kW
        double useful_energy;     // kW
        SolverResult adiabatic;   // K
        double outlet_temp;       // K
        double chimney_losses;    // kW
        double real_efficiency;
    };

    struct FluidDynamics {
        double gas_density;
        double volumetric_flow;
        double duct_area;
        double gas_velocity;
        double reynolds;
        SolverResult friction;
        double pressure_drop;
    };

    struct HeatTransferResult {
        double thermal_resistance;
        double heat_transfer_coefficient;
        double heat_loss_per_meter;
        double external_wall_temp;
        double refractory_gradient;
        double insulation_efficiency;
    };

    struct Emissions {
        double co2_emission_factor;
        double co2_concentration_dry;
        double volumetric_heating_value;
    };

    FuelProperties fuel_properties(const BiomassInput& input) const;
    AirProperties air_properties(const BiomassInput& input) const;
    Equations::CombustionProducts stoichiometry(const BiomassInput& input) const;

    MassBalance mass_balance(const BiomassInput& input, const FuelProperties& fuel,
        const Equations::CombustionProducts& products) const;

    EnergyBalance energy_balance(const BiomassInput& input, const FuelProperties& fuel,
        const Equations::CombustionProducts& products, const MassBalance& mass) const;

    FluidDynamics fluid_dynamics(const BiomassInput& input, const AirProperties& air,
        const Equations::CombustionProducts& products, const MassBalance& mass,
        const EnergyBalance& energy) const;

    HeatTransferResult heat_transfer(const BiomassInput& input,
        const EnergyBalance& energy) const;

    Emissions emissions(const FuelProperties& fuel,
        const Equations::CombustionProducts& products) const;

    // Mole-fraction split of the five product gases, %; all zero without moles
    static Eigen::VectorXd volumetric_fractions(const Eigen::VectorXd& species_mass);

    // Adiabatic flame temperature, K, floored at the reference temperature
    static SolverResult adiabatic_flame_temperature(double pci,
        const Eigen::VectorXd& species_mass);

private:
    template<typename Func>
    static SolverResult solveScalar(Func equation, double x0, int maxIter = 50, double tol = 1e-6);
};

#endif // COMBUSTION_SUBMODEL_HPP
