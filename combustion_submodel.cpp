#include "combustion_submodel.hpp"
#include "furnace_constants.hpp"
#include <cmath>
#include <algorithm>

const double PI = 3.14159265358979323846;

typedef FurnaceConstants K;

// Newton iteration with a numerical derivative. Returns the last iterate
// with converged == false when the cap is hit or the slope vanishes.
template<typename Func>
SolverResult Combustion::solveScalar(Func equation, double x0, int maxIter, double tol) {
    SolverResult result;
    double x = x0;

    for (int iter = 0; iter < maxIter; ++iter) {
        double fx = equation(x);
        result.iterations = iter + 1;

        if (std::abs(fx) < tol) {
            result.converged = true;
            break;
        }

        double h = 1e-4 * std::max(1.0, std::abs(x));
        double dfx = (equation(x + h) - fx) / h;
        if (std::abs(dfx) < 1e-15) {
            break;
        }

        double dx = -fx / dfx;
        x += dx;

        if (std::abs(dx) < tol) {
            result.converged = true;
            break;
        }
    }

    result.value = x;
    return result;
}

SolverResult Combustion::adiabatic_flame_temperature(double pci,
    const Eigen::VectorXd& species_mass) {

    // Released heat minus sensible heat taken up by the products, kJ/kg fuel
    auto energy_balance = [&](double T) -> double {
        double absorbed = (species_mass.array() * K::cp_species.array()).sum() * (T - K::T_REF);
        return pci - absorbed;
    };

    SolverResult t_ad = solveScalar(energy_balance, K::FLAME_SEED);
    t_ad.value = std::max(t_ad.value, K::T_REF);
    return t_ad;
}

Eigen::VectorXd Combustion::volumetric_fractions(const Eigen::VectorXd& species_mass) {
    Eigen::VectorXd moles = species_mass.array() / K::molar_mass.array();
    double total_vol = moles.sum();
    if (total_vol <= 0.0) {
        return Eigen::VectorXd::Zero(N_SPECIES);
    }
    return moles / total_vol * 100.0;
}

// Stage 1: fuel properties
Combustion::FuelProperties Combustion::fuel_properties(const BiomassInput& input) const {
    const FuelComposition& f = input.fuel;
    FuelProperties fuel;

    double moisture_factor = (100.0 - f.moisture) / 100.0;
    fuel.composition_wet.carbon = f.carbon * moisture_factor;
    fuel.composition_wet.hydrogen = f.hydrogen * moisture_factor;
    fuel.composition_wet.oxygen = f.oxygen * moisture_factor;
    fuel.composition_wet.nitrogen = f.nitrogen * moisture_factor;
    fuel.composition_wet.sulfur = f.sulfur * moisture_factor;
    fuel.composition_wet.ash = f.ash * moisture_factor;
    fuel.composition_wet.water = f.moisture;

    Equations::HeatingValue hv = Equations::dulong_heating_value(
        f.carbon, f.hydrogen, f.oxygen, f.sulfur, f.ash, f.moisture);
    fuel.pcs = hv.pcs;
    fuel.pci_calculated = hv.pci;
    fuel.water_combustion = hv.water_from_combustion;

    fuel.theoretical_air = Equations::theoretical_air_fuel_ratio(
        f.carbon, f.hydrogen, f.oxygen, f.sulfur);
    fuel.real_air = fuel.theoretical_air * (1.0 + input.operation.excess_air / 100.0);

    return fuel;
}

// Stage 2: ambient air
Combustion::AirProperties Combustion::air_properties(const BiomassInput& input) const {
    const EnvironmentalConditions& env = input.environment;
    AirProperties air;

    air.atmospheric_pressure = Equations::pressure_altitude(env.altitude);

    double temp_k = env.dry_bulb_temp + K::KELVIN;
    air.air_density = air.atmospheric_pressure * 1000.0 / (K::R_AIR * temp_k);

    air.absolute_humidity = Equations::absolute_humidity(
        env.relative_humidity, env.dry_bulb_temp, air.atmospheric_pressure);
    air.air_enthalpy = Equations::moist_air_enthalpy(env.dry_bulb_temp, air.absolute_humidity);

    return air;
}

// Stage 3: product masses per kg fuel
Equations::CombustionProducts Combustion::stoichiometry(const BiomassInput& input) const {
    const FuelComposition& f = input.fuel;
    return Equations::combustion_products(f.carbon, f.hydrogen, f.oxygen, f.sulfur,
        f.moisture, f.ash, input.operation.excess_air);
}

// Stage 4
Combustion::MassBalance Combustion::mass_balance(const BiomassInput& input,
    const FuelProperties& fuel, const Equations::CombustionProducts& products) const {
    MassBalance mass;
    mass.flow_rate_kg_s = input.operation.flow_rate * K::TON_TO_KG / K::HOUR_TO_SEC;
    mass.total_gas_mass = products.total_gases;
    mass.mass_flow_gases = mass.flow_rate_kg_s * (1.0 + fuel.real_air);
    return mass;
}

// Stage 5
Combustion::EnergyBalance Combustion::energy_balance(const BiomassInput& input,
    const FuelProperties& fuel, const Equations::CombustionProducts& products,
    const MassBalance& mass) const {
    EnergyBalance energy;

    energy.total_energy = mass.flow_rate_kg_s * input.operation.reported_pci;
    energy.useful_energy = energy.total_energy * input.operation.furnace_efficiency / 100.0;

    energy.adiabatic = adiabatic_flame_temperature(fuel.pci_calculated, products.mass);

    // Useful heat carried by the flue gas above ambient
    double temp_rise = 0.0;
    if (mass.mass_flow_gases > 0.0) {
        temp_rise = energy.useful_energy / (mass.mass_flow_gases * K::CP_GAS_AVG);
    }
    energy.outlet_temp = input.environment.dry_bulb_temp + K::KELVIN + temp_rise;

    energy.real_efficiency = input.operation.furnace_efficiency;
    energy.chimney_losses = energy.total_energy - energy.useful_energy;

    return energy;
}

// Stage 6
Combustion::FluidDynamics Combustion::fluid_dynamics(const BiomassInput& input,
    const AirProperties& air, const Equations::CombustionProducts& products,
    const MassBalance& mass, const EnergyBalance& energy) const {
    FluidDynamics fluid;

    double ambient_k = input.environment.dry_bulb_temp + K::KELVIN;
    double temp_avg_k = (energy.outlet_temp + ambient_k) / 2.0;
    double pressure_pa = air.atmospheric_pressure * 1000.0;

    fluid.gas_density = Equations::gas_density(temp_avg_k, pressure_pa, products.mass);
    fluid.volumetric_flow = fluid.gas_density > 0.0 ? mass.mass_flow_gases / fluid.gas_density : 0.0;

    double diameter_m = input.operation.duct_diameter * K::INCH_TO_M;
    fluid.duct_area = PI * diameter_m * diameter_m / 4.0;
    fluid.gas_velocity = fluid.duct_area > 0.0 ? fluid.volumetric_flow / fluid.duct_area : 0.0;

    fluid.reynolds = Equations::reynolds_number(fluid.gas_velocity, diameter_m,
        fluid.gas_density, K::MU_GAS);
    fluid.friction = Equations::colebrook_friction_factor(fluid.reynolds, diameter_m, K::ROUGHNESS);

    fluid.pressure_drop = diameter_m > 0.0 ?
        Equations::pressure_drop_per_length(fluid.friction.value, fluid.gas_density,
            fluid.gas_velocity, diameter_m) : 0.0;

    return fluid;
}

// Stage 7: three series resistances per metre of duct
Combustion::HeatTransferResult Combustion::heat_transfer(const BiomassInput& input,
    const EnergyBalance& energy) const {
    HeatTransferResult ht;

    double diameter_m = input.operation.duct_diameter * K::INCH_TO_M;
    double radius = diameter_m / 2.0;
    double ambient_c = input.environment.dry_bulb_temp;

    double r_conv_int = 1.0 / (K::H_INTERNAL * PI * diameter_m);
    double r_cond = std::log((radius + K::REFRACTORY_THICKNESS) / radius) /
        (2.0 * PI * K::K_REFRACTORY);
    double r_conv_ext = 1.0 / (K::H_EXTERNAL * PI * (diameter_m + 2.0 * K::REFRACTORY_THICKNESS));

    ht.thermal_resistance = r_conv_int + r_cond + r_conv_ext;
    ht.heat_transfer_coefficient = 1.0 / ht.thermal_resistance;

    double delta_t = energy.outlet_temp - (ambient_c + K::KELVIN);
    ht.heat_loss_per_meter = ht.heat_transfer_coefficient * delta_t;

    ht.external_wall_temp = ambient_c + ht.heat_loss_per_meter * r_conv_ext;
    ht.refractory_gradient = ht.heat_loss_per_meter * r_cond;

    // Against a bare duct losing heat only by external convection
    double bare_loss = K::H_EXTERNAL * PI * diameter_m * delta_t;
    ht.insulation_efficiency = bare_loss != 0.0 ?
        (bare_loss - ht.heat_loss_per_meter) / bare_loss * 100.0 : 0.0;

    return ht;
}

// Stage 8
Combustion::Emissions Combustion::emissions(const FuelProperties& fuel,
    const Equations::CombustionProducts& products) const {
    Emissions em;

    em.co2_emission_factor = 44.0 / 12.0 * fuel.composition_wet.carbon / 100.0;

    double dry_gases = products.mass(CO2) + products.mass(O2) +
        products.mass(N2) + products.mass(SO2);
    em.co2_concentration_dry = dry_gases > 0.0 ? products.mass(CO2) / dry_gases * 100.0 : 0.0;

    em.volumetric_heating_value = fuel.pci_calculated * K::FUEL_BULK_DENSITY;

    return em;
}

CombustionResult Combustion::calculate_all(const BiomassInput& input) const {
    // Order matters: each stage reads the ones before it
    FuelProperties fuel = fuel_properties(input);
    AirProperties air = air_properties(input);
    Equations::CombustionProducts products = stoichiometry(input);
    MassBalance mass = mass_balance(input, fuel, products);
    EnergyBalance energy = energy_balance(input, fuel, products, mass);
    FluidDynamics fluid = fluid_dynamics(input, air, products, mass, energy);
    HeatTransferResult ht = heat_transfer(input, energy);
    Emissions em = emissions(fuel, products);
    Eigen::VectorXd vol = volumetric_fractions(products.mass);

    CombustionResult r;

    r.pcs = fuel.pcs;
    r.pci_calculated = fuel.pci_calculated;
    r.composition_wet = fuel.composition_wet;
    r.water_combustion = fuel.water_combustion;

    r.atmospheric_pressure = air.atmospheric_pressure;
    r.air_density = air.air_density;
    r.absolute_humidity = air.absolute_humidity;
    r.air_enthalpy = air.air_enthalpy;

    r.theoretical_air = fuel.theoretical_air;
    r.real_air = fuel.real_air;
    r.excess_air_percentage = input.operation.excess_air;

    r.co2 = products.mass(CO2);
    r.h2o = products.mass(H2O);
    r.so2 = products.mass(SO2);
    r.o2_excess = products.mass(O2);
    r.n2 = products.mass(N2);
    r.ash = products.ash;
    r.total_gas_mass = mass.total_gas_mass;

    r.co2_fraction_vol = vol(CO2);
    r.h2o_fraction_vol = vol(H2O);
    r.so2_fraction_vol = vol(SO2);
    r.o2_fraction_vol = vol(O2);
    r.n2_fraction_vol = vol(N2);

    r.flow_rate_kg_s = mass.flow_rate_kg_s;
    r.mass_flow_gases = mass.mass_flow_gases;

    r.total_energy_released = energy.total_energy / 1000.0;
    r.useful_energy = energy.useful_energy / 1000.0;
    r.adiabatic_flame_temp = energy.adiabatic.value;
    r.flame_temp_converged = energy.adiabatic.converged;
    r.outlet_gas_temp = energy.outlet_temp;
    r.chimney_losses = energy.chimney_losses / 1000.0;
    r.real_efficiency = energy.real_efficiency;

    r.gas_density = fluid.gas_density;
    r.volumetric_flow = fluid.volumetric_flow;
    r.duct_area = fluid.duct_area;
    r.gas_velocity = fluid.gas_velocity;
    r.reynolds_number = fluid.reynolds;
    r.friction_factor = fluid.friction.value;
    r.friction_converged = fluid.friction.converged;
    r.pressure_drop = fluid.pressure_drop;

    r.thermal_resistance = ht.thermal_resistance;
    r.heat_transfer_coefficient = ht.heat_transfer_coefficient;
    r.heat_loss_per_meter = ht.heat_loss_per_meter;
    r.external_wall_temp = ht.external_wall_temp;
    r.refractory_gradient = ht.refractory_gradient;
    r.insulation_efficiency = ht.insulation_efficiency;

    r.co2_emission_factor = em.co2_emission_factor;
    r.co2_concentration_dry = em.co2_concentration_dry;
    r.volumetric_heating_value = em.volumetric_heating_value;

    return r;
}
