#ifndef FURNACE_CONSTANTS_HPP
#define FURNACE_CONSTANTS_HPP

#include <Eigen/Dense>
#include "biomass_input.hpp"

// Product gas species order used by every species vector in the model
enum Species { CO2 = 0, H2O = 1, SO2 = 2, O2 = 3, N2 = 4, N_SPECIES = 5 };

class FurnaceConstants {
public:
    // Universal constants
    static constexpr double R_UNIVERSAL = 8.314;   // J/(mol·K)
    static constexpr double R_AIR = 287.05;        // J/(kg·K), dry air
    static constexpr double G = 9.81;              // m/s²
    static constexpr double T_REF = 298.0;         // K, reference for sensible heat
    static constexpr double KELVIN = 273.15;

    // Standard atmosphere
    static constexpr double P0_KPA = 101.325;
    static constexpr double LAPSE_RATE = 0.0065;   // K/m
    static constexpr double T0_STD = 288.15;       // K
    static constexpr double M_AIR = 0.02896;       // kg/mol
    static constexpr double TROPOPAUSE = 11000.0;  // m
    static constexpr double SCALE_HEIGHT = 8500.0; // m
    static constexpr double RHO_AIR_SEA_LEVEL = 1.225; // kg/m³
    static constexpr double O2_VOLUME_FRACTION_SEA_LEVEL = 0.21;

    // Antoine coefficients for water, P in mmHg, T in °C
    static constexpr double ANTOINE_A = 8.07131;
    static constexpr double ANTOINE_B = 1730.63;
    static constexpr double ANTOINE_C = 233.426;

    static constexpr double HV_WATER = 2442.0;     // kJ/kg at 25 °C
    static constexpr double O2_MASS_FRACTION_AIR = 0.232;
    static constexpr double N2_MASS_FRACTION_AIR = 0.768;

    // Unit conversions
    static constexpr double TON_TO_KG = 1000.0;
    static constexpr double HOUR_TO_SEC = 3600.0;
    static constexpr double INCH_TO_M = 0.0254;
    static constexpr double MMHG_TO_KPA = 0.133322;
    static constexpr double KPA_TO_MMHG = 7.50062;

    // Flue gas and duct
    static constexpr double MU_GAS = 1.8e-5;           // Pa·s
    static constexpr double CP_GAS_AVG = 1.1;          // kJ/(kg·K)
    static constexpr double ROUGHNESS = 0.00015;       // m
    static constexpr double H_INTERNAL = 50.0;         // W/(m²·K)
    static constexpr double H_EXTERNAL = 10.0;         // W/(m²·K)
    static constexpr double K_REFRACTORY = 0.5;        // W/(m·K)
    static constexpr double REFRACTORY_THICKNESS = 0.15; // m
    static constexpr double FUEL_BULK_DENSITY = 1200.0;  // kg/m³, bagasse
    static constexpr double LAMINAR_RE = 2300.0;

    // Flame temperature solver
    static constexpr double FLAME_SEED = 2000.0;       // K

    // Optimizer targets
    static constexpr double TARGET_OUTLET_TEMP = 1273.0; // K
    static constexpr double TARGET_VELOCITY = 15.0;      // m/s
    static constexpr int OPTIMIZER_POINTS = 100;

    // Species tables, indexed by Species
    static const Eigen::VectorXd molar_mass;     // g/mol
    static const Eigen::VectorXd cp_species;     // kJ/(kg·K) at 298 K

    // Reference bagasse case
    static BiomassInput reference_input();

private:
    static Eigen::VectorXd initMolarMass();
    static Eigen::VectorXd initCpSpecies();
};

#endif // FURNACE_CONSTANTS_HPP
