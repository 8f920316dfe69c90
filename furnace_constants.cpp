#include "furnace_constants.hpp"

const Eigen::VectorXd FurnaceConstants::molar_mass = FurnaceConstants::initMolarMass();
const Eigen::VectorXd FurnaceConstants::cp_species = FurnaceConstants::initCpSpecies();

Eigen::VectorXd FurnaceConstants::initMolarMass() {
    Eigen::VectorXd m(N_SPECIES);
    //   CO2     H2O     SO2     O2      N2
    m << 44.01, 18.015, 64.066, 31.999, 28.014;
    return m;
}

Eigen::VectorXd FurnaceConstants::initCpSpecies() {
    Eigen::VectorXd cp(N_SPECIES);
    cp << 0.844, 1.86, 0.64, 0.918, 1.04;
    return cp;
}

BiomassInput FurnaceConstants::reference_input() {
    BiomassInput in;

    // Sugar cane bagasse, dry basis
    in.fuel.carbon = 50.29;
    in.fuel.hydrogen = 5.82;
    in.fuel.oxygen = 42.94;
    in.fuel.nitrogen = 0.22;
    in.fuel.sulfur = 0.08;
    in.fuel.ash = 0.66;
    in.fuel.moisture = 35.09;

    in.environment.altitude = 2640.0;
    in.environment.dry_bulb_temp = 15.0;
    in.environment.relative_humidity = 75.0;

    in.operation.flow_rate = 1.0;
    in.operation.excess_air = 30.0;
    in.operation.furnace_efficiency = 90.0;
    in.operation.reported_pci = 11367.0;
    in.operation.duct_diameter = 30.0;

    return in;
}
