#ifndef EQUATIONS_HPP
#define EQUATIONS_HPP

#include <Eigen/Dense>

// Outcome of an iterative solve; the last iterate is kept when not converged
struct SolverResult {
    double value = 0.0;
    int iterations = 0;
    bool converged = false;
};

class Equations {
public:
    // Atmospheric pressure at altitude (m), kPa
    static double pressure_altitude(double altitude);

    // Antoine equation for water, T in °C, returns mmHg. No range check.
    static double saturated_vapor_pressure(double temp_celsius);

    // kg water / kg dry air; P_atm in kPa
    static double absolute_humidity(double relative_humidity, double dry_bulb_temp,
        double atmospheric_pressure);

    // kJ/kg dry air
    static double moist_air_enthalpy(double temp_celsius, double absolute_humidity);

    struct HeatingValue {
        double pcs;                    // kJ/kg
        double pci;                    // kJ/kg
        double water_from_combustion;  // 9H + moisture, %
    };

    // Dulong correlation. C, H, O, S and ash are rescaled to 100 when they
    // do not already sum to it.
    static HeatingValue dulong_heating_value(double carbon, double hydrogen, double oxygen,
        double sulfur, double ash, double moisture = 0.0);

    // kg air / kg fuel
    static double theoretical_air_fuel_ratio(double carbon, double hydrogen,
        double oxygen, double sulfur);

    struct CombustionProducts {
        Eigen::VectorXd mass;  // kg / kg fuel, indexed by Species
        double ash;
        double air_theoretical;
        double air_real;
        double total_gases;
    };

    // Dry-basis composition in, wet-basis product masses out
    static CombustionProducts combustion_products(double carbon, double hydrogen,
        double oxygen, double sulfur, double moisture, double ash,
        double excess_air_percent);

    // Ideal gas mixture, kg/m³. Zero when the mixture holds no moles.
    static double gas_density(double temperature_k, double pressure_pa,
        const Eigen::VectorXd& species_mass);

    static double reynolds_number(double velocity, double diameter, double density,
        double viscosity = 1.8e-5);

    // Darcy friction factor; 64/Re below Re 2300, Colebrook-White above
    static SolverResult colebrook_friction_factor(double Re, double diameter,
        double roughness = 0.00015, int max_iter = 10, double tol = 1e-6);

    // Darcy-Weisbach, Pa/m
    static double pressure_drop_per_length(double friction_factor, double density,
        double velocity, double diameter);
};

#endif // EQUATIONS_HPP
