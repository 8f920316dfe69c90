#ifndef BIOMASS_INPUT_HPP
#define BIOMASS_INPUT_HPP

#include <stdexcept>
#include <string>
#include <vector>

// Rejected input at the calculation boundary
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

// Elemental composition, dry basis (%), moisture on total basis (%)
struct FuelComposition {
    double carbon = 0.0;
    double hydrogen = 0.0;
    double oxygen = 0.0;
    double nitrogen = 0.0;
    double sulfur = 0.0;
    double ash = 0.0;
    double moisture = 0.0;

    double dry_sum() const {
        return carbon + hydrogen + oxygen + nitrogen + sulfur + ash;
    }
};

struct EnvironmentalConditions {
    double altitude = 0.0;           // m
    double dry_bulb_temp = 15.0;     // °C
    double relative_humidity = 0.0;  // %
};

struct OperatingParameters {
    double flow_rate = 0.0;          // t/h
    double excess_air = 0.0;         // %
    double furnace_efficiency = 0.0; // %
    double reported_pci = 0.0;       // kJ/kg
    double duct_diameter = 0.0;      // in
};

struct BiomassInput {
    FuelComposition fuel;
    EnvironmentalConditions environment;
    OperatingParameters operation;
};

// Fields that sensitivity sweeps and the optimizer may vary
enum class SweepField {
    FlowRate,
    ExcessAir,
    FurnaceEfficiency,
    Moisture,
    Carbon,
    Hydrogen,
    Oxygen,
    DuctDiameter,
    ReportedPci
};

SweepField sweep_field_from_name(const std::string& name);
std::string sweep_field_name(SweepField field);
std::string sweep_field_unit(SweepField field);
std::vector<SweepField> all_sweep_fields();

double field_value(const BiomassInput& input, SweepField field);

// Copy of input with one field replaced; the source is never modified
BiomassInput with_field(const BiomassInput& input, SweepField field, double value);

// Throws InputError describing the first violated rule
void validate_input(const BiomassInput& input);

#endif // BIOMASS_INPUT_HPP
