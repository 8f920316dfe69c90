#include "biomass_input.hpp"
#include <cmath>
#include <sstream>

namespace {

const double COMPOSITION_TOLERANCE = 0.5;

void require_range(const char* name, double value, double lo, double hi) {
    if (!(value >= lo && value <= hi)) {
        std::ostringstream msg;
        msg << name << " must be between " << lo << " and " << hi
            << " (got " << value << ")";
        throw InputError(msg.str());
    }
}

void require_positive(const char* name, double value) {
    if (!(value > 0.0)) {
        std::ostringstream msg;
        msg << name << " must be greater than 0 (got " << value << ")";
        throw InputError(msg.str());
    }
}

} // namespace

std::vector<SweepField> all_sweep_fields() {
    return {
        SweepField::FlowRate, SweepField::ExcessAir, SweepField::FurnaceEfficiency,
        SweepField::Moisture, SweepField::Carbon, SweepField::Hydrogen,
        SweepField::Oxygen, SweepField::DuctDiameter, SweepField::ReportedPci
    };
}

std::string sweep_field_name(SweepField field) {
    switch (field) {
    case SweepField::FlowRate:          return "flow_rate";
    case SweepField::ExcessAir:         return "excess_air";
    case SweepField::FurnaceEfficiency: return "furnace_efficiency";
    case SweepField::Moisture:          return "moisture";
    case SweepField::Carbon:            return "carbon";
    case SweepField::Hydrogen:          return "hydrogen";
    case SweepField::Oxygen:            return "oxygen";
    case SweepField::DuctDiameter:      return "duct_diameter";
    case SweepField::ReportedPci:       return "reported_PCI";
    }
    throw InputError("unhandled sweep field");
}

std::string sweep_field_unit(SweepField field) {
    switch (field) {
    case SweepField::FlowRate:          return "t/h";
    case SweepField::ReportedPci:       return "kJ/kg";
    case SweepField::DuctDiameter:      return "in";
    case SweepField::ExcessAir:
    case SweepField::FurnaceEfficiency:
    case SweepField::Moisture:
    case SweepField::Carbon:
    case SweepField::Hydrogen:
    case SweepField::Oxygen:            return "%";
    }
    throw InputError("unhandled sweep field");
}

SweepField sweep_field_from_name(const std::string& name) {
    for (SweepField f : all_sweep_fields()) {
        if (sweep_field_name(f) == name) {
            return f;
        }
    }
    // Accept the lower-case spelling of reported_PCI
    if (name == "reported_pci") {
        return SweepField::ReportedPci;
    }

    std::ostringstream msg;
    msg << "Invalid parameter '" << name << "'. Options: ";
    bool first = true;
    for (SweepField f : all_sweep_fields()) {
        msg << (first ? "" : ", ") << sweep_field_name(f);
        first = false;
    }
    throw InputError(msg.str());
}

double field_value(const BiomassInput& input, SweepField field) {
    switch (field) {
    case SweepField::FlowRate:          return input.operation.flow_rate;
    case SweepField::ExcessAir:         return input.operation.excess_air;
    case SweepField::FurnaceEfficiency: return input.operation.furnace_efficiency;
    case SweepField::Moisture:          return input.fuel.moisture;
    case SweepField::Carbon:            return input.fuel.carbon;
    case SweepField::Hydrogen:          return input.fuel.hydrogen;
    case SweepField::Oxygen:            return input.fuel.oxygen;
    case SweepField::DuctDiameter:      return input.operation.duct_diameter;
    case SweepField::ReportedPci:       return input.operation.reported_pci;
    }
    throw InputError("unhandled sweep field");
}

BiomassInput with_field(const BiomassInput& input, SweepField field, double value) {
    BiomassInput out = input;
    switch (field) {
    case SweepField::FlowRate:          out.operation.flow_rate = value; break;
    case SweepField::ExcessAir:         out.operation.excess_air = value; break;
    case SweepField::FurnaceEfficiency: out.operation.furnace_efficiency = value; break;
    case SweepField::Moisture:          out.fuel.moisture = value; break;
    case SweepField::Carbon:            out.fuel.carbon = value; break;
    case SweepField::Hydrogen:          out.fuel.hydrogen = value; break;
    case SweepField::Oxygen:            out.fuel.oxygen = value; break;
    case SweepField::DuctDiameter:      out.operation.duct_diameter = value; break;
    case SweepField::ReportedPci:       out.operation.reported_pci = value; break;
    }
    return out;
}

void validate_input(const BiomassInput& input) {
    const FuelComposition& f = input.fuel;

    require_range("carbon", f.carbon, 0.0, 100.0);
    require_range("hydrogen", f.hydrogen, 0.0, 100.0);
    require_range("oxygen", f.oxygen, 0.0, 100.0);
    require_range("nitrogen", f.nitrogen, 0.0, 100.0);
    require_range("sulfur", f.sulfur, 0.0, 100.0);
    require_range("ash", f.ash, 0.0, 100.0);

    const double sum = f.dry_sum();
    if (std::abs(sum - 100.0) > COMPOSITION_TOLERANCE) {
        std::ostringstream msg;
        msg << "Dry-basis composition must sum to 100%. Current: " << sum << "%";
        throw InputError(msg.str());
    }

    require_range("moisture", f.moisture, 0.0, 60.0);
    require_range("furnace_efficiency", input.operation.furnace_efficiency, 10.0, 100.0);
    require_positive("flow_rate", input.operation.flow_rate);
    require_positive("reported_PCI", input.operation.reported_pci);
    require_positive("duct_diameter", input.operation.duct_diameter);

    if (input.operation.excess_air < 0.0) {
        std::ostringstream msg;
        msg << "excess_air cannot be negative (got " << input.operation.excess_air << ")";
        throw InputError(msg.str());
    }
}
