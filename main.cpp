#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>
#include <vector>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <omp.h>

#include "biomass_input.hpp"
#include "furnace_constants.hpp"
#include "combustion_submodel.hpp"
#include "sensitivity_submodel.hpp"
#include "optimizer_submodel.hpp"
#include "atmosphere_submodel.hpp"

using namespace std;

namespace {

string toLower(string v) {
    transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(tolower(c));
    });
    return v;
}

void printUsage() {
    cout << "furnace_calc usage:\n"
         << "  furnace_calc [--mode calculate] [--set field=value ...]\n"
         << "  furnace_calc --mode sensitivity --param <field> [--range %] [--points n] [--out file]\n"
         << "  furnace_calc --mode multi --params f1,f2,... [--range %]\n"
         << "  furnace_calc --mode optimize --param <field> --objective <efficiency|temperature|velocity>\n"
         << "               [--min v] [--max v] [--range %] [--max-velocity v] [--min-efficiency v] [--max-temp v]\n"
         << "  furnace_calc --mode atmosphere [--set altitude=v --set dry_bulb_temp=v --set relative_humidity=v]\n"
         << "Sweepable fields: ";
    bool first = true;
    for (SweepField f : all_sweep_fields()) {
        cout << (first ? "" : ", ") << sweep_field_name(f);
        first = false;
    }
    cout << "\n";
}

// Fields outside the sweep list are only settable from the command line
void applySetting(BiomassInput& input, const string& setting) {
    size_t eq = setting.find('=');
    if (eq == string::npos) {
        throw InputError("--set expects field=value, got '" + setting + "'");
    }
    string name = setting.substr(0, eq);
    double value = stod(setting.substr(eq + 1));

    if (name == "nitrogen") {
        input.fuel.nitrogen = value;
    } else if (name == "sulfur") {
        input.fuel.sulfur = value;
    } else if (name == "ash") {
        input.fuel.ash = value;
    } else if (name == "altitude") {
        input.environment.altitude = value;
    } else if (name == "dry_bulb_temp") {
        input.environment.dry_bulb_temp = value;
    } else if (name == "relative_humidity") {
        input.environment.relative_humidity = value;
    } else {
        input = with_field(input, sweep_field_from_name(name), value);
    }
}

vector<SweepField> parseFieldList(const string& list) {
    vector<SweepField> fields;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        string item = list.substr(start, comma == string::npos ? string::npos : comma - start);
        if (!item.empty()) {
            fields.push_back(sweep_field_from_name(item));
        }
        if (comma == string::npos) {
            break;
        }
        start = comma + 1;
    }
    return fields;
}

void warnConvergence(const CombustionResult& r) {
    if (!r.flame_temp_converged) {
        cerr << "Warning: adiabatic flame temperature did not converge, last iterate "
             << r.adiabatic_flame_temp << " K" << endl;
    }
    if (!r.friction_converged) {
        cerr << "Warning: Colebrook friction factor did not converge, last iterate "
             << r.friction_factor << endl;
    }
}

void printResult(const CombustionResult& r) {
    cout << fixed << setprecision(3);

    cout << "\n--- Fuel ---\n"
         << "PCS: " << r.pcs << " kJ/kg\n"
         << "PCI (calculated): " << r.pci_calculated << " kJ/kg\n"
         << "Wet basis C/H/O/N/S/ash/water: "
         << r.composition_wet.carbon << " / " << r.composition_wet.hydrogen << " / "
         << r.composition_wet.oxygen << " / " << r.composition_wet.nitrogen << " / "
         << r.composition_wet.sulfur << " / " << r.composition_wet.ash << " / "
         << r.composition_wet.water << " %\n"
         << "Combustion water: " << r.water_combustion << " %\n";

    cout << "\n--- Air ---\n"
         << "Atmospheric pressure: " << r.atmospheric_pressure << " kPa\n"
         << "Air density: " << r.air_density << " kg/m3\n"
         << "Absolute humidity: " << r.absolute_humidity << " kg/kg dry air\n"
         << "Moist air enthalpy: " << r.air_enthalpy << " kJ/kg dry air\n";

    cout << "\n--- Stoichiometry (kg/kg fuel) ---\n"
         << "Theoretical air: " << r.theoretical_air << "\n"
         << "Real air: " << r.real_air << " (excess " << r.excess_air_percentage << " %)\n"
         << "CO2 " << r.co2 << "  H2O " << r.h2o << "  SO2 " << r.so2
         << "  O2 " << r.o2_excess << "  N2 " << r.n2 << "  ash " << r.ash << "\n"
         << "Total gases: " << r.total_gas_mass << "\n"
         << "Volume % CO2 " << r.co2_fraction_vol << "  H2O " << r.h2o_fraction_vol
         << "  SO2 " << r.so2_fraction_vol << "  O2 " << r.o2_fraction_vol
         << "  N2 " << r.n2_fraction_vol << "\n";

    cout << "\n--- Mass and energy ---\n"
         << "Fuel flow: " << r.flow_rate_kg_s << " kg/s\n"
         << "Gas mass flow: " << r.mass_flow_gases << " kg/s\n"
         << "Energy released: " << r.total_energy_released << " MW\n"
         << "Useful energy: " << r.useful_energy << " MW\n"
         << "Chimney losses: " << r.chimney_losses << " MW\n"
         << "Adiabatic flame temperature: " << r.adiabatic_flame_temp << " K\n"
         << "Outlet gas temperature: " << r.outlet_gas_temp << " K\n"
         << "Real efficiency: " << r.real_efficiency << " %\n";

    cout << "\n--- Duct flow ---\n"
         << "Gas density: " << r.gas_density << " kg/m3\n"
         << "Volumetric flow: " << r.volumetric_flow << " m3/s\n"
         << "Duct area: " << r.duct_area << " m2\n"
         << "Velocity: " << r.gas_velocity << " m/s\n"
         << "Reynolds: " << r.reynolds_number << "\n"
         << "Friction factor: " << r.friction_factor << "\n"
         << "Pressure drop: " << r.pressure_drop << " Pa/m\n";

    cout << "\n--- Heat transfer (per metre) ---\n"
         << "Thermal resistance: " << r.thermal_resistance << " K.m/W\n"
         << "U: " << r.heat_transfer_coefficient << " W/(m.K)\n"
         << "Heat loss: " << r.heat_loss_per_meter << " W/m\n"
         << "External wall temperature: " << r.external_wall_temp << " C\n"
         << "Refractory gradient: " << r.refractory_gradient << " K\n"
         << "Insulation efficiency: " << r.insulation_efficiency << " %\n";

    cout << "\n--- Emissions ---\n"
         << "CO2 factor: " << r.co2_emission_factor << " kg/kg fuel\n"
         << "CO2 dry: " << r.co2_concentration_dry << " %\n"
         << "Volumetric heating value: " << r.volumetric_heating_value << " kJ/m3\n";
}

void printAtmosphere(const AtmosphericConditions& c) {
    cout << fixed << setprecision(3)
         << "Altitude: " << c.altitude << " m\n"
         << "Temperature: " << c.temperature << " C\n"
         << "Relative humidity: " << c.relative_humidity << " %\n"
         << "Pressure: " << c.pressure << " kPa (" << c.pressure * FurnaceConstants::KPA_TO_MMHG << " mmHg)\n"
         << "Air density: " << c.air_density << " kg/m3 (" << c.density_vs_sea_level << " % of sea level)\n"
         << "Absolute humidity: " << c.absolute_humidity << " kg/kg dry air\n"
         << "Air enthalpy: " << c.air_enthalpy << " kJ/kg dry air\n"
         << "Saturation vapour pressure: " << c.vapor_pressure << " mmHg\n"
         << "Oxygen fraction: " << c.oxygen_fraction * 100.0 << " % (" << c.oxygen_vs_sea_level << " % of sea level)\n"
         << "Altitude correction factor: " << Atmosphere::altitude_correction_factor(c.altitude) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    string mode = "calculate";
    string param;
    string params;
    string objective = "efficiency";
    string out;
    double range = 0.0;
    bool range_set = false;
    int points = 20;
    vector<string> settings;
    Optimizer::Constraints constraints;

    try {
        for (int i = 1; i < argc; ++i) {
            string arg = argv[i];
            if (arg == "--mode" && i + 1 < argc) {
                mode = toLower(argv[++i]);
            } else if (arg == "--set" && i + 1 < argc) {
                settings.push_back(argv[++i]);
            } else if (arg == "--param" && i + 1 < argc) {
                param = argv[++i];
            } else if (arg == "--params" && i + 1 < argc) {
                params = argv[++i];
            } else if (arg == "--range" && i + 1 < argc) {
                range = stod(argv[++i]);
                range_set = true;
            } else if (arg == "--points" && i + 1 < argc) {
                points = stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--objective" && i + 1 < argc) {
                objective = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                constraints.min = stod(argv[++i]);
            } else if (arg == "--max" && i + 1 < argc) {
                constraints.max = stod(argv[++i]);
            } else if (arg == "--max-velocity" && i + 1 < argc) {
                constraints.max_velocity = stod(argv[++i]);
            } else if (arg == "--min-efficiency" && i + 1 < argc) {
                constraints.min_efficiency = stod(argv[++i]);
            } else if (arg == "--max-temp" && i + 1 < argc) {
                constraints.max_temp = stod(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }

        BiomassInput input = FurnaceConstants::reference_input();
        for (const string& s : settings) {
            applySetting(input, s);
        }

        if (mode == "atmosphere") {
            const EnvironmentalConditions& env = input.environment;
            AtmosphericConditions c = Atmosphere::custom_conditions(
                env.altitude, env.dry_bulb_temp, env.relative_humidity);
            printAtmosphere(c);

            Atmosphere::Validation v = Atmosphere::validate_conditions(c);
            for (const string& e : v.errors) {
                cerr << "Error: " << e << endl;
            }
            for (const string& w : v.warnings) {
                cerr << "Warning: " << w << endl;
            }
            for (const string& a : Atmosphere::combustion_advice(c)) {
                cout << "- " << a << "\n";
            }

            AtmosphericConditions sea = Atmosphere::custom_conditions(0.0, env.dry_bulb_temp, env.relative_humidity);
            Atmosphere::Comparison cmp = Atmosphere::compare_conditions(sea, c);
            cout << "Against sea level: air density " << cmp.air_density.percent_change
                 << " %, risk " << cmp.overall_risk << "\n";
            for (const Atmosphere::Impact& im : cmp.impacts) {
                cout << "  " << im.factor << ": " << im.description << " -> " << im.recommendation << "\n";
            }
            return v.is_valid ? 0 : 1;
        }

        validate_input(input);

        auto t0 = chrono::steady_clock::now();
        Combustion model;

        if (mode == "calculate") {
            CombustionResult r = model.calculate_all(input);
            warnConvergence(r);
            printResult(r);
        } else if (mode == "sensitivity") {
            if (param.empty()) {
                printUsage();
                return 1;
            }
            Sensitivity analyzer(model);
            Sensitivity::SensitivityReport rep = analyzer.analyze_parameter(
                input, sweep_field_from_name(param), range_set ? range : 50.0, points);

            const Sensitivity::SensitivityMetrics& m = rep.metrics;
            cout << fixed << setprecision(3)
                 << "Parameter: " << rep.parameter << " (base " << rep.base_value << " " << rep.unit << ")\n"
                 << "Temperature range: " << m.temperature_range.min << " - " << m.temperature_range.max << " C\n"
                 << "Velocity range: " << m.velocity_range.min << " - " << m.velocity_range.max << " m/s\n"
                 << "Pressure drop range: " << m.pressure_drop_range.min << " - " << m.pressure_drop_range.max << " Pa/m\n"
                 << "Efficiency range: " << m.efficiency_range.min << " - " << m.efficiency_range.max << " %\n"
                 << "Max relative sensitivity T/v/eff: " << m.max_temp_sens << " / "
                 << m.max_vel_sens << " / " << m.max_eff_sens << " %\n";

            if (!out.empty()) {
                ofstream file(out);
                if (!file.is_open()) {
                    cerr << "Error: cannot open " << out << endl;
                    return 1;
                }
                Sensitivity::write_csv(file, rep.sweep);
                cout << "Wrote sensitivity sweep to: " << out << "\n";
            }
        } else if (mode == "multi") {
            vector<SweepField> fields = params.empty() ? all_sweep_fields() : parseFieldList(params);
            Sensitivity analyzer(model);
            Sensitivity::MultiParameterReport rep = analyzer.multi_parameter_analysis(
                input, fields, range_set ? range : 30.0);

            cout << fixed << setprecision(2) << "Ranking:\n";
            for (size_t k = 0; k < rep.ranking.size(); ++k) {
                const Sensitivity::RankingEntry& e = rep.ranking[k];
                cout << "  " << k + 1 << ". " << e.parameter << "  index " << e.sensitivity_index
                     << "  (T " << e.max_temp_sens << ", v " << e.max_vel_sens
                     << ", eff " << e.max_eff_sens << ")\n";
            }
            cout << "Recommendations:\n";
            for (const string& rec : rep.recommendations) {
                cout << "  - " << rec << "\n";
            }
        } else if (mode == "optimize") {
            if (param.empty()) {
                printUsage();
                return 1;
            }
            if (range_set) {
                constraints.range = range;
            }
            Optimizer opt(model);
            Optimizer::Outcome o = opt.optimize(input, sweep_field_from_name(param),
                objective_from_name(objective), constraints);

            cout << fixed << setprecision(3)
                 << "Parameter: " << o.parameter << ", objective: " << objective_name(o.objective) << "\n"
                 << "Original value: " << o.original_value << "\n";
            if (!o.feasible) {
                cerr << "Warning: no sampled value satisfies the constraints, keeping the original value" << endl;
            } else {
                cout << "Optimal value: " << o.optimal_value << "\n"
                     << "Score: " << o.best_score << " (base " << o.base_score
                     << ", improvement " << o.improvement << ")\n"
                     << "Outlet temperature: " << o.optimal_result.outlet_gas_temp << " K\n"
                     << "Velocity: " << o.optimal_result.gas_velocity << " m/s\n"
                     << "Efficiency: " << o.optimal_result.real_efficiency << " %\n";
            }
            warnConvergence(o.optimal_result);
        } else {
            cout << "Unknown mode: " << mode << "\n";
            printUsage();
            return 1;
        }

        auto t1 = chrono::steady_clock::now();
        cout << "Elapsed: " << chrono::duration<double, milli>(t1 - t0).count()
             << " ms on " << omp_get_max_threads() << " threads" << endl;
    } catch (const InputError& e) {
        cerr << "Input error: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
