#include "sensitivity_submodel.hpp"
#include "furnace_constants.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <omp.h>

namespace {

const int MULTI_PARAM_POINTS = 15;
const size_t RECOMMENDATION_DEPTH = 3;

std::string format_index(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

} // namespace

Sensitivity::Sensitivity(const Combustion& model) : model(model) {
}

Eigen::VectorXd Sensitivity::sample_values(double base_value, double range_percent, int num_points) {
    if (num_points < 2) {
        throw InputError("num_points must be at least 2");
    }
    double min_val = base_value * (1.0 - range_percent / 100.0);
    double max_val = base_value * (1.0 + range_percent / 100.0);
    return Eigen::VectorXd::LinSpaced(num_points, min_val, max_val);
}

Sensitivity::SweepResult Sensitivity::sweep(const BiomassInput& base, SweepField field,
    const Eigen::VectorXd& values) const {

    const int n = static_cast<int>(values.size());

    SweepResult result;
    result.field = field;
    result.parameter_name = sweep_field_name(field);
    result.values = values;
    result.temperatures = Eigen::VectorXd::Zero(n);
    result.velocities = Eigen::VectorXd::Zero(n);
    result.pressure_drops = Eigen::VectorXd::Zero(n);
    result.efficiencies = Eigen::VectorXd::Zero(n);

    // Each sample owns its input copy and its output slot
#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        BiomassInput sample = with_field(base, field, values(i));
        CombustionResult r = model.calculate_all(sample);

        result.temperatures(i) = r.outlet_gas_temp - FurnaceConstants::KELVIN;
        result.velocities(i) = r.gas_velocity;
        result.pressure_drops(i) = r.pressure_drop;
        result.efficiencies(i) = r.real_efficiency;
    }

    return result;
}

Eigen::VectorXd Sensitivity::gradient(const Eigen::VectorXd& y, const Eigen::VectorXd& x) {
    const Eigen::Index n = y.size();
    Eigen::VectorXd dy = Eigen::VectorXd::Zero(n);
    if (n < 2 || x.size() != n) {
        return dy;
    }

    auto slope = [&](Eigen::Index a, Eigen::Index b) {
        double dx = x(b) - x(a);
        return dx != 0.0 ? (y(b) - y(a)) / dx : 0.0;
    };

    dy(0) = slope(0, 1);
    dy(n - 1) = slope(n - 2, n - 1);

    // Second-order accurate on non-uniform spacing
    for (Eigen::Index i = 1; i < n - 1; ++i) {
        double hd = x(i) - x(i - 1);
        double hs = x(i + 1) - x(i);
        double denom = hs * hd * (hd + hs);
        if (denom == 0.0) {
            dy(i) = 0.0;
            continue;
        }
        dy(i) = (hd * hd * y(i + 1) - hs * hs * y(i - 1) + (hs * hs - hd * hd) * y(i)) / denom;
    }
    return dy;
}

Eigen::VectorXd Sensitivity::relative_sensitivity(double base_x, double base_y,
    const Eigen::VectorXd& dydx) {
    if (base_y == 0.0) {
        return Eigen::VectorXd::Zero(dydx.size());
    }
    return dydx * base_x / base_y * 100.0;
}

Sensitivity::ChannelRange Sensitivity::channel_range(const Eigen::VectorXd& y) {
    ChannelRange range{0.0, 0.0, 0.0};
    if (y.size() == 0) {
        return range;
    }
    range.min = y.minCoeff();
    range.max = y.maxCoeff();
    range.span = range.max - range.min;
    return range;
}

Sensitivity::SensitivityMetrics Sensitivity::calculate_metrics(const SweepResult& sweep) {
    SensitivityMetrics m;
    const Eigen::VectorXd& x = sweep.values;

    m.d_temperature = gradient(sweep.temperatures, x);
    m.d_velocity = gradient(sweep.velocities, x);
    m.d_pressure_drop = gradient(sweep.pressure_drops, x);
    m.d_efficiency = gradient(sweep.efficiencies, x);

    double x0 = x.size() > 0 ? x(0) : 0.0;
    m.rel_temperature = relative_sensitivity(x0,
        sweep.temperatures.size() > 0 ? sweep.temperatures(0) : 0.0, m.d_temperature);
    m.rel_velocity = relative_sensitivity(x0,
        sweep.velocities.size() > 0 ? sweep.velocities(0) : 0.0, m.d_velocity);
    m.rel_efficiency = relative_sensitivity(x0,
        sweep.efficiencies.size() > 0 ? sweep.efficiencies(0) : 0.0, m.d_efficiency);

    m.max_temp_sens = m.rel_temperature.size() > 0 ? m.rel_temperature.cwiseAbs().maxCoeff() : 0.0;
    m.max_vel_sens = m.rel_velocity.size() > 0 ? m.rel_velocity.cwiseAbs().maxCoeff() : 0.0;
    m.max_eff_sens = m.rel_efficiency.size() > 0 ? m.rel_efficiency.cwiseAbs().maxCoeff() : 0.0;

    m.temperature_range = channel_range(sweep.temperatures);
    m.velocity_range = channel_range(sweep.velocities);
    m.pressure_drop_range = channel_range(sweep.pressure_drops);
    m.efficiency_range = channel_range(sweep.efficiencies);

    return m;
}

Sensitivity::SensitivityReport Sensitivity::analyze_parameter(const BiomassInput& base,
    SweepField field, double range_percent, int num_points) const {
    SensitivityReport report;
    report.parameter = sweep_field_name(field);
    report.unit = sweep_field_unit(field);
    report.base_value = field_value(base, field);

    Eigen::VectorXd values = sample_values(report.base_value, range_percent, num_points);
    report.sweep = sweep(base, field, values);
    report.metrics = calculate_metrics(report.sweep);

    return report;
}

double Sensitivity::sensitivity_index(const SensitivityMetrics& metrics) {
    return 0.4 * metrics.max_temp_sens + 0.3 * metrics.max_vel_sens + 0.3 * metrics.max_eff_sens;
}

std::vector<Sensitivity::RankingEntry> Sensitivity::rank_sensitivity(
    const std::vector<SensitivityReport>& reports) {
    std::vector<RankingEntry> ranking;
    ranking.reserve(reports.size());

    for (const SensitivityReport& report : reports) {
        RankingEntry entry;
        entry.field = report.sweep.field;
        entry.parameter = report.parameter;
        entry.sensitivity_index = sensitivity_index(report.metrics);
        entry.max_temp_sens = report.metrics.max_temp_sens;
        entry.max_vel_sens = report.metrics.max_vel_sens;
        entry.max_eff_sens = report.metrics.max_eff_sens;
        ranking.push_back(entry);
    }

    std::stable_sort(ranking.begin(), ranking.end(),
        [](const RankingEntry& a, const RankingEntry& b) {
            return a.sensitivity_index > b.sensitivity_index;
        });

    return ranking;
}

std::vector<std::string> Sensitivity::generate_recommendations(const std::vector<RankingEntry>& ranking) {
    std::vector<std::string> recommendations;
    const size_t depth = std::min(RECOMMENDATION_DEPTH, ranking.size());

    for (size_t i = 0; i < depth; ++i) {
        const RankingEntry& item = ranking[i];
        const double sens = item.sensitivity_index;
        const std::string pct = format_index(sens) + "%";

        switch (item.field) {
        case SweepField::ExcessAir:
            if (sens > 20.0) {
                recommendations.push_back("Excess air is HIGHLY sensitive (" + pct +
                    "). Consider precise control of the air-fuel ratio.");
            }
            else if (sens > 10.0) {
                recommendations.push_back("Excess air is moderately sensitive (" + pct +
                    "). Keep the process under statistical control.");
            }
            break;
        case SweepField::FurnaceEfficiency:
            if (sens > 15.0) {
                recommendations.push_back("Furnace efficiency has a significant impact (" + pct +
                    "). Schedule regular preventive maintenance.");
            }
            break;
        case SweepField::Moisture:
            if (sens > 25.0) {
                recommendations.push_back("Fuel moisture is CRITICAL (" + pct +
                    "). Install a drying stage or fuel quality control.");
            }
            break;
        case SweepField::FlowRate:
            if (sens > 30.0) {
                recommendations.push_back("Biomass flow is very sensitive (" + pct +
                    "). Install calibrated flow meters with PID control.");
            }
            break;
        default:
            break;
        }
    }

    if (recommendations.empty()) {
        recommendations.push_back(
            "The system shows good stability. Keep current operating conditions.");
    }
    return recommendations;
}

Sensitivity::MultiParameterReport Sensitivity::multi_parameter_analysis(const BiomassInput& base,
    const std::vector<SweepField>& fields, double range_percent) const {
    MultiParameterReport report;
    report.individual.reserve(fields.size());

    for (SweepField field : fields) {
        report.individual.push_back(analyze_parameter(base, field, range_percent, MULTI_PARAM_POINTS));
    }

    report.ranking = rank_sensitivity(report.individual);
    report.recommendations = generate_recommendations(report.ranking);
    return report;
}

void Sensitivity::write_csv(std::ostream& out, const SweepResult& sweep) {
    out << "parameter,value,temperature_c,velocity,pressure_drop,efficiency\n";
    out << std::fixed << std::setprecision(6);
    for (Eigen::Index i = 0; i < sweep.values.size(); ++i) {
        out << sweep.parameter_name << ','
            << sweep.values(i) << ','
            << sweep.temperatures(i) << ','
            << sweep.velocities(i) << ','
            << sweep.pressure_drops(i) << ','
            << sweep.efficiencies(i) << '\n';
    }
}
