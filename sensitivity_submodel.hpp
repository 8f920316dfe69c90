#ifndef SENSITIVITY_SUBMODEL_HPP
#define SENSITIVITY_SUBMODEL_HPP

#include <Eigen/Dense>
#include <ostream>
#include <string>
#include <vector>
#include "biomass_input.hpp"
#include "combustion_submodel.hpp"

class Sensitivity {
public:
    explicit Sensitivity(const Combustion& model = Combustion());

    // Output channels sampled along one input field, all in sample order
    struct SweepResult {
        SweepField field;
        std::string parameter_name;
        Eigen::VectorXd values;
        Eigen::VectorXd temperatures;    // outlet gas, °C
        Eigen::VectorXd velocities;      // m/s
        Eigen::VectorXd pressure_drops;  // Pa/m
        Eigen::VectorXd efficiencies;    // %
    };

    struct ChannelRange {
        double min;
        double max;
        double span;
    };

    struct SensitivityMetrics {
        // d(output)/d(parameter) at each sample
        Eigen::VectorXd d_temperature;
        Eigen::VectorXd d_velocity;
        Eigen::VectorXd d_pressure_drop;
        Eigen::VectorXd d_efficiency;

        // Relative sensitivity, %
        Eigen::VectorXd rel_temperature;
        Eigen::VectorXd rel_velocity;
        Eigen::VectorXd rel_efficiency;

        double max_temp_sens;
        double max_vel_sens;
        double max_eff_sens;

        ChannelRange temperature_range;
        ChannelRange velocity_range;
        ChannelRange pressure_drop_range;
        ChannelRange efficiency_range;
    };

    struct SensitivityReport {
        std::string parameter;
        std::string unit;
        double base_value;
        SweepResult sweep;
        SensitivityMetrics metrics;
    };

    struct RankingEntry {
        SweepField field;
        std::string parameter;
        double sensitivity_index;
        double max_temp_sens;
        double max_vel_sens;
        double max_eff_sens;
    };

    struct MultiParameterReport {
        std::vector<SensitivityReport> individual;
        std::vector<RankingEntry> ranking;
        std::vector<std::string> recommendations;
    };

    // Evaluates the pipeline once per value; base is never modified
    SweepResult sweep(const BiomassInput& base, SweepField field,
        const Eigen::VectorXd& values) const;

    // num_points values evenly spaced over base·(1 ± range/100)
    static Eigen::VectorXd sample_values(double base_value, double range_percent, int num_points);

    SensitivityReport analyze_parameter(const BiomassInput& base, SweepField field,
        double range_percent = 50.0, int num_points = 20) const;

    MultiParameterReport multi_parameter_analysis(const BiomassInput& base,
        const std::vector<SweepField>& fields, double range_percent = 30.0) const;

    static SensitivityMetrics calculate_metrics(const SweepResult& sweep);

    // Central differences inside, one-sided at the ends
    static Eigen::VectorXd gradient(const Eigen::VectorXd& y, const Eigen::VectorXd& x);

    static Eigen::VectorXd relative_sensitivity(double base_x, double base_y,
        const Eigen::VectorXd& dydx);

    static double sensitivity_index(const SensitivityMetrics& metrics);

    static std::vector<RankingEntry> rank_sensitivity(const std::vector<SensitivityReport>& reports);

    static std::vector<std::string> generate_recommendations(const std::vector<RankingEntry>& ranking);

    // parameter,value,temperature_c,velocity,pressure_drop,efficiency
    static void write_csv(std::ostream& out, const SweepResult& sweep);

private:
    Combustion model;

    static ChannelRange channel_range(const Eigen::VectorXd& y);
};

#endif // SENSITIVITY_SUBMODEL_HPP
