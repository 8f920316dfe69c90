#ifndef OPTIMIZER_SUBMODEL_HPP
#define OPTIMIZER_SUBMODEL_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>
#include "biomass_input.hpp"
#include "combustion_submodel.hpp"

enum class Objective {
    Efficiency,   // maximise real efficiency
    Temperature,  // outlet gas temperature closest to target
    Velocity      // duct velocity closest to target
};

Objective objective_from_name(const std::string& name);
std::string objective_name(Objective objective);

class Optimizer {
public:
    explicit Optimizer(const Combustion& model = Combustion());

    struct Constraints {
        std::optional<double> min;             // search range lower bound
        std::optional<double> max;             // search range upper bound
        double range = 50.0;                   // ± % around base when min/max absent
        std::optional<double> max_velocity;    // m/s
        std::optional<double> min_efficiency;  // %
        std::optional<double> max_temp;        // K
    };

    struct Outcome {
        SweepField field;
        std::string parameter;
        Objective objective;
        bool feasible;
        double original_value;
        double optimal_value;
        double best_score;      // -inf when infeasible
        double base_score;
        double improvement;     // best_score - base_score, 0 when infeasible
        CombustionResult optimal_result;
        CombustionResult base_result;
    };

    Outcome optimize(const BiomassInput& base, SweepField field, Objective objective) const;
    Outcome optimize(const BiomassInput& base, SweepField field, Objective objective,
        const Constraints& constraints) const;

    // Candidate values after min/max/range resolution
    static Eigen::VectorXd search_grid(double base_value, const Constraints& constraints);

    // Higher is better under every objective
    static double score(const CombustionResult& result, Objective objective);

    static bool satisfies(const CombustionResult& result, const Constraints& constraints);

    // False when validate_input would reject the candidate
    static bool admissible(const BiomassInput& candidate);

private:
    Combustion model;
};

#endif // OPTIMIZER_SUBMODEL_HPP
