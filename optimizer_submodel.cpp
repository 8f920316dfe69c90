#include "optimizer_submodel.hpp"
#include "furnace_constants.hpp"
#include <cmath>
#include <limits>
#include <vector>
#include <omp.h>

Objective objective_from_name(const std::string& name) {
    if (name == "efficiency") {
        return Objective::Efficiency;
    }
    if (name == "temperature") {
        return Objective::Temperature;
    }
    if (name == "velocity") {
        return Objective::Velocity;
    }
    throw InputError("Invalid objective '" + name + "'. Options: efficiency, temperature, velocity");
}

std::string objective_name(Objective objective) {
    switch (objective) {
    case Objective::Efficiency:  return "efficiency";
    case Objective::Temperature: return "temperature";
    case Objective::Velocity:    return "velocity";
    }
    throw InputError("unhandled objective");
}

Optimizer::Optimizer(const Combustion& model) : model(model) {
}

Eigen::VectorXd Optimizer::search_grid(double base_value, const Constraints& constraints) {
    double lo = constraints.min ? *constraints.min : base_value * (1.0 - constraints.range / 100.0);
    double hi = constraints.max ? *constraints.max : base_value * (1.0 + constraints.range / 100.0);
    return Eigen::VectorXd::LinSpaced(FurnaceConstants::OPTIMIZER_POINTS, lo, hi);
}

double Optimizer::score(const CombustionResult& result, Objective objective) {
    switch (objective) {
    case Objective::Efficiency:
        return result.real_efficiency;
    case Objective::Temperature:
        return -std::abs(result.outlet_gas_temp - FurnaceConstants::TARGET_OUTLET_TEMP);
    case Objective::Velocity:
        return -std::abs(result.gas_velocity - FurnaceConstants::TARGET_VELOCITY);
    }
    throw InputError("unhandled objective");
}

bool Optimizer::satisfies(const CombustionResult& result, const Constraints& constraints) {
    if (constraints.max_velocity && result.gas_velocity > *constraints.max_velocity) {
        return false;
    }
    if (constraints.min_efficiency && result.real_efficiency < *constraints.min_efficiency) {
        return false;
    }
    if (constraints.max_temp && result.outlet_gas_temp > *constraints.max_temp) {
        return false;
    }
    return true;
}

bool Optimizer::admissible(const BiomassInput& candidate) {
    try {
        validate_input(candidate);
    }
    catch (const InputError&) {
        return false;
    }
    return true;
}

Optimizer::Outcome Optimizer::optimize(const BiomassInput& base, SweepField field,
    Objective objective) const {
    return optimize(base, field, objective, Constraints());
}

Optimizer::Outcome Optimizer::optimize(const BiomassInput& base, SweepField field,
    Objective objective, const Constraints& constraints) const {

    Outcome out;
    out.field = field;
    out.parameter = sweep_field_name(field);
    out.objective = objective;
    out.original_value = field_value(base, field);

    out.base_result = model.calculate_all(base);
    out.base_score = score(out.base_result, objective);

    Eigen::VectorXd grid = search_grid(out.original_value, constraints);
    const int n = static_cast<int>(grid.size());

    // Samples outside the field's valid domain are never evaluated
    std::vector<CombustionResult> results(n);
    std::vector<char> valid(n, 0);
#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        BiomassInput candidate = with_field(base, field, grid(i));
        if (admissible(candidate)) {
            valid[i] = 1;
            results[i] = model.calculate_all(candidate);
        }
    }

    // Serial pick keeps the first sample on ties
    int best = -1;
    double best_score = -std::numeric_limits<double>::infinity();
    for (int i = 0; i < n; ++i) {
        if (!valid[i] || !satisfies(results[i], constraints)) {
            continue;
        }
        double s = score(results[i], objective);
        if (s > best_score) {
            best_score = s;
            best = i;
        }
    }

    out.feasible = best >= 0;
    out.best_score = best_score;
    if (out.feasible) {
        out.optimal_value = grid(best);
        out.optimal_result = results[best];
        out.improvement = best_score - out.base_score;
    }
    else {
        out.optimal_value = out.original_value;
        out.optimal_result = out.base_result;
        out.improvement = 0.0;
    }

    return out;
}
