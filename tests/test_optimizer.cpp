#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "optimizer_submodel.hpp"
#include "furnace_constants.hpp"

class OptimizerTest : public ::testing::Test {
protected:
    Optimizer optimizer;
    BiomassInput input = FurnaceConstants::reference_input();
};

TEST(Objective, ParsesKnownTags) {
    EXPECT_EQ(objective_from_name("efficiency"), Objective::Efficiency);
    EXPECT_EQ(objective_from_name("temperature"), Objective::Temperature);
    EXPECT_EQ(objective_from_name("velocity"), Objective::Velocity);
    EXPECT_EQ(objective_name(Objective::Velocity), "velocity");
    EXPECT_THROW(objective_from_name("cost"), InputError);
}

TEST_F(OptimizerTest, GridDefaultsToRangeAroundBase) {
    Optimizer::Constraints c;
    Eigen::VectorXd grid = Optimizer::search_grid(30.0, c);
    ASSERT_EQ(grid.size(), 100);
    EXPECT_NEAR(grid(0), 15.0, 1e-12);
    EXPECT_NEAR(grid(99), 45.0, 1e-9);
}

TEST_F(OptimizerTest, GridHonoursExplicitBounds) {
    Optimizer::Constraints c;
    c.min = 12.0;
    c.range = 10.0;
    Eigen::VectorXd grid = Optimizer::search_grid(30.0, c);
    EXPECT_NEAR(grid(0), 12.0, 1e-12);
    EXPECT_NEAR(grid(99), 33.0, 1e-9);
}

TEST_F(OptimizerTest, EfficiencyObjectivePicksHighestEfficiency) {
    Optimizer::Constraints c;
    c.max = 100.0;
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::FurnaceEfficiency,
        Objective::Efficiency, c);

    EXPECT_TRUE(o.feasible);
    EXPECT_DOUBLE_EQ(o.original_value, 90.0);
    EXPECT_NEAR(o.optimal_value, 100.0, 1e-9);
    EXPECT_NEAR(o.best_score, 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(o.base_score, 90.0);
    EXPECT_NEAR(o.improvement, 10.0, 1e-9);
    EXPECT_NEAR(o.optimal_result.real_efficiency, 100.0, 1e-9);
}

TEST_F(OptimizerTest, DefaultGridStaysWithinValidEfficiency) {
    // Default grid runs 45..135 %, samples above 100 % are rejected
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::FurnaceEfficiency,
        Objective::Efficiency);

    EXPECT_TRUE(o.feasible);
    EXPECT_LE(o.optimal_result.real_efficiency, 100.0);
    EXPECT_LE(o.optimal_value, 100.0);
    EXPECT_GT(o.optimal_value, 99.0);
}

TEST_F(OptimizerTest, CompositionSweepKeepsDrySumClosed) {
    // Only carbon values within 0.5 of a closed dry sum are admissible
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::Carbon, Objective::Temperature);

    EXPECT_TRUE(o.feasible);
    EXPECT_NO_THROW(validate_input(with_field(input, SweepField::Carbon, o.optimal_value)));
    EXPECT_NEAR(o.optimal_value, 50.29, 0.6);
}

TEST_F(OptimizerTest, AdmissibleMirrorsValidation) {
    EXPECT_TRUE(Optimizer::admissible(input));
    EXPECT_FALSE(Optimizer::admissible(with_field(input, SweepField::FurnaceEfficiency, 135.0)));
    EXPECT_FALSE(Optimizer::admissible(with_field(input, SweepField::Moisture, 61.0)));
    EXPECT_FALSE(Optimizer::admissible(with_field(input, SweepField::FlowRate, 0.0)));
}

TEST_F(OptimizerTest, VelocityObjectiveApproachesTarget) {
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::FlowRate, Objective::Velocity);

    EXPECT_TRUE(o.feasible);
    EXPECT_LT(std::abs(o.optimal_result.gas_velocity - FurnaceConstants::TARGET_VELOCITY), 0.2);
    EXPECT_LT(o.optimal_value, 1.0);
    EXPECT_GT(o.improvement, 0.0);
    EXPECT_NEAR(o.best_score, -std::abs(o.optimal_result.gas_velocity - 15.0), 1e-12);
}

TEST_F(OptimizerTest, TemperatureObjectiveMovesTowardTarget) {
    // Outlet stays above 1273 K over the whole range, so the most air wins
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::ExcessAir, Objective::Temperature);

    EXPECT_TRUE(o.feasible);
    EXPECT_NEAR(o.optimal_value, 45.0, 1e-9);
    EXPECT_GT(o.optimal_result.outlet_gas_temp, 1273.0);
    EXPECT_LT(o.optimal_result.outlet_gas_temp, o.base_result.outlet_gas_temp);
    EXPECT_GT(o.improvement, 0.0);
}

TEST_F(OptimizerTest, VelocityCeilingRespected) {
    Optimizer::Constraints c;
    c.max_velocity = 14.0;
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::FlowRate, Objective::Velocity, c);

    EXPECT_TRUE(o.feasible);
    EXPECT_LE(o.optimal_result.gas_velocity, 14.0);
    EXPECT_GT(o.optimal_result.gas_velocity, 13.8);
}

TEST_F(OptimizerTest, TiesKeepFirstSample) {
    // Efficiency does not depend on flow, every sample scores the same
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::FlowRate, Objective::Efficiency);

    EXPECT_TRUE(o.feasible);
    EXPECT_NEAR(o.optimal_value, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(o.improvement, 0.0);
}

TEST_F(OptimizerTest, NoFeasibleSampleFallsBackToBase) {
    Optimizer::Constraints c;
    c.min_efficiency = 99.0;
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::ExcessAir, Objective::Efficiency, c);

    EXPECT_FALSE(o.feasible);
    EXPECT_DOUBLE_EQ(o.optimal_value, 30.0);
    EXPECT_DOUBLE_EQ(o.original_value, 30.0);
    EXPECT_EQ(o.best_score, -std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(o.improvement, 0.0);
    EXPECT_DOUBLE_EQ(o.optimal_result.outlet_gas_temp, o.base_result.outlet_gas_temp);
}

TEST_F(OptimizerTest, TemperatureCeilingCanExcludeEverything) {
    Optimizer::Constraints c;
    c.max_temp = 1000.0;
    Optimizer::Outcome o = optimizer.optimize(input, SweepField::ExcessAir, Objective::Temperature, c);
    EXPECT_FALSE(o.feasible);
}

TEST_F(OptimizerTest, ScoreSigns) {
    CombustionResult r = Combustion().calculate_all(input);
    EXPECT_DOUBLE_EQ(Optimizer::score(r, Objective::Efficiency), 90.0);
    EXPECT_LE(Optimizer::score(r, Objective::Temperature), 0.0);
    EXPECT_LE(Optimizer::score(r, Objective::Velocity), 0.0);
}

TEST_F(OptimizerTest, BaseInputUnchanged) {
    optimizer.optimize(input, SweepField::ExcessAir, Objective::Velocity);
    EXPECT_DOUBLE_EQ(input.operation.excess_air, 30.0);
}
