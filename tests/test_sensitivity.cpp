#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "sensitivity_submodel.hpp"
#include "furnace_constants.hpp"

class SensitivityTest : public ::testing::Test {
protected:
    Sensitivity analyzer;
    BiomassInput input = FurnaceConstants::reference_input();
};

TEST_F(SensitivityTest, SampleValuesSpanRange) {
    Eigen::VectorXd v = Sensitivity::sample_values(30.0, 50.0, 5);
    ASSERT_EQ(v.size(), 5);
    EXPECT_NEAR(v(0), 15.0, 1e-12);
    EXPECT_NEAR(v(2), 30.0, 1e-12);
    EXPECT_NEAR(v(4), 45.0, 1e-12);
}

TEST_F(SensitivityTest, TooFewPointsRejected) {
    EXPECT_THROW(Sensitivity::sample_values(30.0, 50.0, 1), InputError);
    EXPECT_THROW(analyzer.analyze_parameter(input, SweepField::ExcessAir, 50.0, 0), InputError);
}

TEST_F(SensitivityTest, SweepKeepsSampleOrder) {
    const int n = 12;
    Sensitivity::SensitivityReport rep = analyzer.analyze_parameter(input, SweepField::ExcessAir, 50.0, n);
    const Sensitivity::SweepResult& s = rep.sweep;

    ASSERT_EQ(s.values.size(), n);
    ASSERT_EQ(s.temperatures.size(), n);
    ASSERT_EQ(s.velocities.size(), n);
    ASSERT_EQ(s.pressure_drops.size(), n);
    ASSERT_EQ(s.efficiencies.size(), n);

    Combustion model;
    for (int i = 0; i < n; ++i) {
        CombustionResult r = model.calculate_all(with_field(input, SweepField::ExcessAir, s.values(i)));
        EXPECT_DOUBLE_EQ(s.temperatures(i), r.outlet_gas_temp - FurnaceConstants::KELVIN);
        EXPECT_DOUBLE_EQ(s.velocities(i), r.gas_velocity);
        EXPECT_DOUBLE_EQ(s.pressure_drops(i), r.pressure_drop);
        EXPECT_DOUBLE_EQ(s.efficiencies(i), r.real_efficiency);
    }
    for (int i = 1; i < n; ++i) {
        EXPECT_LT(s.temperatures(i), s.temperatures(i - 1));
    }
}

TEST_F(SensitivityTest, SweepDoesNotTouchBase) {
    Eigen::VectorXd values(3);
    values << 10.0, 20.0, 40.0;
    analyzer.sweep(input, SweepField::ExcessAir, values);
    EXPECT_DOUBLE_EQ(input.operation.excess_air, 30.0);
}

TEST_F(SensitivityTest, ReportCarriesBaseAndUnit) {
    Sensitivity::SensitivityReport rep = analyzer.analyze_parameter(input, SweepField::FlowRate, 20.0, 5);
    EXPECT_EQ(rep.parameter, "flow_rate");
    EXPECT_EQ(rep.unit, "t/h");
    EXPECT_DOUBLE_EQ(rep.base_value, 1.0);
}

TEST_F(SensitivityTest, GradientOfLinearData) {
    Eigen::VectorXd x(5);
    x << 0.0, 1.0, 3.0, 4.0, 7.0;
    Eigen::VectorXd y = 3.0 * x.array() + 2.0;
    Eigen::VectorXd dy = Sensitivity::gradient(y, x);
    for (Eigen::Index i = 0; i < dy.size(); ++i) {
        EXPECT_NEAR(dy(i), 3.0, 1e-12);
    }
}

TEST_F(SensitivityTest, GradientOfQuadraticIsExactInside) {
    Eigen::VectorXd x(4);
    x << 0.0, 1.0, 3.0, 6.0;
    Eigen::VectorXd y = x.array().square();
    Eigen::VectorXd dy = Sensitivity::gradient(y, x);
    EXPECT_NEAR(dy(1), 2.0, 1e-12);
    EXPECT_NEAR(dy(2), 6.0, 1e-12);
    EXPECT_NEAR(dy(0), 1.0, 1e-12);   // one-sided
    EXPECT_NEAR(dy(3), 9.0, 1e-12);   // one-sided
}

TEST_F(SensitivityTest, GradientWithRepeatedSamplesIsGuarded) {
    Eigen::VectorXd x = Eigen::VectorXd::Constant(3, 2.0);
    Eigen::VectorXd y(3);
    y << 1.0, 2.0, 3.0;
    Eigen::VectorXd dy = Sensitivity::gradient(y, x);
    EXPECT_DOUBLE_EQ(dy.cwiseAbs().sum(), 0.0);
}

TEST_F(SensitivityTest, RelativeSensitivityGuardsZeroBase) {
    Eigen::VectorXd d = Eigen::VectorXd::Constant(4, 5.0);
    Eigen::VectorXd rel = Sensitivity::relative_sensitivity(10.0, 0.0, d);
    ASSERT_EQ(rel.size(), 4);
    EXPECT_DOUBLE_EQ(rel.cwiseAbs().sum(), 0.0);

    rel = Sensitivity::relative_sensitivity(10.0, 50.0, d);
    EXPECT_NEAR(rel(0), 100.0, 1e-12);
}

TEST_F(SensitivityTest, VelocityProportionalToFlow) {
    Sensitivity::SensitivityReport rep = analyzer.analyze_parameter(input, SweepField::FlowRate, 30.0, 15);
    const Sensitivity::SensitivityMetrics& m = rep.metrics;

    EXPECT_NEAR(m.max_vel_sens, 100.0, 1e-6);
    EXPECT_NEAR(m.max_temp_sens, 0.0, 1e-6);
    EXPECT_NEAR(m.max_eff_sens, 0.0, 1e-12);
    EXPECT_NEAR(Sensitivity::sensitivity_index(m), 30.0, 1e-6);
}

TEST_F(SensitivityTest, ChannelRanges) {
    Sensitivity::SensitivityReport rep = analyzer.analyze_parameter(input, SweepField::ExcessAir, 50.0, 11);
    const Sensitivity::SensitivityMetrics& m = rep.metrics;

    EXPECT_DOUBLE_EQ(m.temperature_range.max, rep.sweep.temperatures(0));
    EXPECT_DOUBLE_EQ(m.temperature_range.min, rep.sweep.temperatures(10));
    EXPECT_NEAR(m.temperature_range.span, m.temperature_range.max - m.temperature_range.min, 1e-12);
    EXPECT_DOUBLE_EQ(m.efficiency_range.span, 0.0);
}

TEST_F(SensitivityTest, RankingAndRecommendations) {
    std::vector<SweepField> fields = {
        SweepField::Moisture, SweepField::ExcessAir, SweepField::FurnaceEfficiency
    };
    Sensitivity::MultiParameterReport rep = analyzer.multi_parameter_analysis(input, fields, 30.0);

    ASSERT_EQ(rep.individual.size(), 3u);
    for (const Sensitivity::SensitivityReport& r : rep.individual) {
        EXPECT_EQ(r.sweep.values.size(), 15);
    }

    ASSERT_EQ(rep.ranking.size(), 3u);
    EXPECT_EQ(rep.ranking[0].field, SweepField::FurnaceEfficiency);
    EXPECT_EQ(rep.ranking[1].field, SweepField::ExcessAir);
    EXPECT_EQ(rep.ranking[2].field, SweepField::Moisture);
    EXPECT_GE(rep.ranking[0].sensitivity_index, rep.ranking[1].sensitivity_index);
    EXPECT_GE(rep.ranking[1].sensitivity_index, rep.ranking[2].sensitivity_index);

    ASSERT_EQ(rep.recommendations.size(), 1u);
    EXPECT_NE(rep.recommendations[0].find("Furnace efficiency"), std::string::npos);
}

TEST_F(SensitivityTest, StableSystemGetsGenericAdvice) {
    std::vector<SweepField> fields = {SweepField::Moisture, SweepField::ExcessAir};
    Sensitivity::MultiParameterReport rep = analyzer.multi_parameter_analysis(input, fields, 30.0);

    ASSERT_EQ(rep.recommendations.size(), 1u);
    EXPECT_NE(rep.recommendations[0].find("stability"), std::string::npos);
}

TEST_F(SensitivityTest, RecommendationsOnlyFromTopThree) {
    std::vector<Sensitivity::RankingEntry> ranking = {
        {SweepField::Carbon, "carbon", 90.0, 0.0, 0.0, 0.0},
        {SweepField::Hydrogen, "hydrogen", 80.0, 0.0, 0.0, 0.0},
        {SweepField::Oxygen, "oxygen", 70.0, 0.0, 0.0, 0.0},
        {SweepField::ExcessAir, "excess_air", 50.0, 0.0, 0.0, 0.0}
    };
    std::vector<std::string> recs = Sensitivity::generate_recommendations(ranking);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_NE(recs[0].find("stability"), std::string::npos);
}

TEST_F(SensitivityTest, ExcessAirThresholds) {
    std::vector<Sensitivity::RankingEntry> high = {{SweepField::ExcessAir, "excess_air", 25.0, 0.0, 0.0, 0.0}};
    std::vector<Sensitivity::RankingEntry> moderate = {{SweepField::ExcessAir, "excess_air", 15.0, 0.0, 0.0, 0.0}};

    EXPECT_NE(Sensitivity::generate_recommendations(high)[0].find("HIGHLY"), std::string::npos);
    EXPECT_NE(Sensitivity::generate_recommendations(moderate)[0].find("moderately"), std::string::npos);
}

TEST_F(SensitivityTest, CsvExport) {
    Eigen::VectorXd values(2);
    values << 20.0, 40.0;
    Sensitivity::SweepResult s = analyzer.sweep(input, SweepField::ExcessAir, values);

    std::ostringstream out;
    Sensitivity::write_csv(out, s);

    std::istringstream in(out.str());
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "parameter,value,temperature_c,velocity,pressure_drop,efficiency");
    std::getline(in, line);
    EXPECT_EQ(line.rfind("excess_air,20.000000,", 0), 0u);
    std::getline(in, line);
    EXPECT_EQ(line.rfind("excess_air,40.000000,", 0), 0u);
    EXPECT_FALSE(std::getline(in, line));
}
