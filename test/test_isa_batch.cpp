#include <gtest/gtest.h>
#include "isa/airspeed.hpp"
#include "isa/atmosphere.hpp"
#include "isa/batch.hpp"
#include "isa/conditions.hpp"
#include <Eigen/Dense>
#include <stdexcept>

// ============================================================================
// TEST: Batch evaluation along an altitude profile
// ============================================================================

class BatchTest : public ::testing::Test {
protected:
    // -1 km to 25 km in 1 km steps, 11 km included
    Eigen::ArrayXd Hp_ = Eigen::ArrayXd::LinSpaced(27, -1000.0, 25000.0);
};

TEST_F(BatchTest, TemperatureMatchesScalar) {
    const Eigen::ArrayXd T = isa::batch::temperature(Hp_, -1.5);
    ASSERT_EQ(T.size(), Hp_.size());
    for (Eigen::Index i = 0; i < Hp_.size(); ++i) {
        EXPECT_EQ(T(i), isa::temperature(Hp_(i), -1.5)) << "at " << Hp_(i) << " m";
    }
}

TEST_F(BatchTest, PressureMatchesScalar) {
    const Eigen::ArrayXd p = isa::batch::pressure(Hp_);
    ASSERT_EQ(p.size(), Hp_.size());
    for (Eigen::Index i = 0; i < Hp_.size(); ++i) {
        EXPECT_EQ(p(i), isa::pressure(Hp_(i))) << "at " << Hp_(i) << " m";
    }
}

TEST_F(BatchTest, ProfileMatchesScalarConditions) {
    const auto profile = isa::batch::conditions(Hp_, 5.0);
    ASSERT_EQ(profile.size(), Hp_.size());
    EXPECT_EQ(profile.dT_K, 5.0);

    for (Eigen::Index i = 0; i < Hp_.size(); ++i) {
        const auto cond = isa::conditions(Hp_(i), 5.0);
        EXPECT_EQ(profile.Hp_m(i), cond.Hp_m);
        EXPECT_EQ(profile.T_K(i), cond.T_K);
        EXPECT_EQ(profile.p_Pa(i), cond.p_Pa);
        EXPECT_EQ(profile.rho_kg_m3(i), cond.rho_kg_m3);
        EXPECT_EQ(profile.a_m_s(i), cond.a_m_s);
    }
}

TEST_F(BatchTest, AirspeedConversionsMatchScalar) {
    const auto profile = isa::batch::conditions(Hp_);
    const Eigen::ArrayXd Vcas = Eigen::ArrayXd::Constant(Hp_.size(), 128.611);

    const Eigen::ArrayXd Vtas = isa::batch::vcas_to_vtas(Vcas, profile);
    const Eigen::ArrayXd back = isa::batch::vtas_to_vcas(Vtas, profile.p_Pa, profile.T_K);
    for (Eigen::Index i = 0; i < Hp_.size(); ++i) {
        EXPECT_EQ(Vtas(i), isa::vcas_to_vtas(128.611, profile.p_Pa(i), profile.T_K(i)));
        EXPECT_NEAR(back(i), 128.611, 1e-6 * 128.611);
    }
}

TEST_F(BatchTest, MachConversionsWithProfileUseStoredSpeedOfSound) {
    const auto profile = isa::batch::conditions(Hp_);
    const Eigen::ArrayXd M = Eigen::ArrayXd::Constant(Hp_.size(), 0.78);

    const Eigen::ArrayXd from_profile = isa::batch::mach_to_vtas(M, profile);
    const Eigen::ArrayXd from_temperature = isa::batch::mach_to_vtas(M, profile.T_K);
    const Eigen::ArrayXd mach = isa::batch::vtas_to_mach(from_profile, profile);
    const Eigen::ArrayXd mach_T = isa::batch::vtas_to_mach(from_temperature, profile.T_K);

    for (Eigen::Index i = 0; i < Hp_.size(); ++i) {
        EXPECT_DOUBLE_EQ(from_profile(i), from_temperature(i));
        EXPECT_NEAR(mach(i), 0.78, 1e-12);
        EXPECT_NEAR(mach_T(i), 0.78, 1e-12);
    }
}

TEST(BatchEdgeCaseTest, EmptyInput) {
    const Eigen::ArrayXd empty;
    EXPECT_EQ(isa::batch::temperature(empty).size(), 0);
    EXPECT_EQ(isa::batch::conditions(empty).size(), 0);
}

TEST(BatchEdgeCaseTest, SizeMismatchThrows) {
    const Eigen::ArrayXd three = Eigen::ArrayXd::Constant(3, 250.0);
    const Eigen::ArrayXd four = Eigen::ArrayXd::Constant(4, 30000.0);

    EXPECT_THROW(isa::batch::density(four, three), std::invalid_argument);
    EXPECT_THROW(isa::batch::vcas_to_vtas(three, four, three), std::invalid_argument);
    EXPECT_THROW(isa::batch::vtas_to_vcas(three, three, four), std::invalid_argument);
    EXPECT_THROW(isa::batch::mach_to_vtas(four, three), std::invalid_argument);
    EXPECT_THROW(isa::batch::vtas_to_mach(four, isa::batch::conditions(three)), std::invalid_argument);
}
