#include <gtest/gtest.h>
#include "isa/atmosphere.hpp"
#include "isa/conditions.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

using namespace isa;

// Snapshots are immutable values: complete at construction, never reassigned
static_assert(!std::is_default_constructible<AtmosConditions>::value, "AtmosConditions must be fully initialized");
static_assert(!std::is_copy_assignable<AtmosConditions>::value, "AtmosConditions must not be reassignable");
static_assert(std::is_copy_constructible<AtmosConditions>::value, "AtmosConditions is passed by value");

TEST(ConditionsTest, WithOffset) {
    const auto cond = conditions(9000.0, -1.5);

    EXPECT_NEAR(cond.Hp_m, 9000.0, 0.1);
    EXPECT_EQ(cond.dT_K, -1.5);
    EXPECT_NEAR(cond.T_K, 228.15, 0.01);
    EXPECT_NEAR(cond.p_Pa, 30742.5, 0.1);
    EXPECT_NEAR(cond.rho_kg_m3, 0.469414, 0.0001);
    EXPECT_NEAR(cond.a_m_s, 302.8, 0.1);
}

TEST(ConditionsTest, StandardDay) {
    const auto cond = conditions(9000.0, 0.0);

    EXPECT_NEAR(cond.Hp_m, 9000.0, 0.1);
    EXPECT_EQ(cond.dT_K, 0.0);
    EXPECT_NEAR(cond.T_K, 229.65, 0.01);
    EXPECT_NEAR(cond.p_Pa, 30742.5, 0.1);
    EXPECT_NEAR(cond.rho_kg_m3, 0.466348, 0.0001);
    EXPECT_NEAR(cond.a_m_s, 303.793, 0.1);
}

TEST(ConditionsTest, DefaultOffsetIsZero) {
    const auto a = conditions(4000.0);
    const auto b = conditions(4000.0, 0.0);
    EXPECT_EQ(a.T_K, b.T_K);
    EXPECT_EQ(a.p_Pa, b.p_Pa);
    EXPECT_EQ(a.dT_K, 0.0);
}

TEST(ConditionsTest, ConsistentWithIndividualFunctions) {
    std::vector<double> altitudes = {-200.0, 0.0, 9000.0, 11000.0, 15000.0};

    for (double Hp : altitudes) {
        for (double dT : {-1.5, 0.0, 12.0}) {
            const auto cond = conditions(Hp, dT);
            EXPECT_EQ(cond.Hp_m, Hp);
            EXPECT_EQ(cond.dT_K, dT);
            EXPECT_EQ(cond.T_K, temperature(Hp, dT));
            EXPECT_EQ(cond.p_Pa, pressure(Hp, dT));
            EXPECT_EQ(cond.rho_kg_m3, density(cond.p_Pa, cond.T_K));
            EXPECT_EQ(cond.a_m_s, speed_of_sound(cond.T_K))
                << "Stored speed of sound differs at " << Hp << " m, dT = " << dT << " K";
        }
    }
}

TEST(ConditionsTest, ArbitraryConditionsCanBeStored) {
    const AtmosConditions cond(1500.0, 280.0, 3.0, 85000.0, 1.05, 335.0);
    EXPECT_EQ(cond.Hp_m, 1500.0);
    EXPECT_EQ(cond.T_K, 280.0);
    EXPECT_EQ(cond.dT_K, 3.0);
    EXPECT_EQ(cond.p_Pa, 85000.0);
    EXPECT_EQ(cond.rho_kg_m3, 1.05);
    EXPECT_EQ(cond.a_m_s, 335.0);
}

TEST(ConditionsTest, CopyIsIdentical) {
    const auto cond = conditions(9000.0, -1.5);
    const AtmosConditions copy = cond;
    EXPECT_EQ(copy.Hp_m, cond.Hp_m);
    EXPECT_EQ(copy.T_K, cond.T_K);
    EXPECT_EQ(copy.dT_K, cond.dT_K);
    EXPECT_EQ(copy.p_Pa, cond.p_Pa);
    EXPECT_EQ(copy.rho_kg_m3, cond.rho_kg_m3);
    EXPECT_EQ(copy.a_m_s, cond.a_m_s);
}

TEST(ConditionsTest, StreamOutput) {
    std::ostringstream os;
    os << conditions(9000.0, -1.5);
    const std::string text = os.str();

    EXPECT_NE(text.find("Hp=9000 m"), std::string::npos) << text;
    EXPECT_NE(text.find("dT=-1.5 K"), std::string::npos) << text;
    EXPECT_NE(text.find("T=228.15 K"), std::string::npos) << text;
    EXPECT_NE(text.find("p="), std::string::npos) << text;
    EXPECT_NE(text.find("rho="), std::string::npos) << text;
    EXPECT_NE(text.find("a="), std::string::npos) << text;
}
