#include "isa/atmosphere.hpp"
#include "isa/constants.hpp"

#include <cmath>

namespace isa {

using namespace constants;

namespace {

// Exponent of the troposphere pressure/temperature power law
constexpr double troposphere_exponent = -g0_m_s2 / (betaT_K_m * R_m2_K_s2);

double troposphere_pressure(double Hp, double dT) {
    return p0_Pa * std::pow((temperature(Hp, dT) - dT) / T0_K, troposphere_exponent);
}

} // namespace

double temperature(double Hp, double dT) {
    if (Hp <= Hp_trop_m) {
        return T0_K + dT + betaT_K_m * Hp;
    }

    // Isothermal above the tropopause
    return T0_K + dT + betaT_K_m * Hp_trop_m;
}

double pressure(double Hp, double dT) {
    if (Hp <= Hp_trop_m) {
        return troposphere_pressure(Hp, dT);
    }

    const double p_trop = troposphere_pressure(Hp_trop_m, dT);
    return p_trop * std::exp(-g0_m_s2 / (R_m2_K_s2 * temperature(Hp_trop_m)) * (Hp - Hp_trop_m));
}

double density(double p, double T) {
    return p / (R_m2_K_s2 * T);
}

double speed_of_sound(double T) {
    return std::sqrt(kappa * R_m2_K_s2 * T);
}

double theta(double T) {
    return T / T0_K;
}

double delta(double p) {
    return p / p0_Pa;
}

double sigma(double rho) {
    return rho / rho0_kg_m3;
}

} // namespace isa
