#include "isa/airspeed.hpp"
#include "isa/atmosphere.hpp"
#include "isa/constants.hpp"

#include <cmath>

namespace isa {

using namespace constants;

double vcas_to_vtas(double Vcas, double p, double T) {
    const double rho = density(p, T);

    const double impact = std::pow(1.0 + mu * rho0_kg_m3 / (2.0 * p0_Pa) * Vcas * Vcas, 1.0 / mu) - 1.0;
    return std::sqrt(2.0 * p / (mu * rho) * (std::pow(1.0 + p0_Pa / p * impact, mu) - 1.0));
}

double vcas_to_vtas(double Vcas, const AtmosConditions& cond) {
    return vcas_to_vtas(Vcas, cond.p_Pa, cond.T_K);
}

double vtas_to_vcas(double Vtas, double p, double T) {
    const double rho = density(p, T);

    const double impact = std::pow(1.0 + mu * rho / (2.0 * p) * Vtas * Vtas, 1.0 / mu) - 1.0;
    return std::sqrt(2.0 * p0_Pa / (mu * rho0_kg_m3) * (std::pow(1.0 + p / p0_Pa * impact, mu) - 1.0));
}

double vtas_to_vcas(double Vtas, const AtmosConditions& cond) {
    return vtas_to_vcas(Vtas, cond.p_Pa, cond.T_K);
}

double mach_to_vtas(double M, double T) {
    return M * speed_of_sound(T);
}

double mach_to_vtas(double M, const AtmosConditions& cond) {
    return M * cond.a_m_s;
}

double vtas_to_mach(double Vtas, double T) {
    return Vtas / speed_of_sound(T);
}

double vtas_to_mach(double Vtas, const AtmosConditions& cond) {
    return Vtas / cond.a_m_s;
}

double mach_to_vcas(double M, double p, double T) {
    return vtas_to_vcas(mach_to_vtas(M, T), p, T);
}

double mach_to_vcas(double M, const AtmosConditions& cond) {
    return mach_to_vcas(M, cond.p_Pa, cond.T_K);
}

double vcas_to_mach(double Vcas, double p, double T) {
    return vtas_to_mach(vcas_to_vtas(Vcas, p, T), T);
}

double vcas_to_mach(double Vcas, const AtmosConditions& cond) {
    return vcas_to_mach(Vcas, cond.p_Pa, cond.T_K);
}

double transition_altitude(double Vcas, double M, double /*dT*/) {
    const double half_kappa_m1 = (kappa - 1.0) / 2.0;
    const double cas_ratio = Vcas / a0_m_s;

    const double delta_trans = (std::pow(1.0 + half_kappa_m1 * cas_ratio * cas_ratio, 1.0 / mu) - 1.0)
                             / (std::pow(1.0 + half_kappa_m1 * M * M, 1.0 / mu) - 1.0);
    const double theta_trans = std::pow(delta_trans, -betaT_K_m * R_m2_K_s2 / g0_m_s2);

    return T0_K / betaT_K_m * (theta_trans - 1.0);
}

} // namespace isa
