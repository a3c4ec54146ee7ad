#include "isa/conditions.hpp"
#include "isa/atmosphere.hpp"

#include <ostream>

namespace isa {

AtmosConditions::AtmosConditions(
    double Hp_m_,
    double T_K_,
    double dT_K_,
    double p_Pa_,
    double rho_kg_m3_,
    double a_m_s_
) : Hp_m(Hp_m_),
    T_K(T_K_),
    dT_K(dT_K_),
    p_Pa(p_Pa_),
    rho_kg_m3(rho_kg_m3_),
    a_m_s(a_m_s_)
{}

auto conditions(double Hp, double dT) -> AtmosConditions {
    const double T = temperature(Hp, dT);
    const double p = pressure(Hp, dT);
    const double rho = density(p, T);
    const double a = speed_of_sound(T);
    return AtmosConditions(Hp, T, dT, p, rho, a);
}

std::ostream& operator<<(std::ostream& os, const AtmosConditions& cond) {
    os << "Hp=" << cond.Hp_m << " m"
       << ", dT=" << cond.dT_K << " K"
       << ", T=" << cond.T_K << " K"
       << ", p=" << cond.p_Pa << " Pa"
       << ", rho=" << cond.rho_kg_m3 << " kg/m3"
       << ", a=" << cond.a_m_s << " m/s";
    return os;
}

} // namespace isa
