#include "isa/batch.hpp"
#include "isa/airspeed.hpp"
#include "isa/atmosphere.hpp"

#include <stdexcept>
#include <string>

namespace isa {
namespace batch {

namespace {

void check_size(const Eigen::ArrayXd& a, const Eigen::ArrayXd& b, const char* what) {
    if (a.size() != b.size()) {
        throw std::invalid_argument(
            std::string(what) + ": array sizes differ (" + std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")"
        );
    }
}

/// Applies a scalar f(x, p, T) element-wise
template <typename F>
auto ternary(const Eigen::ArrayXd& x, const Eigen::ArrayXd& p, const Eigen::ArrayXd& T, F f) -> Eigen::ArrayXd {
    Eigen::ArrayXd out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        out(i) = f(x(i), p(i), T(i));
    }
    return out;
}

} // namespace

auto temperature(const Eigen::ArrayXd& Hp, double dT) -> Eigen::ArrayXd {
    return Hp.unaryExpr([dT](double h) { return isa::temperature(h, dT); });
}

auto pressure(const Eigen::ArrayXd& Hp, double dT) -> Eigen::ArrayXd {
    return Hp.unaryExpr([dT](double h) { return isa::pressure(h, dT); });
}

auto density(const Eigen::ArrayXd& p, const Eigen::ArrayXd& T) -> Eigen::ArrayXd {
    check_size(p, T, "density");
    return p.binaryExpr(T, [](double p_i, double T_i) { return isa::density(p_i, T_i); });
}

auto speed_of_sound(const Eigen::ArrayXd& T) -> Eigen::ArrayXd {
    return T.unaryExpr([](double T_i) { return isa::speed_of_sound(T_i); });
}

auto conditions(const Eigen::ArrayXd& Hp, double dT) -> AtmosProfile {
    AtmosProfile profile;
    profile.Hp_m = Hp;
    profile.dT_K = dT;
    profile.T_K = temperature(Hp, dT);
    profile.p_Pa = pressure(Hp, dT);
    profile.rho_kg_m3 = density(profile.p_Pa, profile.T_K);
    profile.a_m_s = speed_of_sound(profile.T_K);
    return profile;
}

auto vcas_to_vtas(const Eigen::ArrayXd& Vcas, const Eigen::ArrayXd& p, const Eigen::ArrayXd& T) -> Eigen::ArrayXd {
    check_size(Vcas, p, "vcas_to_vtas");
    check_size(Vcas, T, "vcas_to_vtas");
    return ternary(Vcas, p, T, [](double v, double p_i, double T_i) { return isa::vcas_to_vtas(v, p_i, T_i); });
}

auto vcas_to_vtas(const Eigen::ArrayXd& Vcas, const AtmosProfile& profile) -> Eigen::ArrayXd {
    return vcas_to_vtas(Vcas, profile.p_Pa, profile.T_K);
}

auto vtas_to_vcas(const Eigen::ArrayXd& Vtas, const Eigen::ArrayXd& p, const Eigen::ArrayXd& T) -> Eigen::ArrayXd {
    check_size(Vtas, p, "vtas_to_vcas");
    check_size(Vtas, T, "vtas_to_vcas");
    return ternary(Vtas, p, T, [](double v, double p_i, double T_i) { return isa::vtas_to_vcas(v, p_i, T_i); });
}

auto vtas_to_vcas(const Eigen::ArrayXd& Vtas, const AtmosProfile& profile) -> Eigen::ArrayXd {
    return vtas_to_vcas(Vtas, profile.p_Pa, profile.T_K);
}

auto mach_to_vtas(const Eigen::ArrayXd& M, const Eigen::ArrayXd& T) -> Eigen::ArrayXd {
    check_size(M, T, "mach_to_vtas");
    return M.binaryExpr(T, [](double m, double T_i) { return isa::mach_to_vtas(m, T_i); });
}

auto mach_to_vtas(const Eigen::ArrayXd& M, const AtmosProfile& profile) -> Eigen::ArrayXd {
    check_size(M, profile.a_m_s, "mach_to_vtas");
    return M * profile.a_m_s;
}

auto vtas_to_mach(const Eigen::ArrayXd& Vtas, const Eigen::ArrayXd& T) -> Eigen::ArrayXd {
    check_size(Vtas, T, "vtas_to_mach");
    return Vtas.binaryExpr(T, [](double v, double T_i) { return isa::vtas_to_mach(v, T_i); });
}

auto vtas_to_mach(const Eigen::ArrayXd& Vtas, const AtmosProfile& profile) -> Eigen::ArrayXd {
    check_size(Vtas, profile.a_m_s, "vtas_to_mach");
    return Vtas / profile.a_m_s;
}

} // namespace batch
} // namespace isa
