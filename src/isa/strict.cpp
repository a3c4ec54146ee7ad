#include "isa/strict.hpp"
#include "isa/airspeed.hpp"
#include "isa/atmosphere.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace isa {
namespace strict {

namespace {

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw std::domain_error(std::string(name) + " must be finite");
    }
}

void require_positive(double value, const char* name) {
    if (!(value > 0.0) || std::isinf(value)) {
        throw std::domain_error(std::string(name) + " must be positive and finite, got " + std::to_string(value));
    }
}

void require_non_negative(double value, const char* name) {
    if (!(value >= 0.0) || std::isinf(value)) {
        throw std::domain_error(std::string(name) + " must be non-negative and finite, got " + std::to_string(value));
    }
}

void require_altitude(double Hp, double dT) {
    require_finite(Hp, "Pressure altitude");
    require_finite(dT, "Temperature offset");
    if (!(isa::temperature(Hp, dT) > 0.0)) {
        throw std::domain_error(
            "Temperature at altitude " + std::to_string(Hp) + " m with offset " + std::to_string(dT) + " K is not positive"
        );
    }
}

void require_state(double p, double T) {
    require_positive(p, "Pressure");
    require_positive(T, "Temperature");
}

void require_conditions(const AtmosConditions& cond) {
    require_state(cond.p_Pa, cond.T_K);
    require_positive(cond.a_m_s, "Speed of sound");
}

} // namespace

double temperature(double Hp, double dT) {
    require_altitude(Hp, dT);
    return isa::temperature(Hp, dT);
}

double pressure(double Hp, double dT) {
    require_altitude(Hp, dT);
    return isa::pressure(Hp, dT);
}

double density(double p, double T) {
    require_state(p, T);
    return isa::density(p, T);
}

double speed_of_sound(double T) {
    require_positive(T, "Temperature");
    return isa::speed_of_sound(T);
}

auto conditions(double Hp, double dT) -> AtmosConditions {
    require_altitude(Hp, dT);
    return isa::conditions(Hp, dT);
}

double vcas_to_vtas(double Vcas, double p, double T) {
    require_non_negative(Vcas, "Calibrated airspeed");
    require_state(p, T);
    return isa::vcas_to_vtas(Vcas, p, T);
}

double vcas_to_vtas(double Vcas, const AtmosConditions& cond) {
    require_non_negative(Vcas, "Calibrated airspeed");
    require_conditions(cond);
    return isa::vcas_to_vtas(Vcas, cond);
}

double vtas_to_vcas(double Vtas, double p, double T) {
    require_non_negative(Vtas, "True airspeed");
    require_state(p, T);
    return isa::vtas_to_vcas(Vtas, p, T);
}

double vtas_to_vcas(double Vtas, const AtmosConditions& cond) {
    require_non_negative(Vtas, "True airspeed");
    require_conditions(cond);
    return isa::vtas_to_vcas(Vtas, cond);
}

double mach_to_vtas(double M, double T) {
    require_non_negative(M, "Mach number");
    require_positive(T, "Temperature");
    return isa::mach_to_vtas(M, T);
}

double mach_to_vtas(double M, const AtmosConditions& cond) {
    require_non_negative(M, "Mach number");
    require_conditions(cond);
    return isa::mach_to_vtas(M, cond);
}

double vtas_to_mach(double Vtas, double T) {
    require_non_negative(Vtas, "True airspeed");
    require_positive(T, "Temperature");
    return isa::vtas_to_mach(Vtas, T);
}

double vtas_to_mach(double Vtas, const AtmosConditions& cond) {
    require_non_negative(Vtas, "True airspeed");
    require_conditions(cond);
    return isa::vtas_to_mach(Vtas, cond);
}

double mach_to_vcas(double M, double p, double T) {
    require_non_negative(M, "Mach number");
    require_state(p, T);
    return isa::mach_to_vcas(M, p, T);
}

double mach_to_vcas(double M, const AtmosConditions& cond) {
    require_non_negative(M, "Mach number");
    require_conditions(cond);
    return isa::mach_to_vcas(M, cond);
}

double vcas_to_mach(double Vcas, double p, double T) {
    require_non_negative(Vcas, "Calibrated airspeed");
    require_state(p, T);
    return isa::vcas_to_mach(Vcas, p, T);
}

double vcas_to_mach(double Vcas, const AtmosConditions& cond) {
    require_non_negative(Vcas, "Calibrated airspeed");
    require_conditions(cond);
    return isa::vcas_to_mach(Vcas, cond);
}

double transition_altitude(double Vcas, double M, double dT) {
    require_positive(Vcas, "Calibrated airspeed");
    require_positive(M, "Mach number");
    require_finite(dT, "Temperature offset");
    return isa::transition_altitude(Vcas, M, dT);
}

double theta(double T) {
    require_positive(T, "Temperature");
    return isa::theta(T);
}

double delta(double p) {
    require_positive(p, "Pressure");
    return isa::delta(p);
}

double sigma(double rho) {
    require_positive(rho, "Density");
    return isa::sigma(rho);
}

} // namespace strict
} // namespace isa
