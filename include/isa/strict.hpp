#pragma once

#include "isa/conditions.hpp"

namespace isa {

/// @brief Validating counterparts of the atmosphere and airspeed functions
///
/// @details Every function checks its inputs against the physically meaningful
///          domain and throws std::domain_error before computing anything.
///          Inside the domain the result is identical to the unchecked
///          function of the same name in namespace isa, which instead lets
///          NaN or Inf propagate.
///
///          Domain:
///          - altitude and temperature offset finite
///          - resulting temperature T(Hp, ΔT) > 0
///          - T > 0, p > 0, ρ > 0 wherever they are inputs
///          - airspeeds and Mach numbers finite and >= 0
///          - transition_altitude(): Vcas > 0 and M > 0
namespace strict {

double temperature(double Hp, double dT = 0.0);
double pressure(double Hp, double dT = 0.0);
double density(double p, double T);
double speed_of_sound(double T);

auto conditions(double Hp, double dT = 0.0) -> AtmosConditions;

double vcas_to_vtas(double Vcas, double p, double T);
double vcas_to_vtas(double Vcas, const AtmosConditions& cond);
double vtas_to_vcas(double Vtas, double p, double T);
double vtas_to_vcas(double Vtas, const AtmosConditions& cond);

double mach_to_vtas(double M, double T);
double mach_to_vtas(double M, const AtmosConditions& cond);
double vtas_to_mach(double Vtas, double T);
double vtas_to_mach(double Vtas, const AtmosConditions& cond);

double mach_to_vcas(double M, double p, double T);
double mach_to_vcas(double M, const AtmosConditions& cond);
double vcas_to_mach(double Vcas, double p, double T);
double vcas_to_mach(double Vcas, const AtmosConditions& cond);

double transition_altitude(double Vcas, double M, double dT = 0.0);

double theta(double T);
double delta(double p);
double sigma(double rho);

} // namespace strict
} // namespace isa
