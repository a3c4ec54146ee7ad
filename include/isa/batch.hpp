#pragma once

#include <Eigen/Dense>

namespace isa {
namespace batch {

/// @brief Atmospheric state along a sequence of pressure altitudes
///
/// Struct-of-arrays counterpart of AtmosConditions. Element i of every array
/// describes the state at Hp_m(i); all elements share the offset dT_K.
struct AtmosProfile {
    Eigen::ArrayXd Hp_m;         ///< Geopotential pressure altitudes (m)
    Eigen::ArrayXd T_K;          ///< Temperatures (K)
    double dT_K;                 ///< Temperature offset (K)
    Eigen::ArrayXd p_Pa;         ///< Pressures (Pa)
    Eigen::ArrayXd rho_kg_m3;    ///< Densities (kg/m³)
    Eigen::ArrayXd a_m_s;        ///< Speeds of sound (m/s)

    AtmosProfile() : dT_K(0.0) {}

    auto size() const -> Eigen::Index { return Hp_m.size(); }
};

// Each element is computed with the scalar function of the same name, so
// batch results match scalar calls exactly.

auto temperature(const Eigen::ArrayXd& Hp, double dT = 0.0) -> Eigen::ArrayXd;
auto pressure(const Eigen::ArrayXd& Hp, double dT = 0.0) -> Eigen::ArrayXd;

/// @throws std::invalid_argument if p and T differ in size
auto density(const Eigen::ArrayXd& p, const Eigen::ArrayXd& T) -> Eigen::ArrayXd;
auto speed_of_sound(const Eigen::ArrayXd& T) -> Eigen::ArrayXd;

/// @brief Evaluates the full atmospheric state at every altitude in Hp
auto conditions(const Eigen::ArrayXd& Hp, double dT = 0.0) -> AtmosProfile;

/// @throws std::invalid_argument if the arrays differ in size
auto vcas_to_vtas(const Eigen::ArrayXd& Vcas, const Eigen::ArrayXd& p, const Eigen::ArrayXd& T) -> Eigen::ArrayXd;

/// @throws std::invalid_argument if Vcas and the profile differ in size
auto vcas_to_vtas(const Eigen::ArrayXd& Vcas, const AtmosProfile& profile) -> Eigen::ArrayXd;

/// @throws std::invalid_argument if the arrays differ in size
auto vtas_to_vcas(const Eigen::ArrayXd& Vtas, const Eigen::ArrayXd& p, const Eigen::ArrayXd& T) -> Eigen::ArrayXd;

auto vtas_to_vcas(const Eigen::ArrayXd& Vtas, const AtmosProfile& profile) -> Eigen::ArrayXd;

/// @throws std::invalid_argument if M and T differ in size
auto mach_to_vtas(const Eigen::ArrayXd& M, const Eigen::ArrayXd& T) -> Eigen::ArrayXd;

/// @brief Uses the profile's speeds of sound directly
auto mach_to_vtas(const Eigen::ArrayXd& M, const AtmosProfile& profile) -> Eigen::ArrayXd;

/// @throws std::invalid_argument if Vtas and T differ in size
auto vtas_to_mach(const Eigen::ArrayXd& Vtas, const Eigen::ArrayXd& T) -> Eigen::ArrayXd;

auto vtas_to_mach(const Eigen::ArrayXd& Vtas, const AtmosProfile& profile) -> Eigen::ArrayXd;

} // namespace batch
} // namespace isa
