#pragma once

#include <string>

namespace rcflex {

/**
 * @brief Concrete material for reinforced-concrete section design
 *
 * Stores material properties in consistent units:
 * - fc: Specified compressive strength f'c [MPa]
 * - Ec: Modulus of elasticity [MPa], Ec = 4700·√f'c (normal-weight concrete)
 * - beta1: Whitney stress block depth factor (0.65-0.85)
 * - lambda: Lightweight modification factor (1.0 normal weight)
 *
 * The constructor validates f'c and throws InputError(INVALID_MATERIAL)
 * for non-positive strengths.
 */
class Concrete {
public:
    std::string name;   ///< Material name (e.g. "G25")
    double fc;          ///< Compressive strength f'c [MPa]
    double Ec;          ///< Modulus of elasticity [MPa]
    double beta1;       ///< Stress block factor β1
    double lambda;      ///< Lightweight concrete factor λ

    /**
     * @brief Construct a concrete material
     *
     * Ec and beta1 are computed from f'c.
     *
     * @param fc Compressive strength f'c [MPa]
     * @param name Material name
     * @param lambda Lightweight modification factor (default 1.0)
     */
    explicit Concrete(double fc, std::string name = "", double lambda = 1.0);

    /**
     * @brief Modulus of elasticity for normal-weight concrete
     *
     * Formula: Ec = 4700·√f'c [MPa]
     */
    static double compute_Ec(double fc);

    /**
     * @brief Whitney stress block factor β1
     *
     * - f'c ≤ 28 MPa: β1 = 0.85
     * - f'c ≥ 55 MPa: β1 = 0.65
     * - otherwise: β1 = 0.85 − 0.05·(f'c − 28)/7
     */
    static double compute_beta1(double fc);
};

/**
 * @brief Elasto-plastic reinforcing steel
 *
 * - fy: Yield strength [MPa]
 * - Es: Modulus of elasticity [MPa] (default 200000)
 * - epsilon_y: Yield strain fy/Es
 */
class ReinforcingSteel {
public:
    std::string name;   ///< Steel grade name (e.g. "A630-420H")
    double fy;          ///< Yield strength [MPa]
    double Es;          ///< Modulus of elasticity [MPa]

    /**
     * @brief Construct reinforcing steel
     *
     * Throws InputError(INVALID_MATERIAL) for non-positive fy or Es.
     *
     * @param fy Yield strength [MPa]
     * @param name Grade name
     * @param Es Modulus of elasticity [MPa]
     */
    explicit ReinforcingSteel(double fy, std::string name = "", double Es = 200000.0);

    /// Yield strain εy = fy / Es
    double epsilon_y() const { return fy / Es; }

    /**
     * @brief Elasto-plastic stress for a given strain
     *
     * fs = sign(ε)·min(|ε|·Es, fy). Positive strain is tension.
     *
     * @param strain Steel strain (+ tension)
     * @return Stress [MPa] (+ tension)
     */
    double stress(double strain) const;
};

} // namespace rcflex
