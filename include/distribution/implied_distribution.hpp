#pragma once

#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"

namespace cmm {

/**
 * Parameters of the hybrid fit, all in log10 of the outcome value.
 */
struct DistributionFit {
    double mu{0.0};          // Body lognormal mean of log10 x
    double sigma{0.0};       // Body lognormal std dev of log10 x
    double alpha{2.0};       // Pareto tail index
    size_t tau_index{0};     // First tail knot
    double x_tau{0.0};       // Value at the tail boundary
    double tail_mass{0.0};   // sum of p_k for k >= tau
    double s_tau{0.0};       // 1 - CDF(x_tau), mass strictly above the boundary knot
};

struct ScenarioProbabilities {
    double threshold{0.0};
    double base{0.0};        // P(X >= K) at the fitted alpha
    double low{0.0};         // Thinner tail (alpha + delta)
    double high{0.0};        // Fatter tail (alpha - delta)
    double alpha_low{0.0};
    double alpha_high{0.0};
};

/**
 * Implied outcome distribution of an LMSR price vector: a lognormal body
 * below the point where the upper tail holds `tail_cutoff` of the mass,
 * spliced to a Pareto tail above it.
 *
 *   S(K) = 1 - F_body(K) * (1 - S_tau)                 K <  x_tau
 *   S(K) = S_tau * 10^(-alpha * (log10 K - log10 x_tau))  K >= x_tau
 *
 * F_body is the normal CDF of log10 K renormalized so F_body(x_tau) = 1,
 * which makes S continuous at the boundary. Read-only; calibrating the same
 * prices twice gives the same fit.
 */
class ImpliedDistribution {
public:
    static Result<ImpliedDistribution> calibrate(const std::vector<Price>& prices,
                                                 const std::vector<double>& values,
                                                 const CalibrationConfig& config = {});

    const DistributionFit& fit() const { return fit_; }

    // P(X >= K), clamped to [0, 1]
    double survival(double threshold) const;
    double survival(double threshold, double alpha) const;

    // Base/low/high tail probabilities at K; CONFIGURATION fault for K <= 0
    Result<ScenarioProbabilities> scenarios(double threshold) const;

private:
    ImpliedDistribution(DistributionFit fit, double alpha_delta);

    double body_cdf(double log_k) const;

    DistributionFit fit_;
    double alpha_delta_{0.3};
};

// Standard normal CDF
double normal_cdf(double z);

} // namespace cmm
