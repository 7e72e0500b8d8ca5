#include "distribution/implied_distribution.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace cmm {

namespace {

// Lower bound for the alpha used in the fat-tail scenario
constexpr double MIN_ALPHA = 1e-3;

} // namespace

double normal_cdf(double z) {
    return 0.5 * (1.0 + std::erf(z / std::sqrt(2.0)));
}

ImpliedDistribution::ImpliedDistribution(DistributionFit fit, double alpha_delta)
    : fit_(fit)
    , alpha_delta_(alpha_delta)
{
}

Result<ImpliedDistribution> ImpliedDistribution::calibrate(const std::vector<Price>& prices,
                                                           const std::vector<double>& values,
                                                           const CalibrationConfig& config) {
    if (prices.empty()) {
        return configuration_fault("cannot calibrate an empty grid");
    }
    if (prices.size() != values.size()) {
        return configuration_fault(fmt::format("price vector ({}) and knot values ({}) differ in length",
                                               prices.size(), values.size()));
    }
    for (size_t k = 0; k < prices.size(); k++) {
        if (!std::isfinite(prices[k]) || prices[k] < 0.0) {
            return math_fault(fmt::format("invalid price {} at knot {}", prices[k], k));
        }
        if (!std::isfinite(values[k]) || values[k] <= 0.0) {
            return configuration_fault(fmt::format("invalid knot value {} at knot {}", values[k], k));
        }
    }

    const size_t n = prices.size();
    std::vector<double> lx(n);
    for (size_t k = 0; k < n; k++) {
        lx[k] = std::log10(values[k]);
    }

    DistributionFit fit;

    // Walk down from the top until the upper tail first exceeds the cutoff
    fit.tau_index = n - 1;
    double upper = 0.0;
    for (size_t i = n; i-- > 0;) {
        upper += prices[i];
        if (upper > config.tail_cutoff) {
            fit.tau_index = i;
            break;
        }
    }
    const size_t tau = fit.tau_index;
    const double lx_tau = lx[tau];
    fit.x_tau = values[tau];

    double below_and_at = 0.0;
    for (size_t k = 0; k <= tau; k++) {
        below_and_at += prices[k];
    }
    fit.s_tau = std::min(std::max(1.0 - below_and_at, 0.0), 1.0);

    // Body: x < x_tau
    double z = 0.0;
    double m1 = 0.0;
    double m2 = 0.0;
    for (size_t k = 0; k < tau; k++) {
        z += prices[k];
        m1 += prices[k] * lx[k];
        m2 += prices[k] * lx[k] * lx[k];
    }
    double sigma2 = 0.0;
    if (z > 0.0) {
        fit.mu = m1 / z;
        sigma2 = m2 / z - fit.mu * fit.mu;
    } else {
        fit.mu = lx_tau;
    }
    fit.sigma = std::sqrt(std::max(sigma2, config.sigma2_floor));

    // Tail: x >= x_tau
    double denom = 0.0;
    for (size_t k = tau; k < n; k++) {
        fit.tail_mass += prices[k];
        if (lx[k] > lx_tau) {
            denom += prices[k] * (lx[k] - lx_tau);
        }
    }
    if (n - tau >= 2 && fit.tail_mass > 0.0 && denom > 0.0) {
        fit.alpha = fit.tail_mass / denom;
    } else {
        fit.alpha = config.default_alpha;
    }

    if (!std::isfinite(fit.mu) || !std::isfinite(fit.sigma) || !std::isfinite(fit.alpha)) {
        spdlog::error("Degenerate distribution fit: mu={} sigma={} alpha={}", fit.mu, fit.sigma, fit.alpha);
        return math_fault("degenerate distribution fit");
    }

    spdlog::debug("Implied distribution: tau={} x_tau={:.6g} mu={:.4f} sigma={:.4f} alpha={:.4f} S_tau={:.4f}",
                  tau, fit.x_tau, fit.mu, fit.sigma, fit.alpha, fit.s_tau);

    return ImpliedDistribution(fit, config.alpha_delta);
}

double ImpliedDistribution::body_cdf(double log_k) const {
    double raw = normal_cdf((log_k - fit_.mu) / fit_.sigma);
    double norm = normal_cdf((std::log10(fit_.x_tau) - fit_.mu) / fit_.sigma);
    if (norm <= 0.0) {
        norm = 1.0;
    }
    return std::min(std::max(raw / norm, 0.0), 1.0);
}

double ImpliedDistribution::survival(double threshold) const {
    return survival(threshold, fit_.alpha);
}

double ImpliedDistribution::survival(double threshold, double alpha) const {
    if (threshold <= 0.0) {
        return 1.0;
    }

    double log_k = std::log10(threshold);
    double log_tau = std::log10(fit_.x_tau);

    double s;
    if (log_k < log_tau) {
        s = 1.0 - body_cdf(log_k) * (1.0 - fit_.s_tau);
    } else {
        s = fit_.s_tau * std::pow(10.0, -alpha * (log_k - log_tau));
    }
    return std::min(std::max(s, 0.0), 1.0);
}

Result<ScenarioProbabilities> ImpliedDistribution::scenarios(double threshold) const {
    if (!std::isfinite(threshold) || threshold <= 0.0) {
        return configuration_fault(fmt::format("scenario threshold must be positive, got {}", threshold));
    }

    ScenarioProbabilities result;
    result.threshold = threshold;
    result.alpha_low = fit_.alpha + alpha_delta_;
    result.alpha_high = std::max(fit_.alpha - alpha_delta_, std::min(MIN_ALPHA, fit_.alpha));

    result.base = survival(threshold, fit_.alpha);
    result.low = survival(threshold, result.alpha_low);
    result.high = survival(threshold, result.alpha_high);

    return result;
}

} // namespace cmm
