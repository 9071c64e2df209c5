/// @file src/finance/irr_solver.cpp
/// @brief Two-stage IRR solver (companion-matrix roots, Newton fallback).

#include "irr_solver.hpp"

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>

namespace execo::finance {

// ─── Enum names ───────────────────────────────────────────────────────────────

std::string_view to_string(IrrStatus status) noexcept {
    switch (status) {
        case IrrStatus::Converged:     return "converged";
        case IrrStatus::Stalled:       return "stalled";
        case IrrStatus::NonConvergent: return "non-convergent";
    }
    return "unknown";
}

std::string_view to_string(IrrMethod method) noexcept {
    switch (method) {
        case IrrMethod::None:            return "none";
        case IrrMethod::CompanionMatrix: return "companion-matrix";
        case IrrMethod::NewtonRaphson:   return "newton-raphson";
    }
    return "unknown";
}

IrrSolution solve_irr(std::span<const double> cash_flows) {
    return IrrSolver::solve(cash_flows);
}

// ─── NPV and derivative ───────────────────────────────────────────────────────

double IrrSolver::npv(std::span<const double> cash_flows, double rate) noexcept {
    const double base = 1.0 + rate;
    double discount = 1.0;  // (1+r)^t, built incrementally
    double sum = 0.0;
    for (double cf : cash_flows) {
        sum += cf / discount;
        discount *= base;
    }
    return sum;
}

double IrrSolver::npv_derivative(std::span<const double> cash_flows,
                                 double rate) noexcept {
    const double base = 1.0 + rate;
    double discount = base;  // (1+r)^(t+1)
    double sum = 0.0;
    for (std::size_t t = 0; t < cash_flows.size(); ++t) {
        sum += -static_cast<double>(t) * cash_flows[t] / discount;
        discount *= base;
    }
    return sum;
}

bool IrrSolver::changes_sign(std::span<const double> cash_flows) noexcept {
    bool has_pos = false;
    bool has_neg = false;
    for (double cf : cash_flows) {
        if (cf > 0.0) has_pos = true;
        if (cf < 0.0) has_neg = true;
    }
    return has_pos && has_neg;
}

// ─── Stage 1: companion matrix ────────────────────────────────────────────────

std::vector<double>
IrrSolver::positive_real_roots(std::span<const double> coeffs) {
    // Trim zero high-order coefficients (degree reduction) and zero low-order
    // coefficients (roots at x = 0, never positive).
    std::size_t hi = coeffs.size();
    while (hi > 0 && coeffs[hi - 1] == 0.0) --hi;
    std::size_t lo = 0;
    while (lo < hi && coeffs[lo] == 0.0) ++lo;

    if (hi <= lo + 1) return {};  // constant polynomial: no roots
    const auto degree = static_cast<Eigen::Index>(hi - lo - 1);
    const double lead = coeffs[hi - 1];

    // Frobenius companion matrix of the monic polynomial
    //   x^n + a_{n−1} x^{n−1} + … + a_0,   a_i = c_{lo+i} / c_lead
    // First row holds −a_{n−1} … −a_0; ones on the sub-diagonal.
    Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(degree, degree);
    for (Eigen::Index j = 0; j < degree; ++j) {
        const std::size_t power = static_cast<std::size_t>(degree - 1 - j);
        companion(0, j) = -coeffs[lo + power] / lead;
    }
    for (Eigen::Index i = 1; i < degree; ++i) {
        companion(i, i - 1) = 1.0;
    }

    Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, /*computeEigenvectors=*/false);
    if (solver.info() != Eigen::Success) return {};

    std::vector<double> roots;
    const auto& eig = solver.eigenvalues();
    for (Eigen::Index i = 0; i < eig.size(); ++i) {
        const double re = eig[i].real();
        const double im = eig[i].imag();
        if (!std::isfinite(re) || !std::isfinite(im)) continue;
        const double scale = std::max(1.0, std::abs(re));
        if (std::abs(im) > constants::IRR_ROOT_IMAG_TOLERANCE * scale) continue;
        if (re <= 0.0) continue;
        roots.push_back(re);
    }
    return roots;
}

std::optional<double>
IrrSolver::solve_polynomial(std::span<const double> cash_flows) {
    const auto roots = positive_real_roots(cash_flows);

    std::optional<double> best;
    for (double x : roots) {
        const double rate = 1.0 / x - 1.0;
        if (!std::isfinite(rate)) continue;
        if (!best || std::abs(rate) < std::abs(*best)) {
            best = rate;
        }
    }
    return best;
}

// ─── Stage 2: Newton–Raphson ──────────────────────────────────────────────────

IrrSolution IrrSolver::solve_newton(std::span<const double> cash_flows,
                                    double initial_rate) noexcept {
    double rate = initial_rate;
    int iter = 0;

    for (; iter < constants::IRR_MAX_ITERATIONS; ++iter) {
        const double value = npv(cash_flows, rate);
        if (!std::isfinite(value)) break;

        if (std::abs(value) < constants::IRR_NPV_TOLERANCE) {
            return IrrSolution{IrrStatus::Converged, rate,
                               IrrMethod::NewtonRaphson, iter};
        }

        const double slope = npv_derivative(cash_flows, rate);
        if (!std::isfinite(slope)) break;
        if (std::abs(slope) < constants::IRR_DERIVATIVE_FLOOR) {
            // Flat NPV curve: report the last iterate, unverified.
            return IrrSolution{IrrStatus::Stalled, rate,
                               IrrMethod::NewtonRaphson, iter};
        }

        rate -= value / slope;
        if (!std::isfinite(rate)) break;
    }

    if (std::isfinite(rate) && std::isfinite(npv(cash_flows, rate))) {
        return IrrSolution{IrrStatus::Stalled, rate, IrrMethod::NewtonRaphson, iter};
    }
    return IrrSolution{IrrStatus::NonConvergent, 0.0, IrrMethod::NewtonRaphson, iter};
}

// ─── Combined ─────────────────────────────────────────────────────────────────

IrrSolution IrrSolver::solve(std::span<const double> cash_flows) {
    if (!changes_sign(cash_flows)) {
        return IrrSolution{};  // NonConvergent, no stage run
    }

    if (auto rate = solve_polynomial(cash_flows)) {
        return IrrSolution{IrrStatus::Converged, *rate,
                           IrrMethod::CompanionMatrix, 0};
    }

    return solve_newton(cash_flows);
}

} // namespace execo::finance
