#pragma once

/// @file src/finance/irr_solver.hpp
/// @brief Two-stage IRR solver: internal header.
///
/// # Module: IRR Solver
///
/// ## Responsibility
/// Find r such that Σ CF_t/(1+r)^t = 0.
///
/// ## Stage 1: companion matrix
/// Substituting x = 1/(1+r) turns NPV into the polynomial
///
///     P(x) = CF_0 + CF_1·x + … + CF_N·x^N
///
/// whose roots are the eigenvalues of its companion matrix. Real roots with
/// x > 0 map back to rates r = 1/x − 1 > −1; the one closest to zero wins.
///
/// ## Stage 2: Newton–Raphson
///     r_{k+1} = r_k − NPV(r_k) / NPV'(r_k),   r_0 = 0.10
/// Stops on |NPV| < 1e-6, |NPV'| < 1e-10, or after 1000 steps.
///
/// ## Guarantees
/// - noexcept except for allocation in stage 1
/// - Stateless; safe to call concurrently

#include "execo/finance.hpp"

#include <optional>
#include <span>
#include <vector>

namespace execo::finance {

class IrrSolver {
public:
    IrrSolver() = delete;  // pure static

    /// Full two-stage solve (what `solve_irr` forwards to).
    [[nodiscard]] static IrrSolution solve(std::span<const double> cash_flows);

    /// Stage 1 only.
    ///
    /// # Returns
    /// The real rate of smallest magnitude, or `nullopt` if the polynomial
    /// has no real positive root in x.
    [[nodiscard]] static std::optional<double>
    solve_polynomial(std::span<const double> cash_flows);

    /// Stage 2 only, starting from `initial_rate`.
    [[nodiscard]] static IrrSolution
    solve_newton(std::span<const double> cash_flows,
                 double initial_rate = constants::IRR_INITIAL_GUESS) noexcept;

    /// Real positive roots x of Σ coeffs[t]·x^t.
    [[nodiscard]] static std::vector<double>
    positive_real_roots(std::span<const double> coeffs);

    /// NPV(r) = Σ CF_t/(1+r)^t.
    [[nodiscard]] static double npv(std::span<const double> cash_flows,
                                    double rate) noexcept;

    /// dNPV/dr = Σ −t·CF_t/(1+r)^(t+1).
    [[nodiscard]] static double npv_derivative(std::span<const double> cash_flows,
                                               double rate) noexcept;

    /// True if the sequence has at least one strictly positive and one
    /// strictly negative entry.
    [[nodiscard]] static bool changes_sign(std::span<const double> cash_flows) noexcept;
};

} // namespace execo::finance
