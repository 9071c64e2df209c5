/**
 * @file  fuzz_irr_solver.cpp
 * @brief libFuzzer target for the two-stage IRR solver.
 *
 * Build:
 *   cmake -DEXECO_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_irr_solver
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. NonConvergent always reports rate 0.
 *   3. Any reported rate is finite; a companion-matrix rate is > −1.
 *   4. A series without a sign change is always NonConvergent.
 *
 * Fuzzer strategy:
 *   Bytes are read as int16 cash flows (at most 64 years) so every
 *   sequence is finite and the polynomial stays small enough for the
 *   companion matrix.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "execo/finance.hpp"

using namespace execo::finance;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::size_t n = std::min<std::size_t>(size / sizeof(int16_t), 64);

    std::vector<double> flows;
    flows.reserve(n);
    bool has_pos = false;
    bool has_neg = false;
    for (std::size_t i = 0; i < n; ++i) {
        int16_t v = 0;
        std::memcpy(&v, data + i * sizeof(int16_t), sizeof(int16_t));
        flows.push_back(static_cast<double>(v));
        has_pos = has_pos || v > 0;
        has_neg = has_neg || v < 0;
    }

    const auto s = solve_irr(flows);

    if (s.status == IrrStatus::NonConvergent) {
        assert(s.method == IrrMethod::None || s.method == IrrMethod::NewtonRaphson);
        assert(s.rate == 0.0);
    } else {
        assert(std::isfinite(s.rate));
        if (s.method == IrrMethod::CompanionMatrix) {
            assert(s.status == IrrStatus::Converged);
            assert(s.rate > -1.0);
        }
    }

    if (!(has_pos && has_neg)) {
        assert(s.status == IrrStatus::NonConvergent);
    }

    return 0;
}
