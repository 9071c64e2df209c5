/**
 * @file  fuzz_assumptions_loader.cpp
 * @brief libFuzzer target for CSV assumptions → validation → financials.
 *
 * Build:
 *   cmake -DEXECO_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_assumptions_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_assumptions_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every skipped row carries a line number ≥ 1.
 *   3. If the parsed assumptions validate:
 *      a. compute_financials does not throw
 *      b. cash_flows has lifetime + 1 entries, cash_flows[0] = −CAPEX
 *      c. LCOE is positive (possibly +∞), NPV is finite
 *      d. 0 ≤ payback ≤ lifetime
 *   4. If they do not validate: compute_financials throws ValidationError
 *      naming the same field.
 *
 * Fuzzer strategy:
 *   Input is passed directly as the CSV body. The loader must tolerate
 *   binary garbage, missing header, "nan"/"inf" tokens, huge exponents,
 *   whole-number checks on integer keys and CR/LF mixes.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "execo/assumptions_loader.hpp"
#include "execo/finance.hpp"
#include "execo/log.hpp"

using namespace execo;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    // Keep the output quiet; libFuzzer runs millions of iterations.
    core::set_log_level(core::LogLevel::Off);

    const std::string input{reinterpret_cast<const char*>(data), size};
    const auto loaded = core::AssumptionsLoader::parse_csv_string(input);

    for (const auto& row : loaded.skipped) {
        assert(row.line_number >= 1);
    }

    const auto& a = loaded.assumptions;
    const auto err = finance::validate(a);

    if (!err) {
        const auto r = finance::compute_financials(a);

        assert(r.cash_flows.size()
               == static_cast<std::size_t>(a.project_lifetime_years) + 1);
        assert(r.cash_flows[0] == -r.total_capex);
        assert(!std::isnan(r.lcoe) && r.lcoe > 0.0);
        assert(std::isfinite(r.npv));
        assert(r.payback_years >= 0.0);
        assert(r.payback_years <= a.project_lifetime_years);
    } else {
        try {
            (void)finance::compute_financials(a);
            assert(false && "invalid assumptions were accepted");
        } catch (const ValidationError& e) {
            assert(e.field() == err->field());
        }
    }

    return 0;
}
