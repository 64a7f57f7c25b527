/**
 * @file  fuzz_lineup.cpp
 * @brief libFuzzer target for LineupOptimizer with per-pair lengths.
 *
 * Build:
 *   cmake -DCHASSIS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_lineup
 *
 * Run for 60 seconds:
 *   ./fuzz_lineup -max_total_time=60
 *
 * Input layout:
 *   byte 0      clip count (mod 7)
 *   byte 1      section count (mod 7)
 *   byte 2      flags: bit 0 maximize, bit 1 drop excess
 *   bytes 3..   one byte per (clip, section) cell; 0xFF marks an unmeasured
 *               pair, anything else is a length in [20, 45.4]
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. The only exceptions are InfeasibleLineupError.
 *   3. A returned lineup is one-to-one, has min(n, m) pairs and never uses
 *      an unmeasured pair.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

#include "chassis/lineup.hpp"

using namespace chassis;
using namespace chassis::lineup;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 3) {
        return 0;
    }
    const std::size_t n = data[0] % 7;
    const std::size_t m = data[1] % 7;

    LineupRequest req;
    req.direction  = (data[2] & 1u) ? Direction::Maximize : Direction::Minimize;
    req.truncation = (data[2] & 2u) ? TruncationPolicy::DropExcess : TruncationPolicy::Strict;
    for (std::size_t i = 0; i < n; ++i) {
        req.clips.push_back(ClipProfile{.clip_id = "C" + std::to_string(i)});
    }
    for (std::size_t j = 0; j < m; ++j) {
        req.center_sections.push_back("S" + std::to_string(j));
    }

    auto table = PairLengthMatrix::unmeasured(n, m);
    std::size_t cursor = 3;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < m; ++j) {
            const uint8_t b = cursor < size ? data[cursor] : 0;
            ++cursor;
            if (b == 0xFF) {
                continue;
            }
            for (auto& mat : table.lengths) {
                mat(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                    20.0 + 0.1 * static_cast<double>(b);
            }
        }
    }
    req.pair_lengths = table;

    try {
        const auto lineup = LineupOptimizer::optimize(req);
        const std::size_t k = std::min(n, m);
        assert(lineup.pairs.size() == k);

        std::set<std::string> clips;
        std::set<std::string> sections;
        for (const auto& p : lineup.pairs) {
            clips.insert(p.clip_id);
            sections.insert(p.center_section_id);
            assert(std::isfinite(p.score));
        }
        assert(clips.size() == k && sections.size() == k);
    } catch (const InfeasibleLineupError&) {
        // Count mismatch under Strict, or no lineup avoids unmeasured pairs.
    }
    return 0;
}
