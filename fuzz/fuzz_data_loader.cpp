/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader → DamperCalculator.
 *
 * Build:
 *   cmake -DCHASSIS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every accepted row has non-empty ids and row_index == its position.
 *   3. accepted + errors == rows passed to the calculator.
 *   4. Every computed length is finite and >= 0.
 *
 * Fuzzer strategy:
 *   The input is prefixed with a valid header half of the time (chosen by
 *   the first byte) so the row parser is reached, not only header matching.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "chassis/data_loader.hpp"
#include "chassis/geometry.hpp"

using namespace chassis;
using namespace chassis::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) {
        return 0;
    }

    std::string csv;
    if (data[0] & 1u) {
        csv = "clip,center_section,corner,upper_x,upper_y,upper_z,"
              "lower_x,lower_y,lower_z,offset,track_type\n";
    }
    csv.append(reinterpret_cast<const char*>(data + 1), size - 1);

    const auto loaded = DataLoader::parse_csv_string(csv);
    for (std::size_t i = 0; i < loaded.rows.size(); ++i) {
        const auto& row = loaded.rows[i];
        assert(!row.clip_id.empty());
        assert(!row.center_section_id.empty());
        assert(row.row_index == i);
    }

    for (bool normalize : {false, true}) {
        const auto calc = geometry::DamperCalculator::calculate(
            loaded.rows, geometry::NormalizationOptions{.enabled = normalize});
        assert(calc.results.size() + calc.errors.size() == loaded.rows.size());
        for (const auto& r : calc.results) {
            assert(std::isfinite(r.length));
            assert(r.length >= 0.0);
        }
    }
    return 0;
}
