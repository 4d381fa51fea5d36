/**
 * @file  fuzz_text_parse.cpp
 * @brief libFuzzer target for the text array parser
 *
 * Build:
 *   cmake -DCOSMOTAG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_text_parse
 *
 * Run for 60 seconds:
 *   ./fuzz_text_parse -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed text raises a CosmoError, nothing else.
 *   3. If an array is parsed, formatting and parsing it again keeps the
 *      shape, frame and units.
 *
 * Fuzzer strategy:
 *   The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • Header lines with unknown keys, missing ": " or empty values
 *     • Exponents like "1e300/1", "-0/0", "3/"
 *     • Rows with too many or too few columns
 *     • "nan", "inf" and exponential notation
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "cosmotag/text_io.hpp"

using namespace cosmotag;
using namespace cosmotag::io;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    CosmoArray parsed;
    try {
        parsed = TextIO::parse_text(input);
    } catch (const CosmoError&) {
        return 0;
    }

    const CosmoArray again = TextIO::parse_text(TextIO::format_text(parsed));
    assert(again.shape() == parsed.shape());
    assert(again.comoving() == parsed.comoving());
    assert(again.units() == parsed.units());
    (void)again;

    return 0;
}
