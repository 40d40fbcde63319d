/**
 * @file test_numa_strategy.cpp
 * @brief NumaStrategy mapping to and from ggml_numa_strategy
 */

#include <cstring>

#include "hearth.h"
#include "numa_strategy.h"
#include "test_common.h"

using hearth::NumaStrategy;

int main() {
    printf("\n=== Hearth NUMA Strategy Test ===\n\n");

    const NumaStrategy all[] = {
        NumaStrategy::Disable, NumaStrategy::Distribute, NumaStrategy::Isolate,
        NumaStrategy::Numactl, NumaStrategy::Mirror, NumaStrategy::Count,
    };
    const enum ggml_numa_strategy native[] = {
        GGML_NUMA_STRATEGY_DISABLED, GGML_NUMA_STRATEGY_DISTRIBUTE, GGML_NUMA_STRATEGY_ISOLATE,
        GGML_NUMA_STRATEGY_NUMACTL, GGML_NUMA_STRATEGY_MIRROR, GGML_NUMA_STRATEGY_COUNT,
    };
    const char* names[] = {"disable", "distribute", "isolate", "numactl", "mirror", "count"};

    printf("--- Round Trip ---\n");
    for (int i = 0; i < 6; ++i) {
        const auto code = hearth::numa_strategy_to_native(all[i]);
        const auto back = hearth::numa_strategy_from_native(code);
        check(code == native[i] && back && *back == all[i], names[i], "round trip mismatch");
    }

    printf("\n--- Unknown Codes ---\n");
    check(!hearth::numa_strategy_from_native(-1), "Negative code", "mapped to a strategy");
    check(!hearth::numa_strategy_from_native(GGML_NUMA_STRATEGY_COUNT + 1), "Past the end",
          "mapped to a strategy");
    check(!hearth::numa_strategy_from_native(42), "Arbitrary code", "mapped to a strategy");

    printf("\n--- Names ---\n");
    bool names_ok = true;
    for (int i = 0; i < 6; ++i) {
        names_ok = names_ok && std::strcmp(hearth::numa_strategy_name(all[i]), names[i]) == 0 &&
                   std::strcmp(hr_numa_strategy_name(static_cast<hr_numa_strategy_t>(i)), names[i]) == 0;
    }
    check(names_ok, "Strategy names", "name mismatch");
    check(std::strcmp(hr_numa_strategy_name(static_cast<hr_numa_strategy_t>(7)), "unknown") == 0,
          "Unknown name", "unexpected name");

    return print_summary();
}
