#include "numa_strategy.h"

namespace hearth {

enum ggml_numa_strategy numa_strategy_to_native(NumaStrategy strategy) {
    switch (strategy) {
        case NumaStrategy::Disable: return GGML_NUMA_STRATEGY_DISABLED;
        case NumaStrategy::Distribute: return GGML_NUMA_STRATEGY_DISTRIBUTE;
        case NumaStrategy::Isolate: return GGML_NUMA_STRATEGY_ISOLATE;
        case NumaStrategy::Numactl: return GGML_NUMA_STRATEGY_NUMACTL;
        case NumaStrategy::Mirror: return GGML_NUMA_STRATEGY_MIRROR;
        case NumaStrategy::Count: return GGML_NUMA_STRATEGY_COUNT;
    }
    return GGML_NUMA_STRATEGY_DISABLED;
}

std::optional<NumaStrategy> numa_strategy_from_native(int code) {
    switch (code) {
        case GGML_NUMA_STRATEGY_DISABLED: return NumaStrategy::Disable;
        case GGML_NUMA_STRATEGY_DISTRIBUTE: return NumaStrategy::Distribute;
        case GGML_NUMA_STRATEGY_ISOLATE: return NumaStrategy::Isolate;
        case GGML_NUMA_STRATEGY_NUMACTL: return NumaStrategy::Numactl;
        case GGML_NUMA_STRATEGY_MIRROR: return NumaStrategy::Mirror;
        case GGML_NUMA_STRATEGY_COUNT: return NumaStrategy::Count;
        default: return std::nullopt;
    }
}

const char* numa_strategy_name(NumaStrategy strategy) {
    switch (strategy) {
        case NumaStrategy::Disable: return "disable";
        case NumaStrategy::Distribute: return "distribute";
        case NumaStrategy::Isolate: return "isolate";
        case NumaStrategy::Numactl: return "numactl";
        case NumaStrategy::Mirror: return "mirror";
        case NumaStrategy::Count: return "count";
        default: return "unknown";
    }
}

}  // namespace hearth
