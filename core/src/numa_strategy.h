#pragma once

#include <optional>

#include "hearth_backend.h"
#include "llama.h"

namespace hearth {

enum ggml_numa_strategy numa_strategy_to_native(NumaStrategy strategy);

// std::nullopt for codes ggml does not define.
std::optional<NumaStrategy> numa_strategy_from_native(int code);

}  // namespace hearth
