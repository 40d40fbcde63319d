#pragma once

#include <cstddef>

#include "hearth_backend.h"
#include "llama.h"

namespace hearth {

// Native entry points driven by the lifecycle. Defaults to llama.cpp.
struct NativeBackendOps {
    void (*backend_init)();
    void (*numa_init)(enum ggml_numa_strategy numa);
    void (*log_set)(ggml_log_callback log_callback, void* user_data);
    void (*backend_free)();
};

NativeBackendOps llama_backend_ops();

// Both refuse (return false) while a backend is live.
bool set_native_backend_ops(const NativeBackendOps& ops);
bool reset_native_backend_ops();

// Take one reference, initializing the backend if none exists. A null
// @p numa uses the configured default strategy.
void backend_acquire(const NumaStrategy* numa);

// Give one reference back, freeing the backend with the last one. Returns
// false (and logs an error) if there was no backend to release.
bool backend_release() noexcept;

size_t backend_ref_count();
bool backend_is_initialized();

// Number of releases that found no live backend since startup.
size_t backend_release_violations();

}  // namespace hearth
