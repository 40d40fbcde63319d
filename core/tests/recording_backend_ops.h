#pragma once

// Native backend ops that count calls instead of touching llama.cpp, and
// flag any call that breaks the init/free protocol.

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "backend_lifecycle.h"

struct NativeCallLog {
    std::atomic<int> init_calls{0};
    std::atomic<int> numa_calls{0};
    std::atomic<int> log_set_calls{0};
    std::atomic<int> free_calls{0};

    std::atomic<int> last_numa{-1};
    std::atomic<ggml_log_callback> last_log_callback{nullptr};

    // Protocol checks
    std::atomic<bool> live{false};
    std::atomic<int> in_flight{0};
    std::atomic<int> overlapping_calls{0};
    std::atomic<int> double_inits{0};
    std::atomic<int> frees_while_down{0};

    // Handles the test currently holds; must be zero whenever free runs.
    std::atomic<int> outstanding{0};
    std::atomic<int> premature_frees{0};

    // Failure injection
    std::atomic<bool> fail_init{false};
    std::atomic<bool> fail_numa{false};

    // Widens the window for racing initializations.
    std::atomic<int> init_delay_us{0};

    void reset() {
        init_calls = 0;
        numa_calls = 0;
        log_set_calls = 0;
        free_calls = 0;
        last_numa = -1;
        last_log_callback = nullptr;
        live = false;
        in_flight = 0;
        overlapping_calls = 0;
        double_inits = 0;
        frees_while_down = 0;
        outstanding = 0;
        premature_frees = 0;
        fail_init = false;
        fail_numa = false;
        init_delay_us = 0;
    }
};

inline NativeCallLog g_native;

struct InFlightScope {
    InFlightScope() {
        if (g_native.in_flight.fetch_add(1) != 0) {
            g_native.overlapping_calls++;
        }
    }
    ~InFlightScope() {
        g_native.in_flight.fetch_sub(1);
    }
};

inline void recording_backend_init() {
    InFlightScope scope;
    g_native.init_calls++;
    if (g_native.fail_init) {
        throw std::runtime_error("injected init failure");
    }
    if (g_native.live.exchange(true)) {
        g_native.double_inits++;
    }
    const int delay = g_native.init_delay_us.load();
    if (delay > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(delay));
    }
}

inline void recording_numa_init(enum ggml_numa_strategy numa) {
    InFlightScope scope;
    g_native.numa_calls++;
    g_native.last_numa = static_cast<int>(numa);
    if (g_native.fail_numa) {
        throw std::runtime_error("injected numa failure");
    }
}

inline void recording_log_set(ggml_log_callback log_callback, void* /* user_data */) {
    InFlightScope scope;
    g_native.log_set_calls++;
    g_native.last_log_callback = log_callback;
}

inline void recording_backend_free() {
    InFlightScope scope;
    g_native.free_calls++;
    if (!g_native.live.exchange(false)) {
        g_native.frees_while_down++;
    }
    if (g_native.outstanding.load() != 0) {
        g_native.premature_frees++;
    }
}

inline hearth::NativeBackendOps recording_backend_ops() {
    hearth::NativeBackendOps ops;
    ops.backend_init = recording_backend_init;
    ops.numa_init = recording_numa_init;
    ops.log_set = recording_log_set;
    ops.backend_free = recording_backend_free;
    return ops;
}
