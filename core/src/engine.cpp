/**
 * @file engine.cpp
 * @brief Hearth - C API Implementation
 *
 * This file implements the public C API defined in hearth.h on top of the
 * C++ backend lifecycle.
 */

#include "hearth.h"

#include <cstring>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "backend_lifecycle.h"
#include "hearth_backend.h"
#include "log.h"
#include "numa_strategy.h"

/* ============================================================================
 * Internal Structures
 * ========================================================================= */

namespace {

struct ApiState {
    // References held on behalf of C callers. Kept apart from C++ handles so
    // an unbalanced hr_backend_release() can never drop someone else's.
    std::vector<hearth::BackendRef> refs;

    // Thread safety
    std::mutex mutex;
};

ApiState& api_state() {
    static ApiState* state = new ApiState();
    return *state;
}

// Error tracking, per calling thread
thread_local std::string t_last_error;

void set_last_error(const std::string& message) {
    t_last_error = message;
}

// The handle is created and logged with no API lock held; only the push is
// guarded.
hr_error_t acquire_for_caller(const hearth::NumaStrategy* numa) {
    try {
        hearth::BackendRef ref = numa ? hearth::BackendRef(*numa) : hearth::BackendRef();
        ApiState& api = api_state();
        std::lock_guard<std::mutex> lock(api.mutex);
        api.refs.push_back(std::move(ref));
        return HR_SUCCESS;
    } catch (const hearth::BackendInitError& e) {
        HR_LOGE("Failed to initialize backend: %s", e.what());
        set_last_error(e.what());
        return HR_ERROR_BACKEND_INIT_FAILED;
    } catch (const std::exception& e) {
        HR_LOGE("Failed to acquire backend: %s", e.what());
        set_last_error(e.what());
        return HR_ERROR_UNKNOWN;
    }
}

bool valid_log_level(hr_log_level_t level) {
    return level >= HR_LOG_DEBUG && level <= HR_LOG_NONE;
}

}  // namespace

/* ============================================================================
 * Version Information
 * ========================================================================= */

const char* hr_version(void) {
    return "0.1.0";
}

/* ============================================================================
 * Error Handling
 * ========================================================================= */

const char* hr_error_string(hr_error_t error) {
    switch (error) {
        case HR_SUCCESS: return "Success";
        case HR_ERROR_INVALID_PARAM: return "Invalid parameter";
        case HR_ERROR_BACKEND_INIT_FAILED: return "Failed to initialize backend";
        case HR_ERROR_BACKEND_NOT_ACQUIRED: return "Backend not acquired";
        default: return "Unknown error";
    }
}

const char* hr_get_last_error(void) {
    return t_last_error.c_str();
}

/* ============================================================================
 * NUMA Strategy
 * ========================================================================= */

const char* hr_numa_strategy_name(hr_numa_strategy_t strategy) {
    const auto numa = hearth::numa_strategy_from_native(static_cast<int>(strategy));
    return numa ? hearth::numa_strategy_name(*numa) : "unknown";
}

/* ============================================================================
 * Logging
 * ========================================================================= */

void hr_log_set_callback(hr_log_callback callback, void* user_data) {
    hearth::log_set_sink(callback, user_data);
}

hr_error_t hr_set_log_level(hr_log_level_t level) {
    if (!valid_log_level(level)) {
        return HR_ERROR_INVALID_PARAM;
    }
    hearth::log_set_level(level);
    return HR_SUCCESS;
}

hr_log_level_t hr_get_log_level(void) {
    return hearth::log_get_level();
}

void hr_set_verbose(bool enable) {
    hearth::log_set_level(enable ? HR_LOG_DEBUG : HR_LOG_WARN);
}

/* ============================================================================
 * Configuration
 * ========================================================================= */

void hr_backend_config_default(hr_backend_config* config) {
    if (!config) return;

    std::memset(config, 0, sizeof(hr_backend_config));
    config->numa = HR_NUMA_DISTRIBUTE;
    config->log_level = HR_LOG_WARN;
    config->reserved = nullptr;
}

hr_error_t hr_backend_configure(const hr_backend_config* config) {
    if (!config) {
        return HR_ERROR_INVALID_PARAM;
    }

    if (config->reserved) {
        set_last_error("Reserved configuration field must be NULL");
        return HR_ERROR_INVALID_PARAM;
    }

    const auto numa = hearth::numa_strategy_from_native(static_cast<int>(config->numa));
    if (!numa || !valid_log_level(config->log_level)) {
        set_last_error("Invalid backend configuration");
        return HR_ERROR_INVALID_PARAM;
    }

    hearth::BackendConfig backend_config;
    backend_config.numa = *numa;
    hearth::configure_backend(backend_config);
    hearth::log_set_level(config->log_level);

    if (hearth::backend_is_initialized()) {
        HR_LOGD("Backend is live; numa strategy %s applies from the next initialization",
                hearth::numa_strategy_name(*numa));
    }
    return HR_SUCCESS;
}

/* ============================================================================
 * Backend Lifecycle
 * ========================================================================= */

hr_error_t hr_backend_acquire(void) {
    return acquire_for_caller(nullptr);
}

hr_error_t hr_backend_acquire_with_numa(hr_numa_strategy_t strategy) {
    const auto numa = hearth::numa_strategy_from_native(static_cast<int>(strategy));
    if (!numa) {
        return HR_ERROR_INVALID_PARAM;
    }
    return acquire_for_caller(&*numa);
}

hr_error_t hr_backend_release(void) {
    // Taken out under the lock, dropped after it so the free is logged
    // with no API lock held.
    std::optional<hearth::BackendRef> ref;
    {
        ApiState& api = api_state();
        std::lock_guard<std::mutex> lock(api.mutex);
        if (!api.refs.empty()) {
            ref.emplace(std::move(api.refs.back()));
            api.refs.pop_back();
        }
    }

    if (!ref) {
        HR_LOGW("hr_backend_release() called without a matching hr_backend_acquire()");
        set_last_error("Release without a matching acquire");
        return HR_ERROR_BACKEND_NOT_ACQUIRED;
    }
    return HR_SUCCESS;
}

size_t hr_backend_ref_count(void) {
    return hearth::backend_ref_count();
}

bool hr_backend_is_initialized(void) {
    return hearth::backend_is_initialized();
}
