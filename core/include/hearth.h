/**
 * @file hearth.h
 * @brief Hearth - Public C API
 *
 * Process-wide lifecycle management for the llama.cpp backend. The backend
 * is initialized by the first acquisition and freed by the last release, so
 * any number of models and sessions can share one native engine.
 *
 * @version 0.1.0
 */

#ifndef HEARTH_H
#define HEARTH_H

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

/* Symbol visibility for FFI/dlsym access */
#if defined(_WIN32) || defined(__CYGWIN__)
#  ifdef HR_BUILD_SHARED
#    define HR_API __declspec(dllexport)
#  else
#    define HR_API __declspec(dllimport)
#  endif
#else
#  define HR_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Version Information
 * ========================================================================= */

#define HEARTH_VERSION_MAJOR 0
#define HEARTH_VERSION_MINOR 1
#define HEARTH_VERSION_PATCH 0

/**
 * @brief Get the version string of Hearth
 * @return Version string in format "MAJOR.MINOR.PATCH"
 */
HR_API const char* hr_version(void);

/* ============================================================================
 * Error Codes
 * ========================================================================= */

typedef enum {
    HR_SUCCESS = 0,                       /**< Operation successful */
    HR_ERROR_INVALID_PARAM = -1,          /**< Invalid parameter provided */
    HR_ERROR_BACKEND_INIT_FAILED = -2,    /**< Native backend initialization failed */
    HR_ERROR_BACKEND_NOT_ACQUIRED = -3,   /**< Release without a matching acquire */
    HR_ERROR_UNKNOWN = -999               /**< Unknown error */
} hr_error_t;

/**
 * @brief Get human-readable error message for error code
 * @param error Error code
 * @return Error message string
 */
HR_API const char* hr_error_string(hr_error_t error);

/**
 * @brief Get the message of the most recent failed API call on this thread
 *
 * Each thread has its own message. The pointer stays valid until the same
 * thread makes another failing call or exits.
 *
 * @return Message string (empty if nothing failed yet on this thread)
 */
HR_API const char* hr_get_last_error(void);

/* ============================================================================
 * NUMA Strategy
 * ========================================================================= */

/**
 * @brief Hardware memory-affinity policy handed to llama.cpp at init
 *
 * Values match ggml_numa_strategy. More values may be added; keep a
 * default case when switching on this type.
 */
typedef enum {
    HR_NUMA_DISABLE = 0,     /**< No NUMA handling */
    HR_NUMA_DISTRIBUTE = 1,  /**< Spread threads across all nodes */
    HR_NUMA_ISOLATE = 2,     /**< Keep threads on the node the process started on */
    HR_NUMA_NUMACTL = 3,     /**< Use the CPU map provided by numactl */
    HR_NUMA_MIRROR = 4,      /**< Mirror model data on each node */
    HR_NUMA_COUNT = 5        /**< Number of strategies */
} hr_numa_strategy_t;

/**
 * @brief Get the name of a NUMA strategy
 * @param strategy Strategy value
 * @return Lowercase name, or "unknown"
 */
HR_API const char* hr_numa_strategy_name(hr_numa_strategy_t strategy);

/* ============================================================================
 * Logging
 * ========================================================================= */

typedef enum {
    HR_LOG_DEBUG = 0,
    HR_LOG_INFO = 1,
    HR_LOG_WARN = 2,
    HR_LOG_ERROR = 3,
    HR_LOG_NONE = 4          /**< As a threshold: drop everything */
} hr_log_level_t;

/**
 * @brief Log sink function type
 *
 * Receives fully formatted text, including llama.cpp output prefixed with
 * "[llama] ". The sink is called with no log lock held and may run on
 * several threads at once. A call already under way on another thread may
 * still reach the previous sink after hr_log_set_callback() returns.
 *
 * Lines prefixed with "[hearth] " are delivered with no lifecycle or API
 * lock held, so the sink may call hr_backend_ref_count() and
 * hr_backend_is_initialized() for them. "[llama] " lines can arrive while
 * the backend is being brought up or torn down; the sink must not call into
 * Hearth for those. A sink must never acquire or release the backend.
 *
 * @param level Message level
 * @param text Message text
 * @param user_data User-provided data pointer
 */
typedef void (*hr_log_callback)(hr_log_level_t level, const char* text, void* user_data);

/**
 * @brief Replace the log sink
 * @param callback Sink function (NULL restores the default stderr sink)
 * @param user_data User data to pass to the sink
 */
HR_API void hr_log_set_callback(hr_log_callback callback, void* user_data);

/**
 * @brief Set the minimum level that reaches the sink
 * @param level Threshold (HR_LOG_NONE silences all output)
 * @return HR_SUCCESS, or HR_ERROR_INVALID_PARAM for an out-of-range level
 */
HR_API hr_error_t hr_set_log_level(hr_log_level_t level);

/**
 * @brief Get the current log threshold
 */
HR_API hr_log_level_t hr_get_log_level(void);

/**
 * @brief Enable or disable verbose logging
 * @param enable true for debug output, false for warnings and errors only
 */
HR_API void hr_set_verbose(bool enable);

/* ============================================================================
 * Configuration
 * ========================================================================= */

/**
 * @brief Backend configuration
 *
 * Applied to the next backend initialization. A backend that is already
 * live keeps the strategy it was started with.
 */
typedef struct {
    /** NUMA strategy used when the backend is initialized */
    hr_numa_strategy_t numa;

    /** Log threshold */
    hr_log_level_t log_level;

    /** Reserved for future use - must be NULL, rejected otherwise */
    void* reserved;
} hr_backend_config;

/**
 * @brief Get default configuration
 * @param config Pointer to config structure to fill
 */
HR_API void hr_backend_config_default(hr_backend_config* config);

/**
 * @brief Apply configuration
 * @param config Configuration to apply
 * @return Error code (HR_SUCCESS on success); HR_ERROR_INVALID_PARAM for
 *         NULL, an unknown strategy or level, or a non-NULL reserved field
 */
HR_API hr_error_t hr_backend_configure(const hr_backend_config* config);

/* ============================================================================
 * Backend Lifecycle
 * ========================================================================= */

/**
 * @brief Acquire one reference to the llama.cpp backend
 *
 * Initializes the backend if no reference exists yet. Each successful call
 * must be balanced by one hr_backend_release().
 *
 * @return HR_SUCCESS, or HR_ERROR_BACKEND_INIT_FAILED
 */
HR_API hr_error_t hr_backend_acquire(void);

/**
 * @brief Acquire a reference, initializing with the given NUMA strategy
 *
 * The strategy only takes effect if this call initializes the backend.
 *
 * @param strategy NUMA strategy
 * @return HR_SUCCESS, HR_ERROR_INVALID_PARAM or HR_ERROR_BACKEND_INIT_FAILED
 */
HR_API hr_error_t hr_backend_acquire_with_numa(hr_numa_strategy_t strategy);

/**
 * @brief Release one reference taken with hr_backend_acquire()
 *
 * Frees the backend when the last reference in the process goes away.
 *
 * @return HR_SUCCESS, or HR_ERROR_BACKEND_NOT_ACQUIRED if this caller holds
 *         no reference
 */
HR_API hr_error_t hr_backend_release(void);

/**
 * @brief Number of live references, from C and C++ callers together
 */
HR_API size_t hr_backend_ref_count(void);

/**
 * @brief Check whether the llama.cpp backend is currently initialized
 */
HR_API bool hr_backend_is_initialized(void);

#ifdef __cplusplus
}
#endif

#endif /* HEARTH_H */
