/**
 * @file hearth_backend.h
 * @brief Hearth - C++ backend handle
 *
 * Any object that needs llama.cpp to be initialized (a model, a context, a
 * sampler chain) holds a hearth::BackendRef for its whole lifetime. The
 * backend is initialized when the first handle is created and freed when
 * the last handle goes away.
 */

#ifndef HEARTH_BACKEND_H
#define HEARTH_BACKEND_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hearth {

/**
 * Hardware memory-affinity policy handed to llama.cpp at initialization.
 *
 * More strategies may be added later; keep a default case when switching.
 */
enum class NumaStrategy {
    Disable,
    Distribute,
    Isolate,
    Numactl,
    Mirror,
    Count,
};

const char* numa_strategy_name(NumaStrategy strategy);

/**
 * Process-wide backend settings, read at each backend initialization.
 */
struct BackendConfig {
    NumaStrategy numa = NumaStrategy::Distribute;
};

// Takes effect at the next initialization; a live backend is not touched.
void configure_backend(const BackendConfig& config);
BackendConfig backend_config();

/**
 * Thrown when the native backend could not be brought up.
 */
class BackendInitError : public std::runtime_error {
public:
    explicit BackendInitError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * One unit of ownership of the llama.cpp backend.
 *
 * Copying a handle takes another unit; moving transfers it. A copy mirrors
 * its source: copying or assigning from a released or moved-from handle
 * yields a handle that holds nothing, and assigning one over a holding
 * handle gives that unit back. The unit is given back by release() or by
 * the destructor, whichever runs first.
 */
class BackendRef {
public:
    /** Acquire, initializing with the configured NUMA strategy if needed. */
    BackendRef();

    /** Acquire, initializing with @p numa if this call starts the backend. */
    explicit BackendRef(NumaStrategy numa);

    BackendRef(const BackendRef& other);
    BackendRef(BackendRef&& other) noexcept;
    BackendRef& operator=(const BackendRef& other);
    BackendRef& operator=(BackendRef&& other) noexcept;
    ~BackendRef();

    /** Give the unit back early. No-op if already released or moved from. */
    void release() noexcept;

    bool held() const noexcept { return held_; }

    /** Live units across the process, including those of C API callers. */
    static size_t ref_count();
    static bool initialized();

private:
    bool held_;
};

} // namespace hearth

#endif // HEARTH_BACKEND_H
