/**
 * @file backend_lifecycle.cpp
 * @brief Hearth - Shared llama.cpp backend lifecycle
 *
 * The backend is initialized by the first reference and freed by the last
 * one. One mutex covers the reference count and both native transitions, so
 * an initialization can never race a teardown.
 */

#include "backend_lifecycle.h"

#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

#include "log.h"
#include "numa_strategy.h"

namespace hearth {

namespace {

void prepare_backend_environment() {
#if defined(__APPLE__) && defined(HEARTH_METAL_ENABLED)
    // Work around macOS Metal residency-set teardown crashes on some systems.
    // Keep user override if explicitly set in environment.
    if (std::getenv("GGML_METAL_NO_RESIDENCY") == nullptr) {
        setenv("GGML_METAL_NO_RESIDENCY", "1", 0);
    }
#endif
}

/**
 * Existence of a Backend means llama.cpp is initialized. At most one exists,
 * owned by the shared state below.
 */
class Backend {
public:
    Backend(const NativeBackendOps& ops, NumaStrategy numa);
    ~Backend();

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    NumaStrategy numa() const { return numa_; }

private:
    NativeBackendOps ops_;
    NumaStrategy numa_;
};

Backend::Backend(const NativeBackendOps& ops, NumaStrategy numa)
    : ops_(ops)
    , numa_(numa) {
    prepare_backend_environment();

    try {
        ops_.backend_init();
    } catch (const std::exception& e) {
        throw BackendInitError(std::string("llama backend init failed: ") + e.what());
    }

    try {
        ops_.numa_init(numa_strategy_to_native(numa_));
        ops_.log_set(log_native_message, nullptr);
    } catch (const std::exception& e) {
        ops_.backend_free();
        throw BackendInitError(std::string("llama backend setup failed: ") + e.what());
    }
}

Backend::~Backend() {
    ops_.backend_free();
}

struct BackendState {
    std::mutex mutex;

    // Non-null iff count > 0.
    std::unique_ptr<Backend> backend;
    size_t count = 0;

    NativeBackendOps ops = llama_backend_ops();
    BackendConfig config;
    size_t release_violations = 0;
};

// Never destroyed: handles with static storage may be released after
// function-local statics of other translation units are gone.
BackendState& backend_state() {
    static BackendState* state = new BackendState();
    return *state;
}

bool ops_complete(const NativeBackendOps& ops) {
    return ops.backend_init && ops.numa_init && ops.log_set && ops.backend_free;
}

}  // namespace

NativeBackendOps llama_backend_ops() {
    NativeBackendOps ops;
    ops.backend_init = llama_backend_init;
    ops.numa_init = llama_numa_init;
    ops.log_set = llama_log_set;
    ops.backend_free = llama_backend_free;
    return ops;
}

bool set_native_backend_ops(const NativeBackendOps& ops) {
    if (!ops_complete(ops)) {
        HR_LOGE("Native backend ops table has missing entries");
        return false;
    }

    BackendState& state = backend_state();
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.backend) {
            state.ops = ops;
            return true;
        }
    }
    HR_LOGW("Cannot replace native backend ops while the backend is live");
    return false;
}

bool reset_native_backend_ops() {
    return set_native_backend_ops(llama_backend_ops());
}

// Lifecycle lines are logged after the state lock is dropped, so a log sink
// may query the backend. Only llama.cpp's own lines arrive under the lock.
void backend_acquire(const NumaStrategy* numa) {
    BackendState& state = backend_state();
    bool started = false;
    bool conflict = false;
    NumaStrategy running = NumaStrategy::Distribute;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.backend) {
            running = state.backend->numa();
            conflict = numa && *numa != running;
            ++state.count;
        } else {
            running = numa ? *numa : state.config.numa;
            state.backend.reset(new Backend(state.ops, running));
            state.count = 1;
            started = true;
        }
    }

    if (started) {
        HR_LOGI("llama backend initialized (numa: %s)", numa_strategy_name(running));
    } else if (conflict) {
        HR_LOGW("Backend already running with numa strategy %s, ignoring %s",
                numa_strategy_name(running), numa_strategy_name(*numa));
    }
}

bool backend_release() noexcept {
    BackendState& state = backend_state();
    bool live = false;
    bool freed = false;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.backend) {
            live = true;
            if (--state.count == 0) {
                state.backend.reset();
                freed = true;
            }
        } else {
            ++state.release_violations;
        }
    }

    if (!live) {
        HR_LOGE("Backend has already been freed, this should never happen");
        return false;
    }
    if (freed) {
        HR_LOGI("llama backend freed");
    }
    return true;
}

size_t backend_ref_count() {
    BackendState& state = backend_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.count;
}

bool backend_is_initialized() {
    BackendState& state = backend_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.backend != nullptr;
}

size_t backend_release_violations() {
    BackendState& state = backend_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.release_violations;
}

void configure_backend(const BackendConfig& config) {
    BackendState& state = backend_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.config = config;
}

BackendConfig backend_config() {
    BackendState& state = backend_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.config;
}

/* ============================================================================
 * BackendRef
 * ========================================================================= */

BackendRef::BackendRef()
    : held_(false) {
    backend_acquire(nullptr);
    held_ = true;
}

BackendRef::BackendRef(NumaStrategy numa)
    : held_(false) {
    backend_acquire(&numa);
    held_ = true;
}

// Copies mirror the source: a copy of an empty handle is empty.
BackendRef::BackendRef(const BackendRef& other)
    : held_(false) {
    if (other.held_) {
        backend_acquire(nullptr);
        held_ = true;
    }
}

BackendRef::BackendRef(BackendRef&& other) noexcept
    : held_(other.held_) {
    other.held_ = false;
}

BackendRef& BackendRef::operator=(const BackendRef& other) {
    if (other.held_ && !held_) {
        backend_acquire(nullptr);
        held_ = true;
    } else if (!other.held_) {
        release();
    }
    return *this;
}

BackendRef& BackendRef::operator=(BackendRef&& other) noexcept {
    if (this != &other) {
        release();
        held_ = other.held_;
        other.held_ = false;
    }
    return *this;
}

BackendRef::~BackendRef() {
    release();
}

void BackendRef::release() noexcept {
    if (held_) {
        held_ = false;
        backend_release();
    }
}

size_t BackendRef::ref_count() {
    return backend_ref_count();
}

bool BackendRef::initialized() {
    return backend_is_initialized();
}

}  // namespace hearth
