/**
 * @file log.cpp
 * @brief Hearth - Logging
 *
 * Level-filtered log output shared by Hearth and llama.cpp. Output goes to
 * logcat on Android and to stderr elsewhere unless a sink is installed with
 * hr_log_set_callback().
 */

#include "log.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <new>
#include <string>

#if defined(__ANDROID__)
#include <android/log.h>
#define LOG_TAG "Hearth"
#endif

namespace hearth {

namespace {

struct LogState {
    std::mutex mutex;
    hr_log_callback callback = nullptr;
    void* user_data = nullptr;
    hr_log_level_t level = HR_LOG_WARN;
};

// Never destroyed: backend handles may still log during static teardown.
LogState& log_state() {
    static LogState* state = new LogState();
    return *state;
}

// Level of the last non-continuation line llama.cpp logged on this thread.
thread_local hr_log_level_t t_last_native_level = HR_LOG_INFO;

void default_sink(hr_log_level_t level, const char* text) {
#if defined(__ANDROID__)
    int priority = ANDROID_LOG_INFO;
    switch (level) {
        case HR_LOG_DEBUG: priority = ANDROID_LOG_DEBUG; break;
        case HR_LOG_INFO: priority = ANDROID_LOG_INFO; break;
        case HR_LOG_WARN: priority = ANDROID_LOG_WARN; break;
        case HR_LOG_ERROR: priority = ANDROID_LOG_ERROR; break;
        default: break;
    }
    __android_log_write(priority, LOG_TAG, text);
#else
    (void)level;
    fputs(text, stderr);
#endif
}

// The sink runs with no Hearth lock held: llama.cpp lines are emitted while
// the lifecycle lock is taken, and a sink on another thread may be querying
// the backend at the same time.
void emit(hr_log_level_t level, const char* text) {
    LogState& state = log_state();
    hr_log_callback callback = nullptr;
    void* user_data = nullptr;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.level == HR_LOG_NONE || level < state.level) {
            return;
        }
        callback = state.callback;
        user_data = state.user_data;
    }

    if (callback) {
        callback(level, text, user_data);
    } else {
        default_sink(level, text);
    }
}

hr_log_level_t from_ggml_level(enum ggml_log_level level) {
    switch (level) {
        case GGML_LOG_LEVEL_DEBUG: return HR_LOG_DEBUG;
        case GGML_LOG_LEVEL_WARN: return HR_LOG_WARN;
        case GGML_LOG_LEVEL_ERROR: return HR_LOG_ERROR;
        case GGML_LOG_LEVEL_INFO:
        case GGML_LOG_LEVEL_NONE:
        default:
            return HR_LOG_INFO;
    }
}

}  // namespace

void log_printf(hr_log_level_t level, const char* fmt, ...) noexcept {
    if (level < log_get_level()) {
        return;
    }

    static const char kPrefix[] = "[hearth] ";
    static const char kCut[] = "...\n";
    const size_t prefix_len = sizeof(kPrefix) - 1;

    char buffer[1024];
    memcpy(buffer, kPrefix, prefix_len);
    // One byte is kept for the trailing newline.
    const size_t room = sizeof(buffer) - prefix_len - 1;

    va_list args;
    va_list again;
    va_start(args, fmt);
    va_copy(again, args);
    const int n = vsnprintf(buffer + prefix_len, room, fmt, args);
    va_end(args);

    if (n < 0) {
        va_end(again);
        return;
    }

    if (static_cast<size_t>(n) < room) {
        buffer[prefix_len + n] = '\n';
        buffer[prefix_len + n + 1] = '\0';
        va_end(again);
        emit(level, buffer);
        return;
    }

    // Longer than the stack buffer: format again at the reported size.
    std::string line;
    try {
        line.assign(prefix_len + static_cast<size_t>(n) + 1, '\0');
    } catch (const std::bad_alloc&) {
        line.clear();
    }
    if (line.empty()) {
        va_end(again);
        memcpy(buffer + sizeof(buffer) - sizeof(kCut), kCut, sizeof(kCut));
        emit(level, buffer);
        return;
    }
    memcpy(&line[0], kPrefix, prefix_len);
    vsnprintf(&line[prefix_len], static_cast<size_t>(n) + 1, fmt, again);
    va_end(again);
    line[prefix_len + n] = '\n';
    emit(level, line.c_str());
}

void log_native_message(enum ggml_log_level level, const char* text, void* /* user_data */) noexcept {
    if (!text) {
        return;
    }

    if (level == GGML_LOG_LEVEL_CONT) {
        emit(t_last_native_level, text);
        return;
    }

    t_last_native_level = from_ggml_level(level);
    try {
        std::string line = "[llama] ";
        line += text;
        emit(t_last_native_level, line.c_str());
    } catch (const std::bad_alloc&) {
        emit(t_last_native_level, text);
    }
}

void log_set_sink(hr_log_callback callback, void* user_data) {
    LogState& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback = callback;
    state.user_data = user_data;
}

void log_set_level(hr_log_level_t level) {
    LogState& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.level = level;
}

hr_log_level_t log_get_level() {
    LogState& state = log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.level;
}

}  // namespace hearth
