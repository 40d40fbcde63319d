#pragma once

#include "hearth.h"
#include "llama.h"

namespace hearth {

// printf-style; the line is prefixed with "[hearth] " and newline terminated.
// Never throws. Long messages are delivered whole; if that memory cannot be
// had, the line is cut and ends in "...".
void log_printf(hr_log_level_t level, const char* fmt, ...) noexcept;

// Sink for llama_log_set(). GGML_LOG_LEVEL_CONT continues the previous line
// logged by llama.cpp on the same thread.
void log_native_message(enum ggml_log_level level, const char* text, void* user_data) noexcept;

void log_set_sink(hr_log_callback callback, void* user_data);
void log_set_level(hr_log_level_t level);
hr_log_level_t log_get_level();

}  // namespace hearth

#define HR_LOGD(...) ::hearth::log_printf(HR_LOG_DEBUG, __VA_ARGS__)
#define HR_LOGI(...) ::hearth::log_printf(HR_LOG_INFO, __VA_ARGS__)
#define HR_LOGW(...) ::hearth::log_printf(HR_LOG_WARN, __VA_ARGS__)
#define HR_LOGE(...) ::hearth::log_printf(HR_LOG_ERROR, __VA_ARGS__)
