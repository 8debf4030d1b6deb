#pragma once

/// Cross-platform logging macros for the pagination engine.
/// Android: uses __android_log_print
/// Other platforms: uses fprintf(stderr, ...)
/// CP_LOGD is compiled out unless CELLPRESS_DEBUG_LOG is defined.

#ifdef __ANDROID__

#include <android/log.h>

#define CP_LOG_TAG "Cellpress"
#ifdef CELLPRESS_DEBUG_LOG
#define CP_LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, CP_LOG_TAG, __VA_ARGS__)
#else
#define CP_LOGD(...) ((void)0)
#endif
#define CP_LOGI(...) __android_log_print(ANDROID_LOG_INFO,  CP_LOG_TAG, __VA_ARGS__)
#define CP_LOGW(...) __android_log_print(ANDROID_LOG_WARN,  CP_LOG_TAG, __VA_ARGS__)

#else

#include <cstdio>

#ifdef CELLPRESS_DEBUG_LOG
#define CP_LOGD(fmt, ...) fprintf(stderr, "[Cellpress D] " fmt "\n", ##__VA_ARGS__)
#else
#define CP_LOGD(fmt, ...) ((void)0)
#endif
#define CP_LOGI(fmt, ...) fprintf(stderr, "[Cellpress I] " fmt "\n", ##__VA_ARGS__)
#define CP_LOGW(fmt, ...) fprintf(stderr, "[Cellpress W] " fmt "\n", ##__VA_ARGS__)

#endif
