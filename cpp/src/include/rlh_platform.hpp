#pragma once
/**
 * @file rlh_platform.hpp
 * @brief Layer 0: platform macros and the few OS queries relayhub needs.
 *
 * Defines RELAYHUB_PLATFORM_{WIN64,APPLE,FREEBSD,LINUX} and RELAYHUB_IS_POSIX or
 * RELAYHUB_IS_WINDOWS. A PLATFORM_* macro from the build wins over compiler detection.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_LINUX) &&            \
                                !defined(PLATFORM_FREEBSD) && defined(_WIN64))
#define RELAYHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define RELAYHUB_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define RELAYHUB_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define RELAYHUB_PLATFORM_LINUX 1
#else
#define RELAYHUB_PLATFORM_UNKNOWN 1
#endif

#if defined(RELAYHUB_PLATFORM_WIN64)
#define RELAYHUB_IS_WINDOWS 1
#elif defined(RELAYHUB_PLATFORM_APPLE) || defined(RELAYHUB_PLATFORM_FREEBSD) ||                    \
    defined(RELAYHUB_PLATFORM_LINUX)
#define RELAYHUB_IS_POSIX 1
#endif

// MSVC reports the standard in _MSVC_LANG unless /Zc:__cplusplus is given.
#if defined(_MSC_VER)
#define RELAYHUB_CPLUSPLUS _MSVC_LANG
#else
#define RELAYHUB_CPLUSPLUS __cplusplus
#endif
#if RELAYHUB_CPLUSPLUS < 202002L
#error "relayhub needs C++20"
#endif

#include "relayhub_utils_export.h"

namespace relayhub::platform
{

/// Kernel thread id (gettid on Linux), as printed in log lines.
RELAYHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/// Also the default process identity of a channel member.
RELAYHUB_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief File name of the running executable, or its absolute path with @p include_path.
 * @return "unknown" when the platform query fails.
 */
RELAYHUB_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/// "major.minor.patch" of this build, from the CMake project version.
RELAYHUB_UTILS_EXPORT const char *get_version_string() noexcept;

} // namespace relayhub::platform
