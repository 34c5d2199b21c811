/**
 * @file platform.cpp
 * @brief OS queries behind relayhub::platform.
 */
#include "rlh_base.hpp"
#include "relayhub_version.h"

#include <filesystem>
#include <functional>
#include <thread>
#include <vector>

#if defined(RELAYHUB_IS_POSIX)
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(RELAYHUB_PLATFORM_APPLE)
#include <mach-o/dyld.h>
#include <pthread.h>
#endif

namespace relayhub::platform
{

namespace
{
// Absolute path of the running binary; empty when the OS will not say.
std::string executable_path()
{
#if defined(RELAYHUB_PLATFORM_WIN64)
    std::vector<char> buf(MAX_PATH);
    for (;;)
    {
        const DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
            return {};
        if (len < buf.size() - 1)
            return std::string(buf.data(), len);
        buf.resize(buf.size() * 2);
    }
#elif defined(RELAYHUB_PLATFORM_APPLE)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buf(size + 1);
    if (_NSGetExecutablePath(buf.data(), &size) != 0)
        return {};
    char resolved[PATH_MAX];
    return realpath(buf.data(), resolved) != nullptr ? resolved : buf.data();
#elif defined(RELAYHUB_IS_POSIX)
    for (size_t cap = PATH_MAX;; cap *= 2)
    {
        std::vector<char> buf(cap);
        const ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size());
        if (n < 0)
            return {};
        if (static_cast<size_t>(n) < buf.size())
            return std::string(buf.data(), static_cast<size_t>(n));
    }
#else
    return {};
#endif
}
} // namespace

uint64_t get_pid()
{
#if defined(RELAYHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(::getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(RELAYHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(RELAYHUB_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(RELAYHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        const std::string path = executable_path();
        if (path.empty())
            return "unknown";
        return include_path ? path : std::filesystem::path(path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: cannot determine executable name: {}\n", e.what());
        return "unknown";
    }
}

const char *get_version_string() noexcept
{
    return RELAYHUB_VERSION_STRING;
}

} // namespace relayhub::platform
