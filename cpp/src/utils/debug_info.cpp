/**
 * @file debug_info.cpp
 * @brief relayhub::debug::print_stack_trace().
 */
#include "rlh_base.hpp"

#if defined(RELAYHUB_IS_POSIX)
#include <cstdint>
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace relayhub::debug
{

namespace
{
#if defined(RELAYHUB_IS_POSIX)
std::string demangled(const char *mangled)
{
    if (mangled == nullptr)
        return "??";
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> name(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    return (status == 0 && name) ? std::string(name.get()) : std::string(mangled);
}

void print_frame(int index, void *pc)
{
    const auto addr = reinterpret_cast<uintptr_t>(pc);
    Dl_info info{};
    if (dladdr(pc, &info) == 0)
    {
        fmt::print(stderr, "  #{:02} 0x{:016x}\n", index, addr);
        return;
    }
    const auto offset = addr - reinterpret_cast<uintptr_t>(info.dli_fbase);
    fmt::print(stderr, "  #{:02} {} + 0x{:x} [{}]\n", index, demangled(info.dli_sname), offset,
               format_tools::filename_only(info.dli_fname != nullptr ? info.dli_fname : "?"));
}
#endif
} // namespace

void print_stack_trace() noexcept
{
    try
    {
        fmt::print(stderr, "Stack trace (most recent call first):\n");
#if defined(RELAYHUB_IS_POSIX)
        constexpr int kMaxFrames = 64;
        void *frames[kMaxFrames];
        const int depth = ::backtrace(frames, kMaxFrames);
        // Frame 0 is this function.
        for (int i = 1; i < depth; ++i)
            print_frame(i, frames[i]);
        if (depth <= 1)
            fmt::print(stderr, "  (no frames)\n");
#else
        fmt::print(stderr, "  (stack traces are not supported on this platform)\n");
#endif
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "stack trace failed: %s\n", e.what());
    }
    std::fflush(stderr);
}

} // namespace relayhub::debug
