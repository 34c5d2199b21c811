// tests/test_framework/test_entrypoint.h
#pragma once

#include <string>

/**
 * @file test_entrypoint.h
 * @brief Worker scenario registration for the shared test main().
 */

/// argv[0] of this test binary; IsolatedProcessTest re-executes it to start workers.
extern std::string g_self_exe_path;

/// Handles argv when argv[1] names one of its scenarios. Returns -1 when it does not.
using WorkerDispatchFn = int (*)(int argc, char **argv);

/// Called from a static initializer in each workers/*.cpp file.
void register_worker_dispatcher(WorkerDispatchFn fn);
