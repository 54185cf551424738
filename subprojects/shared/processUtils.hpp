#pragma once
#include <string>

/**
 * \brief Thread helpers for the background loops.
 * \details Accept and receive loops name their threads so they can be told
 * apart in debuggers and `top -H`.
 */
class ProcessUtils {
public:
    // Set current thread name (best-effort, truncated to the platform limit)
    static void set_current_thread_name(const std::string& name);
};
