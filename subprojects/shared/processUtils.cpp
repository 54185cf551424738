#include "processUtils.hpp"
#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

void ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(__APPLE__)
    pthread_setname_np(name.substr(0, 63).c_str());
#elif defined(__linux__)
    // Linux limits names to 16 bytes including NUL; longer names make the call fail
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#else
    (void)name;
#endif
}
