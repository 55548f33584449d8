#include "trl_platform.hpp"

#include <chrono>
#include <functional>
#include <thread>

#include <unistd.h>
#if defined(TESTRELAY_PLATFORM_LINUX)
#include <sys/syscall.h>
#elif defined(TESTRELAY_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace testrelay::platform
{

uint64_t get_pid() noexcept
{
    return static_cast<uint64_t>(::getpid());
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`pthread_threadid_np`,
 *          `syscall(SYS_gettid)`), falling back to hashing std::thread::id.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(TESTRELAY_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(TESTRELAY_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_hostname()
{
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0)
    {
        return "unknown";
    }
    return std::string(buf);
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace testrelay::platform
