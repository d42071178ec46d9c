#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>

typedef int32_t loopy_status_t;
typedef uint32_t loopy_ump_t;
typedef int64_t loopy_timestamp_t;

namespace loopy {
    typedef std::chrono::steady_clock Clock;
    typedef Clock::time_point TimePoint;
    typedef std::chrono::nanoseconds Nanoseconds;

    constexpr uint8_t MIDI_CHANNEL_COUNT = 16;
    constexpr uint8_t MIDI_DATA_MAX = 127;

    inline void setCurrentThreadNameIfPossible(const char* threadName);
}

#if __APPLE__ || defined(__unix__)
#include <pthread.h>
#endif

inline void loopy::setCurrentThreadNameIfPossible(const char* threadName) {
#if __APPLE__
    pthread_setname_np(threadName);
#elif defined(__unix__)
    pthread_setname_np(pthread_self(), threadName);
#else
    (void) threadName;
#endif
}
