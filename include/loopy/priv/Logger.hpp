#pragma once

#include <cstdarg>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace loopy {

    // Realtime-safe logger. Messages are formatted into a fixed-size lock-free queue
    // and handed to the callbacks by a background thread, so it can be used on the
    // playback thread.
    class Logger {
    public:
#undef ERROR
        enum LogLevel {
            DIAGNOSTIC,
            INFO,
            WARNING,
            ERROR
        };

        typedef std::function<void(LogLevel level, size_t serial, const char* message)> Callback;

        static Logger* global();
        // Flushes and stops the background thread. Call once, at process exit.
        static void stopDefaultLogger();

        // Messages below this level are not printed by the default stderr callback.
        // Other callbacks still receive everything.
        static void minimumLevel(LogLevel level);
        static LogLevel minimumLevel();

        Logger();

        void addCallback(Callback callback);
        // Invoked on the logger thread.
        void dispatch(LogLevel level, size_t serial, const char* message) const;

        void log(LogLevel level, const char* format, ...);
        void logv(LogLevel level, const char* format, va_list args);
        void logError(const char* format, ...);
        void logWarning(const char* format, ...);
        void logInfo(const char* format, ...);
        void logDiagnostic(const char* format, ...);

    private:
        mutable std::mutex callbacks_mutex_;
        std::vector<Callback> callbacks_;
    };

}
