#include <array>
#include <atomic>
#include <cstdio>
#include <iostream>
#include <loopy/loopy.hpp>
#include <rtlog/rtlog.h>

namespace loopy {

    namespace {

        constexpr size_t kQueueCapacity = 256;
        constexpr size_t kMessageLength = 512;

        std::atomic<size_t> serial_counter{0};
        std::atomic<int> minimum_level{Logger::INFO};

        struct LogContext {
            Logger::LogLevel level;
            const Logger* logger;
        };

        // the playback thread, MIDI input threads and the control thread all write.
        typedef rtlog::Logger<LogContext, kQueueCapacity, kMessageLength, serial_counter,
                              rtlog::MultiRealtimeWriterQueueType> QueueLogger;
        QueueLogger queue_logger;

        struct Dispatcher {
            Dispatcher() = default;
            Dispatcher(const Dispatcher&) = delete;
            Dispatcher& operator=(const Dispatcher&) = delete;

#if WIN32
            void operator()(const LogContext& context, size_t serial, const char* format, ...)
#else
            void operator()(const LogContext& context, size_t serial, const char* format, ...) __attribute__ ((format (printf, 4, 5)))
#endif
            {
                std::array<char, kMessageLength> text;
                va_list args;
                va_start(args, format);
                vsnprintf(text.data(), text.size(), format, args);
                va_end(args);
                context.logger->dispatch(context.level, serial, text.data());
            }
        };

        Dispatcher dispatcher;

        rtlog::LogProcessingThread<QueueLogger, Dispatcher>& processingThread() {
            static rtlog::LogProcessingThread thread(queue_logger, dispatcher, std::chrono::milliseconds(10));
            return thread;
        }

        char levelMark(Logger::LogLevel level) {
            switch (level) {
                case Logger::DIAGNOSTIC: return 'D';
                case Logger::INFO: return 'I';
                case Logger::WARNING: return 'W';
                case Logger::ERROR: return 'E';
            }
            return '?';
        }

        void printToStderr(Logger::LogLevel level, size_t serial, const char* message) {
            if (level < minimum_level.load(std::memory_order_relaxed))
                return;
            std::cerr << "[loopy #" << serial << " (" << levelMark(level) << ")]: " << message << std::endl;
        }
    }

    Logger::Logger() {
        addCallback(printToStderr);
    }

    Logger* Logger::global() {
        static Logger instance{};
        // started on first use so that nothing runs before main() needs it.
        processingThread();
        return &instance;
    }

    void Logger::stopDefaultLogger() {
        processingThread().Stop();
    }

    void Logger::minimumLevel(LogLevel level) {
        minimum_level.store(level, std::memory_order_relaxed);
    }

    Logger::LogLevel Logger::minimumLevel() {
        return static_cast<LogLevel>(minimum_level.load(std::memory_order_relaxed));
    }

    void Logger::addCallback(Callback callback) {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks_.push_back(std::move(callback));
    }

    void Logger::dispatch(LogLevel level, size_t serial, const char* message) const {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        for (auto& callback : callbacks_)
            callback(level, serial, message);
    }

    void Logger::logv(LogLevel level, const char* format, va_list args) {
        queue_logger.Logv(LogContext{level, this}, format, args);
    }

    void Logger::log(LogLevel level, const char* format, ...) {
        va_list args;
        va_start(args, format);
        logv(level, format, args);
        va_end(args);
    }

#define LOOPY_DEFINE_LEVEL_LOGGER(LEVEL, NAME) \
    void Logger::log##NAME(const char* format, ...) { \
        va_list args; \
        va_start(args, format); \
        logv(LEVEL, format, args); \
        va_end(args); \
    }

    LOOPY_DEFINE_LEVEL_LOGGER(ERROR, Error)
    LOOPY_DEFINE_LEVEL_LOGGER(WARNING, Warning)
    LOOPY_DEFINE_LEVEL_LOGGER(INFO, Info)
    LOOPY_DEFINE_LEVEL_LOGGER(DIAGNOSTIC, Diagnostic)

#undef LOOPY_DEFINE_LEVEL_LOGGER

}
