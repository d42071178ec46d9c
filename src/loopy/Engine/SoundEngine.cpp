#include "loopy/loopy.hpp"

namespace loopy {

    const char* toString(SoundEngineStatus status) {
        switch (status) {
            case SoundEngineStatus::OK: return "OK";
            case SoundEngineStatus::INVALID_ARGUMENT: return "invalid argument";
            case SoundEngineStatus::QUEUE_FULL: return "queue full";
            case SoundEngineStatus::BACKEND_UNAVAILABLE: return "backend unavailable";
        }
        return "unknown";
    }

}
