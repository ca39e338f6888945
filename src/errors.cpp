#include "errors.hpp"

namespace clipshelf {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "not found";
        case ErrorKind::DECODE: return "decode error";
        case ErrorKind::INVALID_ARGUMENT: return "invalid argument";
        case ErrorKind::INVALID_STATE: return "invalid state";
        case ErrorKind::STORAGE: return "storage error";
        case ErrorKind::AUDIO_DEVICE: return "audio device error";
    }
    return "error";
}

}
