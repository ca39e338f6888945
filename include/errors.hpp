#pragma once

#include <stdexcept>
#include <string>

namespace clipshelf {

enum class ErrorKind {
    NOT_FOUND,
    DECODE,
    INVALID_ARGUMENT,
    INVALID_STATE,
    STORAGE,
    AUDIO_DEVICE
};

class Error : public std::runtime_error {
private:
    ErrorKind m_kind;

public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }
};

// Referenced path has no file or no metadata record.
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(ErrorKind::NOT_FOUND, message) {}
};

// File carries a .wav extension but its payload cannot be parsed.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error(ErrorKind::DECODE, message) {}
};

class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& message)
        : Error(ErrorKind::INVALID_ARGUMENT, message) {}
};

// Playback operation not allowed in the current state.
class InvalidState : public Error {
public:
    explicit InvalidState(const std::string& message)
        : Error(ErrorKind::INVALID_STATE, message) {}
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error(ErrorKind::STORAGE, message) {}
};

class AudioDeviceError : public Error {
public:
    explicit AudioDeviceError(const std::string& message)
        : Error(ErrorKind::AUDIO_DEVICE, message) {}
};

const char* error_kind_name(ErrorKind kind);

}
