#pragma once

#include <stdexcept>
#include <string>

namespace meetcapture {

enum class ErrorCode {
    PermissionDenied,
    DeviceNotFound,
    NoAudioSourcesAvailable,
    EncoderUnavailable,
    EncodeFrameFailed,
    TrackReaderFailed,
    AlreadyActive,
    InvalidConfig,
    InvalidChunk,
    SerializationError
};

const char* ToString(ErrorCode code);

class RecorderError : public std::runtime_error {
public:
    RecorderError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , _code(code) {}

    ErrorCode Code() const { return _code; }

private:
    ErrorCode _code;
};

} // namespace meetcapture
