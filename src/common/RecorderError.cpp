#include "RecorderError.hpp"

namespace meetcapture {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::DeviceNotFound: return "DeviceNotFound";
        case ErrorCode::NoAudioSourcesAvailable: return "NoAudioSourcesAvailable";
        case ErrorCode::EncoderUnavailable: return "EncoderUnavailable";
        case ErrorCode::EncodeFrameFailed: return "EncodeFrameFailed";
        case ErrorCode::TrackReaderFailed: return "TrackReaderFailed";
        case ErrorCode::AlreadyActive: return "AlreadyActive";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidChunk: return "InvalidChunk";
        case ErrorCode::SerializationError: return "SerializationError";
    }
    return "Unknown";
}

} // namespace meetcapture
