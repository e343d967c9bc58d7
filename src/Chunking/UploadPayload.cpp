#include "UploadPayload.hpp"
#include "../common/RecorderError.hpp"
#include "FrameSerializer.hpp"

namespace meetcapture {

const std::string* UploadPayload::Field(const std::string& name) const {
    for (const auto& field : fields) {
        if (field.first == name) {
            return &field.second;
        }
    }
    return nullptr;
}

UploadPayload BuildUploadPayload(const Chunk& chunk, const UploadIdentity& identity) {
    if (chunk.frames.empty()) {
        throw RecorderError(ErrorCode::InvalidChunk, "No audio frames in chunk");
    }

    UploadPayload payload;
    payload.body = SerializeFrames(chunk.frames);
    if (payload.body.empty()) {
        throw RecorderError(ErrorCode::InvalidChunk, "Failed to prepare audio payload");
    }

    const std::string timestamp = std::to_string(chunk.timestampMs);
    payload.fileName = timestamp + ".opus";
    payload.fields = {
        {"source", identity.source},
        {"device_id", identity.deviceId},
        {"remote_id", identity.remoteId},
        {"app_version", identity.appVersion},
        {"timestamp", timestamp},
        {"is_opus", "true"},
        {"is_bytes", "true"},
    };
    return payload;
}

SessionEvent MakeSessionEvent(const std::string& event, int64_t timestamp) {
    SessionEvent result;
    result.event = event;
    result.timestamp = timestamp;
    return result;
}

nlohmann::json ToJson(const UploadPayload& payload) {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& field : payload.fields) {
        fields[field.first] = field.second;
    }
    return {
        {"file_name", payload.fileName},
        {"content_type", payload.contentType},
        {"size", payload.body.size()},
        {"fields", fields},
    };
}

nlohmann::json ToJson(const SessionEvent& event) {
    return {{"timestamp", event.timestamp}, {"event", event.event}};
}

} // namespace meetcapture
