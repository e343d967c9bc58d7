#include "EventJson.hpp"

namespace meetcapture {

nlohmann::json ChunkMetadata(const Chunk& chunk) {
    return {
        {"type", "chunk"},
        {"codec", chunk.codec},
        {"frameCount", chunk.frames.size()},
        {"timestamp", chunk.timestampMs},
        {"reason", ToString(chunk.reason)},
        {"totalBytes", chunk.totalBytes},
        {"sampleRate", chunk.sampleRate},
        {"channels", chunk.channels}
    };
}

nlohmann::json ToJson(const Chunk& chunk) {
    nlohmann::json frames = nlohmann::json::array();
    for (const auto& frame : chunk.frames) {
        frames.push_back(nlohmann::json::binary(frame.data));
    }

    nlohmann::json json = ChunkMetadata(chunk);
    json.erase("frameCount");
    json["chunks"] = std::move(frames);
    return json;
}

nlohmann::json ToJson(const ErrorEvent& error) {
    return {
        {"type", "error"},
        {"error", error.message},
        {"code", ToString(error.code)}
    };
}

nlohmann::json ToJson(const CompleteEvent& complete) {
    return {
        {"type", "complete"},
        {"totalChunks", complete.totalChunks}
    };
}

nlohmann::json ToJson(const RecordingEvent& event) {
    return std::visit([](const auto& value) { return ToJson(value); }, event);
}

std::vector<uint8_t> ToMessagePack(const RecordingEvent& event) {
    return nlohmann::json::to_msgpack(ToJson(event));
}

} // namespace meetcapture
