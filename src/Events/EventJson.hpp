#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "EventSink.hpp"

namespace meetcapture {

// {type:"chunk", codec, chunks:[bytes...], timestamp, reason, totalBytes, sampleRate, channels}
nlohmann::json ToJson(const Chunk& chunk);
// {type:"error", error, code}
nlohmann::json ToJson(const ErrorEvent& error);
// {type:"complete", totalChunks}
nlohmann::json ToJson(const CompleteEvent& complete);
nlohmann::json ToJson(const RecordingEvent& event);

// Chunk metadata without the frame bytes, for logs and sidecar files.
nlohmann::json ChunkMetadata(const Chunk& chunk);

// Binary-safe encoding of an event for handing to the uploader process.
std::vector<uint8_t> ToMessagePack(const RecordingEvent& event);

} // namespace meetcapture
