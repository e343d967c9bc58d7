#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../common/Types.hpp"

namespace meetcapture {

struct UploadIdentity {
    std::string source = "meetcapture";
    std::string deviceId;
    std::string remoteId;
    std::string appVersion = "1.0.0";
};

// Multipart upload of one chunk. Form fields keep their insertion order.
struct UploadPayload {
    std::vector<uint8_t> body;
    std::string fileName;
    std::string contentType = "audio/opus";
    std::vector<std::pair<std::string, std::string>> fields;

    const std::string* Field(const std::string& name) const;
};

struct SessionEvent {
    int64_t timestamp = 0;
    std::string event;
};

// Throws RecorderError(InvalidChunk) for a chunk without frames or with an
// empty body.
UploadPayload BuildUploadPayload(const Chunk& chunk, const UploadIdentity& identity);

SessionEvent MakeSessionEvent(const std::string& event, int64_t timestamp);

nlohmann::json ToJson(const UploadPayload& payload);
nlohmann::json ToJson(const SessionEvent& event);

} // namespace meetcapture
