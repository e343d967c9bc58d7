#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "../Events/EventSink.hpp"
#include "UploadPayload.hpp"

namespace meetcapture {

// Writes every chunk the way the uploader would send it: the serialized
// frames as <timestamp>_<sequence>.opus and the form fields in a JSON
// sidecar. The sequence keeps chunks flushed in the same millisecond apart.
class ChunkFileWriter : public IRecordingEventSink {
public:
    ChunkFileWriter(const std::filesystem::path& outputDir, UploadIdentity identity);

    void OnChunk(const Chunk& chunk) override;
    void OnError(const ErrorEvent& error) override;
    void OnComplete(size_t totalChunks) override;

    size_t WrittenChunks() const;

    static std::string ChunkFileName(int64_t timestampMs, size_t sequence);

private:
    std::filesystem::path _outputDir;
    UploadIdentity _identity;
    mutable std::mutex _mutex;
    size_t _sequence;
};

} // namespace meetcapture
