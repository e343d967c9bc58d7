#include "ChunkFileWriter.hpp"
#include "../Events/EventJson.hpp"
#include "../common/RecorderError.hpp"

#include <chrono>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace meetcapture {

ChunkFileWriter::ChunkFileWriter(const fs::path& outputDir, UploadIdentity identity)
    : _outputDir(outputDir)
    , _identity(std::move(identity))
    , _sequence(0) {}

std::string ChunkFileWriter::ChunkFileName(int64_t timestampMs, size_t sequence) {
    return std::to_string(timestampMs) + "_" + std::to_string(sequence) + ".opus";
}

void ChunkFileWriter::OnChunk(const Chunk& chunk) {
    std::lock_guard<std::mutex> lock(_mutex);
    try {
        UploadPayload payload = BuildUploadPayload(chunk, _identity);
        const fs::path audioPath = _outputDir / ChunkFileName(chunk.timestampMs, _sequence + 1);
        std::ofstream audio(audioPath, std::ios::binary);
        audio.write(reinterpret_cast<const char*>(payload.body.data()),
                    static_cast<std::streamsize>(payload.body.size()));
        if (!audio) {
            std::cerr << "Failed to write " << audioPath << std::endl;
            return;
        }
        ++_sequence;

        nlohmann::json sidecar = {{"upload", ToJson(payload)}, {"chunk", ChunkMetadata(chunk)}};
        std::ofstream meta(fs::path(audioPath).replace_extension(".json"));
        meta << sidecar.dump(2) << std::endl;

        std::cout << "[CHUNK] " << audioPath.filename().string() << " (" << ToString(chunk.reason) << ", "
                  << chunk.frames.size() << " frames, " << chunk.totalBytes << " bytes)" << std::endl;
    } catch (const RecorderError& e) {
        std::cerr << "Skipping chunk: " << e.what() << std::endl;
    }
}

void ChunkFileWriter::OnError(const ErrorEvent& error) {
    std::cerr << "[ERROR] " << ToString(error.code) << ": " << error.message << std::endl;
}

void ChunkFileWriter::OnComplete(size_t totalChunks) {
    const int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    SessionEvent event = MakeSessionEvent("end", now);
    std::ofstream out(_outputDir / ("session_" + std::to_string(now) + ".json"));
    out << ToJson(event).dump(2) << std::endl;
    std::cout << "[COMPLETE] " << totalChunks << " chunks" << std::endl;
}

size_t ChunkFileWriter::WrittenChunks() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _sequence;
}

} // namespace meetcapture
