#include "FrameSerializer.hpp"
#include "../common/RecorderError.hpp"

#include <limits>
#include <string>

namespace meetcapture {

std::vector<uint8_t> SerializeFrames(const std::vector<CompressedFrame>& frames) {
    size_t total = 0;
    for (const auto& frame : frames) {
        total += 4 + frame.Size();
    }

    std::vector<uint8_t> out;
    out.reserve(total);
    for (const auto& frame : frames) {
        if (frame.Size() > std::numeric_limits<uint32_t>::max()) {
            throw RecorderError(ErrorCode::SerializationError, "Frame too large to serialize");
        }
        const uint32_t length = static_cast<uint32_t>(frame.Size());
        out.push_back(static_cast<uint8_t>((length >> 24) & 0xff));
        out.push_back(static_cast<uint8_t>((length >> 16) & 0xff));
        out.push_back(static_cast<uint8_t>((length >> 8) & 0xff));
        out.push_back(static_cast<uint8_t>(length & 0xff));
        out.insert(out.end(), frame.data.begin(), frame.data.end());
    }
    return out;
}

std::vector<CompressedFrame> DeserializeFrames(const std::vector<uint8_t>& bytes) {
    std::vector<CompressedFrame> frames;
    size_t offset = 0;
    while (offset < bytes.size()) {
        if (bytes.size() - offset < 4) {
            throw RecorderError(ErrorCode::SerializationError,
                                "Truncated length prefix at offset " + std::to_string(offset));
        }
        const uint32_t length = (static_cast<uint32_t>(bytes[offset]) << 24) |
                                (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
                                (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
                                static_cast<uint32_t>(bytes[offset + 3]);
        offset += 4;
        if (bytes.size() - offset < length) {
            throw RecorderError(ErrorCode::SerializationError,
                                "Truncated frame: expected " + std::to_string(length) + " bytes, have " +
                                    std::to_string(bytes.size() - offset));
        }
        CompressedFrame frame;
        frame.data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                          bytes.begin() + static_cast<std::ptrdiff_t>(offset + length));
        frames.push_back(std::move(frame));
        offset += length;
    }
    return frames;
}

} // namespace meetcapture
