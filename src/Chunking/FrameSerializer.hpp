#pragma once

#include <cstdint>
#include <vector>

#include "../common/Types.hpp"

namespace meetcapture {

// Upload framing: for each frame a 4-byte big-endian length followed by the
// frame bytes. No header. An empty list serializes to zero bytes.
std::vector<uint8_t> SerializeFrames(const std::vector<CompressedFrame>& frames);

// Inverse of SerializeFrames. Throws RecorderError(SerializationError) on
// truncated input. Timestamps are not part of the wire format and come back 0.
std::vector<CompressedFrame> DeserializeFrames(const std::vector<uint8_t>& bytes);

} // namespace meetcapture
