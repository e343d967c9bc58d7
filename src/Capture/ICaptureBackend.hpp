#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ICaptureTrack.hpp"

namespace meetcapture {

struct CaptureConstraints {
    bool echoCancellation = false;
    bool noiseSuppression = false;
    bool autoGainControl = false;
    unsigned int sampleRate = 16000;
    unsigned int idealChannels = 2;
    // Empty selects the platform default.
    std::string deviceName;
};

// Platform device layer. Open* either returns the tracks of the opened
// device or throws RecorderError (PermissionDenied / DeviceNotFound).
// Loopback capture may return extra non-audio tracks the platform forces on
// the caller; the caller owns and stops them.
class ICaptureBackend {
public:
    virtual ~ICaptureBackend() = default;

    virtual std::vector<std::shared_ptr<ICaptureTrack>> OpenInput(const CaptureConstraints& constraints) = 0;
    virtual std::vector<std::shared_ptr<ICaptureTrack>> OpenLoopback(const CaptureConstraints& constraints) = 0;
};

} // namespace meetcapture
