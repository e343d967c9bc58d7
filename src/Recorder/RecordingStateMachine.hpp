#pragma once

namespace meetcapture {

enum class RecordingState {
    Idle,
    Recording,
    Paused,
    Stopped
};

inline const char* ToString(RecordingState state) {
    switch (state) {
        case RecordingState::Idle: return "idle";
        case RecordingState::Recording: return "recording";
        case RecordingState::Paused: return "paused";
        case RecordingState::Stopped: return "stopped";
    }
    return "unknown";
}

// Idle -> Recording -> {Paused <-> Recording} -> Stopped. Stopped behaves
// like Idle for the next start. Not thread-safe; the owner locks.
class RecordingStateMachine {
public:
    RecordingState State() const { return _state; }

    bool CanStart() const { return _state == RecordingState::Idle || _state == RecordingState::Stopped; }
    bool IsActive() const { return _state == RecordingState::Recording || _state == RecordingState::Paused; }

    bool BeginRecording() {
        if (!CanStart()) {
            return false;
        }
        _state = RecordingState::Recording;
        return true;
    }

    bool Pause() {
        if (_state != RecordingState::Recording) {
            return false;
        }
        _state = RecordingState::Paused;
        return true;
    }

    bool Resume() {
        if (_state != RecordingState::Paused) {
            return false;
        }
        _state = RecordingState::Recording;
        return true;
    }

    // Returns false if there was no active session to stop.
    bool Stop() {
        const bool wasActive = IsActive();
        _state = RecordingState::Stopped;
        return wasActive;
    }

    void Reset() { _state = RecordingState::Idle; }

private:
    RecordingState _state = RecordingState::Idle;
};

} // namespace meetcapture
