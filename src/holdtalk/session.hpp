#pragma once

#include "error.hpp"
#include "platform/audio_capture.hpp"
#include "sample_ring.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

enum class SessionState { Idle, Recording, Flushing };

// One hold-to-release recording cycle. The session owns the capture between
// start_recording() and stop_recording(); nothing else touches the device.
class Session {
public:
    Session(SampleRing& ring, AudioCapture& capture, uint32_t sample_rate,
            double min_seconds);

    // Idle -> Recording. A call in any other state does nothing.
    Result<void> start_recording();

    // Recording -> Flushing. Returns the captured samples, or an empty vector
    // when not recording or when the clip is shorter than min_seconds.
    std::vector<int16_t> stop_recording();

    // Flushing -> Idle, once the samples have been handed off or discarded.
    void set_idle();

    SessionState state() const { return state_; }
    double recording_duration() const;

private:
    SampleRing& ring_;
    AudioCapture& capture_;
    uint32_t sample_rate_;
    double min_seconds_;
    SessionState state_ = SessionState::Idle;
    std::chrono::steady_clock::time_point record_start_;
};
