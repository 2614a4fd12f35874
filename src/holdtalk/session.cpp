#include "session.hpp"

#include <print>

Session::Session(SampleRing& ring, AudioCapture& capture, uint32_t sample_rate,
                 double min_seconds)
    : ring_(ring), capture_(capture), sample_rate_(sample_rate),
      min_seconds_(min_seconds) {}

Result<void> Session::start_recording() {
    if (state_ != SessionState::Idle) {
        return {};
    }

    ring_.reset();
    auto started = capture_.start();
    if (!started) {
        return started;
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return {};
}

std::vector<int16_t> Session::stop_recording() {
    if (state_ != SessionState::Recording) {
        return {};
    }

    capture_.stop();
    state_ = SessionState::Flushing;

    auto samples = ring_.drain();
    if (ring_.dropped() > 0) {
        std::println(stderr, "session: buffer full, dropped {} samples", ring_.dropped());
    }

    double seconds = static_cast<double>(samples.size()) / sample_rate_;
    if (samples.empty() || seconds < min_seconds_) {
        return {};
    }
    return samples;
}

void Session::set_idle() {
    state_ = SessionState::Idle;
}

double Session::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}
