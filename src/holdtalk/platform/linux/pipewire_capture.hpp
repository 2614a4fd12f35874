#pragma once

#include "config.hpp"
#include "platform/audio_capture.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <pipewire/pipewire.h>

// Records mono S16_LE from a PipeWire source into a SampleRing. The stream
// and its thread loop exist only between start() and stop().
class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(SampleRing& ring, const Config::Audio& settings);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    Result<void> start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    pw_properties* stream_properties() const;
    Result<void> connect_stream();
    void teardown();

    SampleRing& ring_;
    const Config::Audio& settings_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
