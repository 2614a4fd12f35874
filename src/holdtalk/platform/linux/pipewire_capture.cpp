#include "platform/linux/pipewire_capture.hpp"

#include <format>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

static constexpr const char* capture_node_name = "holdtalk-mic";

PipeWireCapture::PipeWireCapture(SampleRing& ring, const Config::Audio& settings)
    : ring_(ring), settings_(settings) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

pw_properties* PipeWireCapture::stream_properties() const {
    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_APP_NAME, "holdtalk",
        PW_KEY_NODE_NAME, capture_node_name,
        nullptr
    );
    // Ask for buffers of about 20 ms so a short tap still yields samples.
    pw_properties_setf(props, PW_KEY_NODE_LATENCY, "%u/%u",
                       settings_.sample_rate / 50, settings_.sample_rate);
    if (!settings_.source.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, settings_.source.c_str());
    }
    return props;
}

Result<void> PipeWireCapture::connect_stream() {
    uint8_t pod_storage[1024];
    spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_storage, sizeof(pod_storage));
    spa_audio_info_raw format = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = settings_.sample_rate,
        .channels = 1
    );
    const spa_pod* params[] = {
        spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &format),
    };

    auto flags = static_cast<pw_stream_flags>(
        PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS);
    int ret = pw_stream_connect(stream_, PW_DIRECTION_INPUT, PW_ID_ANY, flags, params, 1);
    if (ret < 0) {
        return make_error(ErrorKind::Device,
                          std::format("cannot connect to source '{}': {}",
                                      settings_.source.empty() ? "default" : settings_.source,
                                      spa_strerror(ret)));
    }
    return {};
}

Result<void> PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    loop_ = pw_thread_loop_new("holdtalk-audio", nullptr);
    if (!loop_) {
        return make_error(ErrorKind::Device, "failed to create PipeWire thread loop");
    }

    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_), capture_node_name,
                                   stream_properties(), &stream_events_, this);
    if (!stream_) {
        teardown();
        return make_error(ErrorKind::Device, "failed to create PipeWire stream");
    }

    // Samples left over from an earlier session must not reach this one.
    ring_.reset();
    capturing_.store(true, std::memory_order_release);

    auto connected = connect_stream();
    if (connected) {
        int ret = pw_thread_loop_start(loop_);
        if (ret < 0) {
            connected = make_error(ErrorKind::Device,
                                   std::format("thread loop start failed: {}", spa_strerror(ret)));
        }
    }
    if (!connected) {
        capturing_.store(false, std::memory_order_release);
        teardown();
    }
    return connected;
}

void PipeWireCapture::stop() {
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) return;
    teardown();
}

void PipeWireCapture::teardown() {
    if (loop_) pw_thread_loop_stop(loop_);
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    pw_buffer* pwb = pw_stream_dequeue_buffer(self->stream_);
    if (!pwb) return;

    const spa_data& data = pwb->buffer->datas[0];
    if (data.data && data.chunk && self->capturing_.load(std::memory_order_relaxed)) {
        const auto* bytes = static_cast<const uint8_t*>(data.data) + data.chunk->offset;
        self->ring_.push(std::span<const int16_t>(reinterpret_cast<const int16_t*>(bytes),
                                                  data.chunk->size / sizeof(int16_t)));
    }

    pw_stream_queue_buffer(self->stream_, pwb);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, enum pw_stream_state /*old*/,
                                       enum pw_stream_state state, const char* error) {
    if (state == PW_STREAM_STATE_ERROR) {
        std::println(stderr, "audio: stream error: {}", error ? error : "unknown");
    }
}
