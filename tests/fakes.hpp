#pragma once

#include "output/text_injector.hpp"
#include "platform/audio_capture.hpp"
#include "platform/hotkey_source.hpp"
#include "sample_ring.hpp"
#include "transcription/backend.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Capture that "records" a canned clip into the ring on stop().
class FakeAudioCapture : public AudioCapture {
public:
    explicit FakeAudioCapture(SampleRing& ring) : ring_(ring) {}

    Result<void> start() override {
        start_calls++;
        if (fail_start) {
            return make_error(ErrorKind::Device, "no such device");
        }
        capturing_ = true;
        return {};
    }

    void stop() override {
        if (!capturing_) return;
        capturing_ = false;
        stop_calls++;
        ring_.push(clip);
    }

    bool is_capturing() const override { return capturing_; }

    std::vector<int16_t> clip;
    bool fail_start = false;
    int start_calls = 0;
    int stop_calls = 0;

private:
    SampleRing& ring_;
    bool capturing_ = false;
};

// Backend that returns a scripted result, optionally holding the worker
// until release() is called.
class FakeBackend : public TranscriptionBackend {
public:
    Result<Transcript> transcribe(const TranscriptionRequest& request) override {
        std::unique_lock lock(mu_);
        calls++;
        last_samples = request.audio.size();
        last_model = std::string(request.model);
        last_prompt = std::string(request.prompt);
        cv_.wait(lock, [this] { return !hold_; });
        return result;
    }

    void hold() {
        std::lock_guard lock(mu_);
        hold_ = true;
    }

    void release() {
        {
            std::lock_guard lock(mu_);
            hold_ = false;
        }
        cv_.notify_all();
    }

    Result<Transcript> result = Transcript{.text = "hello world", .duration_s = 1.0};
    int calls = 0;
    size_t last_samples = 0;
    std::string last_model;
    std::string last_prompt;

private:
    std::mutex mu_;
    std::condition_variable cv_;
    bool hold_ = false;
};

class FakeInjector : public TextInjector {
public:
    Result<void> inject(const std::string& text) override {
        injected.push_back(text);
        if (fail) {
            return make_error(ErrorKind::Output, "wtype not found");
        }
        return {};
    }

    std::vector<std::string> injected;
    bool fail = false;
};

class FakeHotkeySource : public HotkeySource {
public:
    Result<void> open(uint16_t) override {
        if (fail_open) return make_error(ErrorKind::Input, "no device");
        return {};
    }
    int event_fd() const override { return 42; }

    Result<void> read_events(std::vector<KeyEvent>& out) override {
        if (gone) return make_error(ErrorKind::Input, "device removed");
        out.insert(out.end(), queued.begin(), queued.end());
        queued.clear();
        return {};
    }

    void close() override {}

    std::vector<KeyEvent> queued;
    bool fail_open = false;
    bool gone = false;
};
