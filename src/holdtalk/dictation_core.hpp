#pragma once

#include "config.hpp"
#include "hotkey_monitor.hpp"
#include "output/text_injector.hpp"
#include "platform/audio_capture.hpp"
#include "rewrite/punctuation_rewriter.hpp"
#include "sample_ring.hpp"
#include "session.hpp"
#include "transcription/backend.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Platform-independent dictation pipeline: press starts recording, release
// hands the clip to a worker that transcribes, rewrites and injects it.
// All public methods are called from the event loop thread. Only one cycle
// is in flight at a time; a press while the previous clip is still being
// transcribed is rejected.
class DictationCore {
public:
    // Called from the worker thread when a cycle's result is ready. The
    // owner must then call on_transcription_complete() from its own thread.
    using NotifyCallback = std::function<void()>;

    DictationCore(Config config, bool verbose,
                  SampleRing& ring, AudioCapture& audio,
                  std::unique_ptr<TranscriptionBackend> backend,
                  std::unique_ptr<TextInjector> injector,
                  NotifyCallback notify);
    ~DictationCore();

    DictationCore(const DictationCore&) = delete;
    DictationCore& operator=(const DictationCore&) = delete;

    void on_hotkey(HotkeyTransition transition);

    // Returns true if a recording was started.
    bool handle_press();
    // Returns true if a clip was handed to the worker.
    bool handle_release();

    void on_transcription_complete();

    SessionState session_state() const { return session_.state(); }
    bool transcribing() const { return transcribing_; }

    // Stops a running recording without transcribing it and waits for an
    // outstanding worker.
    void shutdown();

private:
    struct WorkerResult {
        Result<Transcript> transcript = make_error(ErrorKind::Transcription, "no result");
        std::string final_text;
        Result<void> delivered;
    };

    void start_transcription(std::vector<int16_t> audio);
    WorkerResult run_cycle(const std::vector<int16_t>& audio) const;
    std::string post_process(const std::string& raw) const;

    void log(const std::string& msg) const;
    void warn(const std::string& msg) const;

    const Config config_;
    bool verbose_;

    AudioCapture& audio_;
    std::unique_ptr<TranscriptionBackend> backend_;
    std::unique_ptr<TextInjector> injector_;
    NotifyCallback notify_;

    Session session_;
    PunctuationRewriter rewriter_;

    bool transcribing_ = false;
    WorkerResult worker_result_;
    std::jthread worker_;
};
