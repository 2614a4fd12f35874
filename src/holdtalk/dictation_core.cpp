#include "dictation_core.hpp"

#include <format>
#include <print>

DictationCore::DictationCore(Config config, bool verbose,
                             SampleRing& ring, AudioCapture& audio,
                             std::unique_ptr<TranscriptionBackend> backend,
                             std::unique_ptr<TextInjector> injector,
                             NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      audio_(audio),
      backend_(std::move(backend)),
      injector_(std::move(injector)),
      notify_(std::move(notify)),
      session_(ring, audio_, config_.audio.sample_rate, config_.audio.min_seconds) {}

DictationCore::~DictationCore() {
    shutdown();
}

void DictationCore::on_hotkey(HotkeyTransition transition) {
    switch (transition) {
        case HotkeyTransition::Pressed:
            handle_press();
            break;
        case HotkeyTransition::Released:
            handle_release();
            break;
    }
}

bool DictationCore::handle_press() {
    if (transcribing_) {
        log("Press ignored, previous dictation is still transcribing");
        return false;
    }
    if (session_.state() != SessionState::Idle) {
        return false;
    }

    auto started = session_.start_recording();
    if (!started) {
        warn(std::format("Microphone unavailable: {}", started.error().message));
        session_.set_idle();
        return false;
    }

    log("Listening...");
    return true;
}

bool DictationCore::handle_release() {
    if (session_.state() != SessionState::Recording) {
        return false;
    }

    double held = session_.recording_duration();
    auto audio = session_.stop_recording();
    if (audio.empty()) {
        log(std::format("Key held {:.2f}s, no usable audio, discarded", held));
        session_.set_idle();
        return false;
    }

    double duration = static_cast<double>(audio.size()) / config_.audio.sample_rate;
    log(std::format("Recording stopped, {:.1f}s audio, transcribing...", duration));

    start_transcription(std::move(audio));
    session_.set_idle();
    return true;
}

void DictationCore::start_transcription(std::vector<int16_t> audio) {
    if (worker_.joinable()) {
        worker_.join();
    }

    worker_result_ = {};
    transcribing_ = true;

    worker_ = std::jthread([this, audio = std::move(audio)](std::stop_token) {
        worker_result_ = run_cycle(audio);
        notify_();
    });
}

DictationCore::WorkerResult DictationCore::run_cycle(const std::vector<int16_t>& audio) const {
    WorkerResult wr;

    TranscriptionRequest request{
        .audio = audio,
        .sample_rate = config_.audio.sample_rate,
        .model = config_.backend.model,
        .prompt = config_.backend.prompt,
    };
    wr.transcript = backend_->transcribe(request);
    if (!wr.transcript) {
        return wr;
    }

    wr.final_text = post_process(wr.transcript->text);
    if (wr.final_text.empty()) {
        wr.transcript = make_error(ErrorKind::EmptyResult, "nothing left after rewriting");
        return wr;
    }

    auto text = wr.final_text;
    if (config_.output.append_space) {
        text += ' ';
    }
    wr.delivered = injector_->inject(text);
    return wr;
}

std::string DictationCore::post_process(const std::string& raw) const {
    auto text = rewriter_.rewrite(raw);
    if (config_.rewrite.tidy_punctuation) {
        text = tidy_punctuation(text);
    }
    return text;
}

void DictationCore::on_transcription_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (!transcribing_) {
        return;
    }
    transcribing_ = false;

    auto& wr = worker_result_;
    if (!wr.transcript) {
        const auto& err = wr.transcript.error();
        if (err.kind == ErrorKind::EmptyResult) {
            log("Nothing recognized");
        } else {
            warn(std::format("Transcription failed: {}", err.message));
        }
        return;
    }

    log(std::format("Transcription complete: {:.1f}s audio, {:.1f}s processing, {} chars",
                    wr.transcript->duration_s, wr.transcript->processing_s,
                    wr.final_text.size()));

    if (!wr.delivered) {
        warn(std::format("Text injection failed: {}", wr.delivered.error().message));
    }
}

void DictationCore::shutdown() {
    if (session_.state() == SessionState::Recording) {
        audio_.stop();
        session_.set_idle();
    }

    if (transcribing_) {
        log("Waiting for pending transcription to complete...");
        on_transcription_complete();
    } else if (worker_.joinable()) {
        worker_.join();
    }
}

void DictationCore::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[holdtalk] {}", msg);
    }
}

void DictationCore::warn(const std::string& msg) const {
    std::println(stderr, "[holdtalk] {}", msg);
}
