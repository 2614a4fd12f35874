#pragma once

#include "error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

// One finished recording plus the fixed per-process request settings.
struct TranscriptionRequest {
    std::span<const int16_t> audio;
    uint32_t sample_rate = 16000;
    std::string_view model;
    std::string_view prompt;
};

struct Transcript {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Sends each request exactly once; retrying is up to the caller.
// Errors: Transcription for transport or server failures, EmptyResult when
// the service recognized nothing.
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;
    virtual Result<Transcript> transcribe(const TranscriptionRequest& request) = 0;
};
