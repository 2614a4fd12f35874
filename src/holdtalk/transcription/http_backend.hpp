#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <string>

// Interprets an HTTP status and JSON body from a transcription endpoint.
// Returns the trimmed text, EmptyResult for blank text, Transcription otherwise.
Result<std::string> parse_transcription_response(long http_status, const std::string& body);

// OpenAI-compatible (POST {url}/audio/transcriptions) or whisper.cpp server
// (POST {url}/inference) client over libcurl.
class HttpBackend : public TranscriptionBackend {
public:
    explicit HttpBackend(Config::Backend settings);
    ~HttpBackend() override;

    HttpBackend(const HttpBackend&) = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    Result<Transcript> transcribe(const TranscriptionRequest& request) override;

    std::string endpoint() const;

private:
    const Config::Backend settings_;
};
