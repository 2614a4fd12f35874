#include <catch2/catch_test_macros.hpp>

#include "transcription/http_backend.hpp"

#include <vector>

TEST_CASE("parse_transcription_response", "[transcription]") {

    SECTION("TextIsTrimmed") {
        auto text = parse_transcription_response(200, R"({"text": "  Hello comma world.\n"})");
        REQUIRE(text.has_value());
        REQUIRE(*text == "Hello comma world.");
    }

    SECTION("BlankTextIsEmptyResult") {
        auto text = parse_transcription_response(200, R"({"text": " \n "})");
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().kind == ErrorKind::EmptyResult);
    }

    SECTION("MissingTextIsTranscriptionError") {
        auto text = parse_transcription_response(200, R"({"segments": []})");
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().kind == ErrorKind::Transcription);
    }

    SECTION("MalformedJson") {
        auto text = parse_transcription_response(200, "<html>oops</html>");
        REQUIRE(text.error().kind == ErrorKind::Transcription);
    }

    SECTION("OpenAiErrorObject") {
        auto text = parse_transcription_response(
            401, R"({"error": {"message": "Incorrect API key provided", "type": "invalid_request_error"}})");
        REQUIRE(text.error().kind == ErrorKind::Transcription);
        REQUIRE(text.error().message == "HTTP 401: Incorrect API key provided");
    }

    SECTION("WhisperCppErrorString") {
        auto text = parse_transcription_response(200, R"({"error": "failed to read WAV file"})");
        REQUIRE(text.error().kind == ErrorKind::Transcription);
        REQUIRE(text.error().message == "server error: failed to read WAV file");
    }

    SECTION("BadStatusWithPlainBody") {
        auto text = parse_transcription_response(502, "Bad Gateway");
        REQUIRE(text.error().kind == ErrorKind::Transcription);
        REQUIRE(text.error().message == "HTTP 502: Bad Gateway");
    }
}

TEST_CASE("HttpBackend", "[transcription]") {
    Config::Backend settings;
    settings.url = "http://127.0.0.1:1/v1";
    settings.api_key = "sk-test";
    settings.timeout_seconds = 5;

    SECTION("OpenAiEndpoint") {
        HttpBackend backend(settings);
        REQUIRE(backend.endpoint() == "http://127.0.0.1:1/v1/audio/transcriptions");
    }

    SECTION("WhisperCppEndpoint") {
        settings.api_format = "whisper.cpp";
        HttpBackend backend(settings);
        REQUIRE(backend.endpoint() == "http://127.0.0.1:1/v1/inference");
    }

    SECTION("EmptyAudioNeverSent") {
        HttpBackend backend(settings);
        auto res = backend.transcribe(TranscriptionRequest{.model = "whisper-1"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::EmptyResult);
    }

    SECTION("ConnectionRefusedIsTranscriptionError") {
        HttpBackend backend(settings);
        std::vector<int16_t> audio(1600, 0);
        auto res = backend.transcribe(TranscriptionRequest{
            .audio = audio,
            .sample_rate = 16000,
            .model = "whisper-1",
            .prompt = "Names: Gloucestershire",
        });
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::Transcription);
    }
}
