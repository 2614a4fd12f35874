#pragma once

#include "error.hpp"

#include <cstdint>
#include <functional>
#include <string>

// Spelling guidance sent with every transcription request. Whisper reads at
// most 224 prompt tokens.
inline constexpr const char* default_spelling_prompt =
    "Names: Gloucestershire, Kyrkjsæterøra\n"
    "Here in London we honour high-calibre travellers, never take offence, "
    "and never apologise. It's 4 June 2023.";

struct Config {
    struct Backend {
        std::string url;     // from DICTATION_BASE_URL
        std::string api_key; // from DICTATION_API_KEY
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model = "whisper-1";
        std::string language;
        std::string prompt = default_spelling_prompt;
        uint32_t timeout_seconds = 120;
    } backend;

    struct Hotkey {
        std::string key = "ctrl_r";
        std::string device; // empty: first keyboard that has the key
    } hotkey;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        double min_seconds = 0.3;
        std::string source; // PipeWire node name or serial; empty follows the default source

        size_t ring_capacity_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } audio;

    struct Output {
        std::string method = "type"; // "type" or "paste"
        bool append_space = true;
        bool terminal_paste = false;
    } output;

    struct Rewrite {
        bool tidy_punctuation = false;
    } rewrite;

    static Config load(const std::string& path);
    static Config load_default();

    using EnvLookup = std::function<const char*(const char*)>;

    // Reads DICTATION_BASE_URL and DICTATION_API_KEY. Both are required.
    Result<void> apply_environment(const EnvLookup& getenv);

    Result<void> validate() const;
};
