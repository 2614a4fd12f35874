#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("prompt")) cfg.backend.prompt = b["prompt"].get<std::string>();
            if (b.contains("timeout_seconds")) cfg.backend.timeout_seconds = b["timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("hotkey")) {
            auto& h = j["hotkey"];
            if (h.contains("key")) cfg.hotkey.key = h["key"].get<std::string>();
            if (h.contains("device")) cfg.hotkey.device = h["device"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
            if (a.contains("min_seconds")) cfg.audio.min_seconds = a["min_seconds"].get<double>();
            if (a.contains("source")) cfg.audio.source = a["source"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("method")) cfg.output.method = o["method"].get<std::string>();
            if (o.contains("append_space")) cfg.output.append_space = o["append_space"].get<bool>();
            if (o.contains("terminal_paste")) cfg.output.terminal_paste = o["terminal_paste"].get<bool>();
        }

        if (j.contains("rewrite")) {
            auto& r = j["rewrite"];
            if (r.contains("tidy_punctuation")) cfg.rewrite.tidy_punctuation = r["tidy_punctuation"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

Result<void> Config::apply_environment(const EnvLookup& getenv) {
    const char* url = getenv("DICTATION_BASE_URL");
    const char* key = getenv("DICTATION_API_KEY");

    if (!url || !*url) {
        return make_error(ErrorKind::Configuration, "DICTATION_BASE_URL is not set");
    }
    if (!key || !*key) {
        return make_error(ErrorKind::Configuration, "DICTATION_API_KEY is not set");
    }

    backend.url = url;
    while (!backend.url.empty() && backend.url.back() == '/') {
        backend.url.pop_back();
    }
    backend.api_key = key;
    return {};
}

Result<void> Config::validate() const {
    if (backend.api_format != "openai" && backend.api_format != "whisper.cpp") {
        return make_error(ErrorKind::Configuration,
                          std::format("unknown backend.api_format '{}'", backend.api_format));
    }
    if (backend.model.empty()) {
        return make_error(ErrorKind::Configuration, "model name is empty");
    }
    if (output.method != "type" && output.method != "paste") {
        return make_error(ErrorKind::Configuration,
                          std::format("unknown output.method '{}'", output.method));
    }
    if (audio.sample_rate == 0 || audio.max_seconds == 0) {
        return make_error(ErrorKind::Configuration, "audio.sample_rate and audio.max_seconds must be positive");
    }
    if (audio.min_seconds < 0.0 || audio.min_seconds >= audio.max_seconds) {
        return make_error(ErrorKind::Configuration, "audio.min_seconds must be in [0, max_seconds)");
    }
    return {};
}
