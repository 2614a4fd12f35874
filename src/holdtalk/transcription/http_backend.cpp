#include "transcription/http_backend.hpp"
#include "wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), value.size());
}

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

// OpenAI puts {"error": {"message": ...}}, whisper.cpp puts {"error": "..."}.
static std::string error_message(const json& j) {
    if (!j.contains("error")) return {};
    const auto& e = j["error"];
    if (e.is_string()) return e.get<std::string>();
    if (e.is_object() && e.contains("message") && e["message"].is_string()) {
        return e["message"].get<std::string>();
    }
    return e.dump();
}

Result<std::string> parse_transcription_response(long http_status, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        if (http_status < 200 || http_status >= 300) {
            return make_error(ErrorKind::Transcription,
                              std::format("HTTP {}: {}", http_status, trim(body)));
        }
        return make_error(ErrorKind::Transcription,
                          std::string("JSON parse error: ") + e.what());
    }

    if (http_status < 200 || http_status >= 300) {
        auto msg = error_message(j);
        return make_error(ErrorKind::Transcription,
                          std::format("HTTP {}: {}", http_status, msg.empty() ? body : msg));
    }

    if (auto msg = error_message(j); !msg.empty()) {
        return make_error(ErrorKind::Transcription, "server error: " + msg);
    }

    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        return make_error(ErrorKind::Transcription, "unexpected response: " + body);
    }

    auto text = trim(j["text"].get<std::string>());
    if (text.empty()) {
        return make_error(ErrorKind::EmptyResult, "no speech recognized");
    }
    return text;
}

HttpBackend::HttpBackend(Config::Backend settings)
    : settings_(std::move(settings)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpBackend::~HttpBackend() {
    curl_global_cleanup();
}

std::string HttpBackend::endpoint() const {
    if (settings_.api_format == "whisper.cpp") {
        return settings_.url + "/inference";
    }
    return settings_.url + "/audio/transcriptions";
}

Result<Transcript> HttpBackend::transcribe(const TranscriptionRequest& request) {
    if (request.audio.empty()) {
        return make_error(ErrorKind::EmptyResult, "empty audio");
    }

    double duration_s = static_cast<double>(request.audio.size()) / request.sample_rate;
    auto wav_data = wav::encode(request.audio, request.sample_rate);

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error(ErrorKind::Transcription, "curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (settings_.api_format == "whisper.cpp") {
        add_field(mime, "temperature", "0.0");
    } else {
        add_field(mime, "model", std::string(request.model));
    }
    add_field(mime, "response_format", "json");
    if (!request.prompt.empty()) {
        add_field(mime, "prompt", std::string(request.prompt));
    }
    if (!settings_.language.empty()) {
        add_field(mime, "language", settings_.language);
    }

    curl_slist* headers = nullptr;
    auto auth = "Authorization: Bearer " + settings_.api_key;
    headers = curl_slist_append(headers, auth.c_str());
    headers = curl_slist_append(headers, "Accept: application/json");

    std::string url = endpoint();
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(settings_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    }

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return make_error(ErrorKind::Transcription,
                          std::string("curl error: ") + curl_easy_strerror(res));
    }

    auto text = parse_transcription_response(http_status, response_body);
    if (!text) {
        return std::unexpected(text.error());
    }

    return Transcript{
        .text = std::move(*text),
        .duration_s = duration_s,
        .processing_s = processing_s,
    };
}
