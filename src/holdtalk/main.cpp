#include "config.hpp"
#include "platform/linux/evdev_hotkey_source.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <cstdlib>
#include <print>
#include <string>

static void print_usage() {
    std::println("Usage: holdtalk [options] [MODEL]");
    std::println("Hold the hotkey to record, release to transcribe and type.");
    std::println("");
    std::println("Arguments:");
    std::println("  MODEL               Transcription model or server alias (default: whisper-1)");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
    std::println("Environment:");
    std::println("  DICTATION_BASE_URL  Transcription API base URL, e.g. http://localhost:8000/v1");
    std::println("  DICTATION_API_KEY   Bearer token for the API");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string model;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "Error: {} needs a path", arg);
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Error: unknown option {}", arg);
            print_usage();
            return 2;
        } else if (model.empty()) {
            model = arg;
        } else {
            std::println(stderr, "Error: unexpected argument {}", arg);
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!model.empty()) {
        config.backend.model = model;
    }

    auto env = config.apply_environment([](const char* name) { return std::getenv(name); });
    if (!env) {
        std::println(stderr, "Error: {}", env.error().message);
        return 1;
    }

    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "Error: {}", valid.error().message);
        return 1;
    }

    auto key_code = evdev_key_code(config.hotkey.key);
    if (!key_code) {
        std::println(stderr, "Error: hotkey '{}' is not a known key name", config.hotkey.key);
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[holdtalk] Starting (backend: {} @ {})",
                     config.backend.api_format, config.backend.url);
    }

    std::string model_name = config.backend.model;
    std::string key_name = config.hotkey.key;

    LinuxEventLoop loop(std::move(config), *key_code, verbose);
    if (auto ready = loop.init(); !ready) {
        std::println(stderr, "Error: {}", ready.error().message);
        return 1;
    }

    std::println("Ready to transcribe with {}.", model_name);
    std::println("Hold '{}' to dictate (Ctrl+C to quit).", key_name);

    if (auto done = loop.run(); !done) {
        std::println(stderr, "Error: {}: {}", to_string(done.error().kind), done.error().message);
        return 1;
    }
    return 0;
}
