#include "platform/linux/wayland_injector.hpp"
#include "platform/linux/subprocess.hpp"

#include <unistd.h>

WaylandInjector::WaylandInjector(Mode mode, bool terminal_paste)
    : mode_(mode), terminal_paste_(terminal_paste) {}

Result<void> WaylandInjector::inject(const std::string& text) {
    if (text.empty()) return {};
    if (mode_ == Mode::Paste) {
        return clipboard_paste(text);
    }
    return type_direct(text);
}

Result<void> WaylandInjector::type_direct(const std::string& text) {
    // "-" makes wtype read the text from stdin, so newlines survive intact
    return run_process({"wtype", "-d", "10", "-"}, &text);
}

Result<void> WaylandInjector::clipboard_paste(const std::string& text) {
    auto copied = run_process({"wl-copy"}, &text);
    if (!copied) return copied;

    // wl-copy needs a moment to take clipboard ownership
    ::usleep(10000);

    if (terminal_paste_) {
        return run_process({"wtype", "-M", "ctrl", "-M", "shift", "-k", "v"});
    }
    return run_process({"wtype", "-M", "ctrl", "-k", "v"});
}
