#include "hotkey_monitor.hpp"

HotkeyMonitor::HotkeyMonitor(HotkeySource& source, uint16_t key_code)
    : source_(source), key_code_(key_code) {}

Result<void> HotkeyMonitor::open() {
    held_ = false;
    return source_.open(key_code_);
}

Result<std::vector<HotkeyTransition>> HotkeyMonitor::poll() {
    pending_.clear();
    auto res = source_.read_events(pending_);
    if (!res) {
        return std::unexpected(res.error());
    }

    std::vector<HotkeyTransition> out;
    for (const auto& ev : pending_) {
        if (auto t = feed(ev)) {
            out.push_back(*t);
        }
    }
    return out;
}

std::optional<HotkeyTransition> HotkeyMonitor::feed(const KeyEvent& ev) {
    if (ev.code != key_code_) return std::nullopt;

    switch (ev.action) {
        case KeyAction::Press:
            if (held_) return std::nullopt;
            held_ = true;
            return HotkeyTransition::Pressed;
        case KeyAction::Release:
            if (!held_) return std::nullopt;
            held_ = false;
            return HotkeyTransition::Released;
        case KeyAction::Repeat:
            break;
    }
    return std::nullopt;
}
