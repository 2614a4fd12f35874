#pragma once

#include "error.hpp"
#include "platform/hotkey_source.hpp"

#include <cstdint>
#include <optional>
#include <vector>

enum class HotkeyTransition { Pressed, Released };

// Reduces the raw key feed to clean press/release edges of one key.
// Auto-repeat, other keys, a press while held and a release while up are
// all dropped.
class HotkeyMonitor {
public:
    HotkeyMonitor(HotkeySource& source, uint16_t key_code);

    Result<void> open();
    int event_fd() const { return source_.event_fd(); }

    // Drains pending events. An error is fatal: the source is gone.
    Result<std::vector<HotkeyTransition>> poll();

    std::optional<HotkeyTransition> feed(const KeyEvent& ev);

    bool held() const { return held_; }

private:
    HotkeySource& source_;
    uint16_t key_code_;
    bool held_ = false;
    std::vector<KeyEvent> pending_;
};
