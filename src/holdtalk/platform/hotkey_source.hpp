#pragma once

#include "error.hpp"

#include <cstdint>
#include <vector>

enum class KeyAction { Release, Press, Repeat };

struct KeyEvent {
    uint16_t code = 0;
    KeyAction action = KeyAction::Press;
};

// Global keyboard event feed. event_fd() becomes readable when events are
// pending; read_events() failing means monitoring can no longer work.
class HotkeySource {
public:
    virtual ~HotkeySource() = default;
    virtual Result<void> open(uint16_t key_code) = 0;
    virtual int event_fd() const = 0;
    virtual Result<void> read_events(std::vector<KeyEvent>& out) = 0;
    virtual void close() = 0;
};
