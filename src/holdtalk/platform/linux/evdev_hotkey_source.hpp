#pragma once

#include "platform/hotkey_source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Resolves "KEY_RIGHTCTRL", "rightctrl", "ctrl_r" or a decimal code to an
// evdev key code.
std::optional<uint16_t> evdev_key_code(std::string_view name);

// Reads key events straight from /dev/input/event*. Needs read access to the
// device node (usually membership of the "input" group).
class EvdevHotkeySource : public HotkeySource {
public:
    // An empty device path means: scan for the first device reporting the key.
    explicit EvdevHotkeySource(std::string device_path = {});
    ~EvdevHotkeySource() override;

    EvdevHotkeySource(const EvdevHotkeySource&) = delete;
    EvdevHotkeySource& operator=(const EvdevHotkeySource&) = delete;

    Result<void> open(uint16_t key_code) override;
    int event_fd() const override { return fd_; }
    Result<void> read_events(std::vector<KeyEvent>& out) override;
    void close() override;

    const std::string& device_path() const { return opened_path_; }

private:
    Result<int> open_device(const std::string& path, uint16_t key_code);

    std::string device_path_;
    std::string opened_path_;
    int fd_ = -1;
};
