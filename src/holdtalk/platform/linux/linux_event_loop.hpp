#pragma once

#include "config.hpp"
#include "dictation_core.hpp"
#include "hotkey_monitor.hpp"
#include "platform/linux/evdev_hotkey_source.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <cstdint>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, uint16_t key_code, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    Result<void> init();
    // Returns once a signal arrives (success) or the hotkey device fails.
    Result<void> run();

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    SampleRing ring_;
    PipeWireCapture audio_capture_;
    EvdevHotkeySource hotkey_source_;
    HotkeyMonitor hotkey_;

    // Portable business logic
    DictationCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
