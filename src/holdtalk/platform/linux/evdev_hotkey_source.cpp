#include "platform/linux/evdev_hotkey_source.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct KeyName {
    std::string_view name;
    uint16_t code;
};

// Aliases first, then kernel names without the KEY_ prefix.
constexpr KeyName key_names[] = {
    {"ctrl_r", KEY_RIGHTCTRL},   {"ctrl_l", KEY_LEFTCTRL},   {"ctrl", KEY_LEFTCTRL},
    {"alt_r", KEY_RIGHTALT},     {"alt_gr", KEY_RIGHTALT},   {"alt_l", KEY_LEFTALT},
    {"alt", KEY_LEFTALT},        {"shift_r", KEY_RIGHTSHIFT}, {"shift_l", KEY_LEFTSHIFT},
    {"shift", KEY_LEFTSHIFT},    {"cmd_r", KEY_RIGHTMETA},   {"cmd_l", KEY_LEFTMETA},
    {"cmd", KEY_LEFTMETA},       {"caps_lock", KEY_CAPSLOCK}, {"scroll_lock", KEY_SCROLLLOCK},
    {"num_lock", KEY_NUMLOCK},   {"print_screen", KEY_SYSRQ},

    {"rightctrl", KEY_RIGHTCTRL}, {"leftctrl", KEY_LEFTCTRL},
    {"rightalt", KEY_RIGHTALT},   {"leftalt", KEY_LEFTALT},
    {"rightshift", KEY_RIGHTSHIFT}, {"leftshift", KEY_LEFTSHIFT},
    {"rightmeta", KEY_RIGHTMETA}, {"leftmeta", KEY_LEFTMETA},
    {"capslock", KEY_CAPSLOCK},   {"scrolllock", KEY_SCROLLLOCK},
    {"numlock", KEY_NUMLOCK},     {"sysrq", KEY_SYSRQ},
    {"pause", KEY_PAUSE},         {"menu", KEY_MENU},
    {"compose", KEY_COMPOSE},     {"insert", KEY_INSERT},
    {"space", KEY_SPACE},         {"esc", KEY_ESC},
    {"f1", KEY_F1},   {"f2", KEY_F2},   {"f3", KEY_F3},   {"f4", KEY_F4},
    {"f5", KEY_F5},   {"f6", KEY_F6},   {"f7", KEY_F7},   {"f8", KEY_F8},
    {"f9", KEY_F9},   {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
    {"f13", KEY_F13}, {"f14", KEY_F14}, {"f15", KEY_F15}, {"f16", KEY_F16},
    {"f17", KEY_F17}, {"f18", KEY_F18}, {"f19", KEY_F19}, {"f20", KEY_F20},
    {"f21", KEY_F21}, {"f22", KEY_F22}, {"f23", KEY_F23}, {"f24", KEY_F24},
};

constexpr size_t bits_per_long = sizeof(unsigned long) * 8;

bool test_bit(const unsigned long* bits, size_t bit) {
    return (bits[bit / bits_per_long] >> (bit % bits_per_long)) & 1UL;
}

} // namespace

std::optional<uint16_t> evdev_key_code(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    unsigned code = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), code);
    if (ec == std::errc() && ptr == key.data() + key.size()) {
        if (code == 0 || code > KEY_MAX) return std::nullopt;
        return static_cast<uint16_t>(code);
    }

    std::string_view bare = key;
    if (bare.starts_with("key_")) bare.remove_prefix(4);

    for (const auto& k : key_names) {
        if (k.name == bare) return k.code;
    }
    return std::nullopt;
}

EvdevHotkeySource::EvdevHotkeySource(std::string device_path)
    : device_path_(std::move(device_path)) {}

EvdevHotkeySource::~EvdevHotkeySource() {
    close();
}

Result<void> EvdevHotkeySource::open(uint16_t key_code) {
    close();

    if (!device_path_.empty()) {
        auto fd = open_device(device_path_, key_code);
        if (!fd) return std::unexpected(fd.error());
        fd_ = *fd;
        opened_path_ = device_path_;
        return {};
    }

    std::vector<std::string> candidates;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/dev/input", ec)) {
        auto name = entry.path().filename().string();
        if (name.starts_with("event")) {
            candidates.push_back(entry.path().string());
        }
    }
    if (ec) {
        return make_error(ErrorKind::Input,
                          std::format("cannot list /dev/input: {}", ec.message()));
    }

    // event2 before event10
    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        return a.size() != b.size() ? a.size() < b.size() : a < b;
    });

    size_t denied = 0;
    for (const auto& path : candidates) {
        if (::access(path.c_str(), R_OK) != 0) {
            denied++;
            continue;
        }
        auto fd = open_device(path, key_code);
        if (fd) {
            fd_ = *fd;
            opened_path_ = path;
            return {};
        }
    }

    if (denied > 0) {
        return make_error(ErrorKind::Input,
                          std::format("no readable input device reports key {} "
                                      "({} devices denied access, is the user in the 'input' group?)",
                                      key_code, denied));
    }
    return make_error(ErrorKind::Input,
                      std::format("no input device reports key {}", key_code));
}

Result<int> EvdevHotkeySource::open_device(const std::string& path, uint16_t key_code) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        return make_error(ErrorKind::Input,
                          std::format("open {}: {}", path, std::strerror(errno)));
    }

    std::array<unsigned long, KEY_MAX / bits_per_long + 1> key_bits{};
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits.data()) < 0) {
        int err = errno;
        ::close(fd);
        return make_error(ErrorKind::Input,
                          std::format("{} is not an evdev device: {}", path, std::strerror(err)));
    }

    if (!test_bit(key_bits.data(), key_code)) {
        ::close(fd);
        return make_error(ErrorKind::Input,
                          std::format("{} does not report key {}", path, key_code));
    }

    return fd;
}

Result<void> EvdevHotkeySource::read_events(std::vector<KeyEvent>& out) {
    if (fd_ < 0) {
        return make_error(ErrorKind::Input, "input device is not open");
    }

    input_event events[64];
    for (;;) {
        ssize_t n = ::read(fd_, events, sizeof(events));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return {};
            return make_error(ErrorKind::Input,
                              std::format("read {}: {}", opened_path_, std::strerror(errno)));
        }
        if (n == 0) {
            return make_error(ErrorKind::Input,
                              std::format("{} closed", opened_path_));
        }

        size_t count = static_cast<size_t>(n) / sizeof(input_event);
        for (size_t i = 0; i < count; i++) {
            const auto& ev = events[i];
            if (ev.type != EV_KEY) continue;

            KeyEvent ke;
            ke.code = ev.code;
            switch (ev.value) {
                case 0: ke.action = KeyAction::Release; break;
                case 1: ke.action = KeyAction::Press; break;
                default: ke.action = KeyAction::Repeat; break;
            }
            out.push_back(ke);
        }
    }
}

void EvdevHotkeySource::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    opened_path_.clear();
}
