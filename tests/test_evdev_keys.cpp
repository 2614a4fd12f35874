#include <catch2/catch_test_macros.hpp>

#include "platform/linux/evdev_hotkey_source.hpp"

#include <linux/input.h>

TEST_CASE("evdev_key_code", "[hotkey]") {
    REQUIRE(evdev_key_code("ctrl_r") == KEY_RIGHTCTRL);
    REQUIRE(evdev_key_code("KEY_RIGHTCTRL") == KEY_RIGHTCTRL);
    REQUIRE(evdev_key_code("rightctrl") == KEY_RIGHTCTRL);
    REQUIRE(evdev_key_code("alt_gr") == KEY_RIGHTALT);
    REQUIRE(evdev_key_code("F13") == KEY_F13);
    REQUIRE(evdev_key_code("97") == 97);

    REQUIRE_FALSE(evdev_key_code("hyperdrive").has_value());
    REQUIRE_FALSE(evdev_key_code("").has_value());
    REQUIRE_FALSE(evdev_key_code("0").has_value());
    REQUIRE_FALSE(evdev_key_code("99999").has_value());
}

TEST_CASE("EvdevHotkeySource", "[hotkey]") {
    SECTION("MissingDeviceIsInputError") {
        EvdevHotkeySource source("/nonexistent/holdtalk-event0");
        auto res = source.open(KEY_RIGHTCTRL);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::Input);
        REQUIRE(source.event_fd() == -1);
    }

    SECTION("NonEvdevFileRejected") {
        EvdevHotkeySource source("/dev/null");
        auto res = source.open(KEY_RIGHTCTRL);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(source.event_fd() == -1);
    }

    SECTION("ReadBeforeOpenFails") {
        EvdevHotkeySource source;
        std::vector<KeyEvent> out;
        REQUIRE_FALSE(source.read_events(out).has_value());
    }
}
