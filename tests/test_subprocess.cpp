#include <catch2/catch_test_macros.hpp>

#include "platform/linux/subprocess.hpp"

#include <signal.h>
#include <string>

TEST_CASE("run_process", "[output]") {
    SECTION("SuccessfulCommand") {
        std::string input = "hello";
        REQUIRE(run_process({"sh", "-c", "cat > /dev/null"}, &input).has_value());
    }

    SECTION("NonZeroExit") {
        auto r = run_process({"sh", "-c", "exit 3"});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Output);
        REQUIRE(r.error().message.find("code 3") != std::string::npos);
    }

    SECTION("MissingCommand") {
        auto r = run_process({"holdtalk-no-such-helper"});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Output);
        REQUIRE(r.error().message.find("not found") != std::string::npos);
    }

    SECTION("ChildExitsWithoutReadingInput") {
        // LinuxEventLoop::init ignores SIGPIPE the same way
        ::signal(SIGPIPE, SIG_IGN);
        std::string input(200000, 'a');
        auto r = run_process({"sh", "-c", "exit 1"}, &input);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Output);
    }

    SECTION("EmptyCommand") {
        REQUIRE_FALSE(run_process({}).has_value());
    }
}
