#include <doctest/doctest.h>
#include "usb2snes/log.hpp"

using namespace usb2snes;

TEST_CASE("Log threshold filters by level") {
    const log::Level saved = log::level();

    log::set_level(log::Level::Warn);
    CHECK(log::enabled(log::Level::Error));
    CHECK(log::enabled(log::Level::Warn));
    CHECK_FALSE(log::enabled(log::Level::Info));
    CHECK_FALSE(log::enabled(log::Level::Debug));

    log::set_level(log::Level::Debug);
    CHECK(log::enabled(log::Level::Debug));
    U2S_LOGD("test", "debug line %d", 1);

    log::set_level(log::Level::Error);
    CHECK_FALSE(log::enabled(log::Level::Warn));

    log::set_level(saved);
}
