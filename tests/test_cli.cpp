#include <doctest/doctest.h>
#include "fake_transport.hpp"
#include "usb2snes/cli_util.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>

using namespace usb2snes;
using namespace usb2snes::cli;
using usb2snes::test::FakeTransport;

static std::unique_ptr<Session> session_over(FakeTransport*& fake) {
    auto t = std::make_unique<FakeTransport>();
    fake = t.get();
    return std::make_unique<Session>(std::move(t));
}

TEST_CASE("Numbers accept decimal, hex and octal") {
    uint32_t v = 0;
    REQUIRE(parse_number("4096", v));
    CHECK(v == 4096);
    REQUIRE(parse_number("0x1F", v));
    CHECK(v == 31);
    REQUIRE(parse_number("0XF50000", v));
    CHECK(v == 0xF50000);
    REQUIRE(parse_number("010", v));
    CHECK(v == 8);
    REQUIRE(parse_number("0", v));
    CHECK(v == 0);
    REQUIRE(parse_number("4294967295", v));
    CHECK(v == 0xFFFFFFFFu);
}

TEST_CASE("Malformed numbers are rejected and leave the output alone") {
    uint32_t v = 77;
    CHECK_FALSE(parse_number("", v));
    CHECK_FALSE(parse_number("08", v));          // 8 is not an octal digit
    CHECK_FALSE(parse_number("-1", v));
    CHECK_FALSE(parse_number("+1", v));
    CHECK_FALSE(parse_number("4294967296", v));
    CHECK_FALSE(parse_number("12abc", v));
    CHECK_FALSE(parse_number("0x", v));
    CHECK_FALSE(parse_number(" 12", v));
    CHECK(v == 77);
}

TEST_CASE("Remote name trims the destination directory") {
    CHECK(remote_name("", "hack.sfc") == "hack.sfc");
    CHECK(remote_name("/roms", "hack.sfc") == "/roms/hack.sfc");
    CHECK(remote_name("/roms//", "hack.sfc") == "/roms/hack.sfc");
    CHECK(remote_name("/", "hack.sfc") == "/hack.sfc");
}

TEST_CASE("Explicit device skips the device list") {
    FakeTransport* fake = nullptr;
    auto s = session_over(fake);

    Error err;
    std::string dev;
    REQUIRE(select_device(*s, "SD2SNES COM3", dev, err));
    CHECK(dev == "SD2SNES COM3");
    CHECK(fake->sent.empty());
}

TEST_CASE("Without a device the first listed one is used") {
    FakeTransport* fake = nullptr;
    auto s = session_over(fake);
    fake->push_text(R"({"Results":["EMU","SD2SNES COM3"]})");

    Error err;
    std::string dev;
    REQUIRE(select_device(*s, "", dev, err));
    CHECK(dev == "EMU");
    CHECK(fake->sent_text(0) == R"({"Opcode":"DeviceList","Space":"SNES"})");
}

TEST_CASE("Empty device list is no_devices") {
    FakeTransport* fake = nullptr;
    auto s = session_over(fake);
    fake->push_text(R"({"Results":[]})");

    Error err;
    std::string dev;
    CHECK_FALSE(select_device(*s, "", dev, err));
    CHECK(err.kind == ErrorKind::Protocol);
    CHECK(err.reason == "no_devices");
    CHECK(dev.empty());
    CHECK(exit_code_for(err) == ExitCode::Failure);
}

TEST_CASE("Hex dump rows hold 16 bytes") {
    std::vector<uint8_t> data;
    for (int i = 0; i < 18; ++i) data.push_back(static_cast<uint8_t>(0x41 + i));
    data[1] = 0x00;

    std::ostringstream os;
    write_hexdump(os, 0xF50000, data);
    CHECK(os.str() ==
          "F50000  41 00 43 44 45 46 47 48 49 4A 4B 4C 4D 4E 4F 50  A.CDEFGHIJKLMNOP\n"
          "F50010  51 52" + std::string(14 * 3 + 2, ' ') + "QR\n");

    // stream state is restored
    os.str("");
    os << 255;
    CHECK(os.str() == "255");
}

TEST_CASE("Empty dump prints nothing") {
    std::ostringstream os;
    write_hexdump(os, 0, {});
    CHECK(os.str().empty());
}

TEST_CASE("Local file reads and io failures") {
    Error err;
    std::vector<uint8_t> out;
    CHECK_FALSE(read_local_file("/nonexistent/usb2snes/file.sfc", out, err));
    CHECK(err.kind == ErrorKind::Io);
    CHECK(err.reason == "open_failed");
    CHECK(exit_code_for(err) == ExitCode::Failure);

    std::random_device rd;
    auto path = std::filesystem::temp_directory_path() / ("usb2snes_put_" + std::to_string(rd()) + ".bin");
    std::ofstream(path, std::ios::binary) << std::string("\x01\x02\x03", 3);

    err.clear();
    REQUIRE(read_local_file(path, out, err));
    CHECK(out == std::vector<uint8_t>{1, 2, 3});
    CHECK(exit_code_for(err) == ExitCode::Ok);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_CASE("Exit codes") {
    CHECK(static_cast<int>(ExitCode::Ok) == 0);
    CHECK(static_cast<int>(ExitCode::Failure) == 1);
    CHECK(static_cast<int>(ExitCode::Usage) == 2);
}
