#include <doctest/doctest.h>
#include "usb2snes/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;
using namespace usb2snes;

namespace {

// Temp file that removes itself.
struct TempFile {
    fs::path path;

    explicit TempFile(const std::string& contents) {
        std::random_device rd;
        path = fs::temp_directory_path() / ("usb2snes_cfg_" + std::to_string(rd()) + ".json");
        std::ofstream(path) << contents;
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

} // namespace

TEST_CASE("Defaults without a file") {
    CliConfig cfg;
    CHECK(cfg.uri == "ws://localhost:8080");
    CHECK(cfg.device.empty());
    CHECK(cfg.timeout_ms == 5000);
    CHECK(cfg.verbose == 0);
}

TEST_CASE("All keys are read") {
    TempFile f(R"({"uri":"ws://127.0.0.1:23074","device":"EMU","timeout_ms":800,"verbose":2})");
    CliConfig cfg;
    std::string err;
    REQUIRE(load_config(f.path, cfg, err));
    CHECK(cfg.uri == "ws://127.0.0.1:23074");
    CHECK(cfg.device == "EMU");
    CHECK(cfg.timeout_ms == 800);
    CHECK(cfg.verbose == 2);
}

TEST_CASE("Missing keys keep their current values and unknown keys are ignored") {
    TempFile f(R"({"device":"SD2SNES COM4","color":"blue"})");
    CliConfig cfg;
    cfg.timeout_ms = 1234;
    std::string err;
    REQUIRE(load_config(f.path, cfg, err));
    CHECK(cfg.device == "SD2SNES COM4");
    CHECK(cfg.uri == "ws://localhost:8080");
    CHECK(cfg.timeout_ms == 1234);
}

TEST_CASE("Failures leave the config untouched") {
    CliConfig cfg;
    cfg.device = "keep";
    std::string err;

    SUBCASE("missing file") {
        CHECK_FALSE(load_config("/nonexistent/usb2snes/config.json", cfg, err));
        CHECK(err == "not_found");
    }
    SUBCASE("bad json") {
        TempFile f("{ \"uri\": ");
        CHECK_FALSE(load_config(f.path, cfg, err));
        CHECK(err == "bad_json");
    }
    SUBCASE("not an object") {
        TempFile f("[1,2,3]");
        CHECK_FALSE(load_config(f.path, cfg, err));
        CHECK(err == "bad_json");
    }
    SUBCASE("wrong type after a valid key") {
        TempFile f(R"({"device":"other","timeout_ms":"slow"})");
        CHECK_FALSE(load_config(f.path, cfg, err));
        CHECK(err == "bad_value:timeout_ms");
    }
    SUBCASE("negative timeout") {
        TempFile f(R"({"timeout_ms":-1})");
        CHECK_FALSE(load_config(f.path, cfg, err));
        CHECK(err == "bad_value:timeout_ms");
    }
    SUBCASE("timeout beyond int range") {
        TempFile f(R"({"timeout_ms":4294967296})");
        CHECK_FALSE(load_config(f.path, cfg, err));
        CHECK(err == "bad_value:timeout_ms");
    }
    SUBCASE("fractional timeout") {
        TempFile f(R"({"timeout_ms":1.5})");
        CHECK_FALSE(load_config(f.path, cfg, err));
        CHECK(err == "bad_value:timeout_ms");
    }
    SUBCASE("negative verbosity") {
        TempFile f(R"({"verbose":-2})");
        CHECK_FALSE(load_config(f.path, cfg, err));
        CHECK(err == "bad_value:verbose");
    }
    CHECK(cfg.device == "keep");
    CHECK(cfg.timeout_ms == 5000);
}

TEST_CASE("Zero and INT_MAX timeouts are in range") {
    CliConfig cfg;
    std::string err;

    TempFile zero(R"({"timeout_ms":0})");
    REQUIRE(load_config(zero.path, cfg, err));
    CHECK(cfg.timeout_ms == 0);

    TempFile top(R"({"timeout_ms":2147483647})");
    REQUIRE(load_config(top.path, cfg, err));
    CHECK(cfg.timeout_ms == 2147483647);
}

TEST_CASE("Default path honours XDG_CONFIG_HOME") {
    const char* saved = std::getenv("XDG_CONFIG_HOME");
    std::string saved_value = saved ? saved : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    CHECK(default_config_path() == fs::path("/tmp/xdg-test/usb2snes/config.json"));

    ::setenv("XDG_CONFIG_HOME", "", 1);
    CHECK(default_config_path().filename() == "config.json");
    CHECK(default_config_path().parent_path().filename() == "usb2snes");

    if (saved) ::setenv("XDG_CONFIG_HOME", saved_value.c_str(), 1);
    else       ::unsetenv("XDG_CONFIG_HOME");
}
