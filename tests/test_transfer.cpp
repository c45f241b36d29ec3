#include <doctest/doctest.h>
#include "fake_transport.hpp"
#include "usb2snes/session.hpp"

#include <memory>

using namespace usb2snes;
using usb2snes::test::FakeTransport;
using transport::FrameKind;

namespace {

struct Rig {
    FakeTransport* fake;
    std::unique_ptr<Session> session;

    Rig() {
        auto t = std::make_unique<FakeTransport>();
        fake = t.get();
        session = std::make_unique<Session>(std::move(t));
    }
};

std::vector<uint8_t> pattern(std::size_t n) {
    std::vector<uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    return v;
}

std::vector<uint8_t> slice(const std::vector<uint8_t>& v, std::size_t off, std::size_t n) {
    return std::vector<uint8_t>(v.begin() + static_cast<std::ptrdiff_t>(off),
                                v.begin() + static_cast<std::ptrdiff_t>(off + n));
}

} // namespace

// ---------------------------------------------------------------------------
// Upload
// ---------------------------------------------------------------------------

TEST_CASE("Upload announces the size in hex and splits into 1024-byte frames") {
    Rig rig;
    auto data = pattern(2500);

    Error err;
    REQUIRE(rig.session->put_file("/roms/hack.sfc", data, err));

    auto& sent = rig.fake->sent;
    REQUIRE(sent.size() == 1 + 3);
    CHECK(sent[0].kind == FrameKind::Text);
    CHECK(rig.fake->sent_text(0) ==
          R"({"Opcode":"PutFile","Space":"SNES","Operands":["/roms/hack.sfc","9C4"]})");

    CHECK(sent[1].kind == FrameKind::Binary);
    CHECK(sent[1].data == slice(data, 0, 1024));
    CHECK(sent[2].data == slice(data, 1024, 1024));
    CHECK(sent[3].data == slice(data, 2048, 452));

    // one flush for the request, one per data frame
    CHECK(rig.fake->flush_calls == 4);
    CHECK(rig.fake->recv_calls == 0);
}

TEST_CASE("Upload frame count is ceil(N / 1024)") {
    struct Case { std::size_t size; std::size_t frames; };
    for (Case c : {Case{1, 1}, Case{1023, 1}, Case{1024, 1}, Case{1025, 2}, Case{4096, 4}}) {
        Rig rig;
        Error err;
        REQUIRE(rig.session->put_file("f.bin", pattern(c.size), err));
        CHECK(rig.fake->sent.size() == 1 + c.frames);
        CHECK(rig.fake->sent.back().data.size() == c.size - (c.frames - 1) * PUT_CHUNK_SIZE);
    }
}

TEST_CASE("Empty upload sends only the announcement") {
    Rig rig;
    Error err;
    REQUIRE(rig.session->put_file("empty.bin", std::vector<uint8_t>{}, err));
    REQUIRE(rig.fake->sent.size() == 1);
    CHECK(rig.fake->sent_text(0) ==
          R"({"Opcode":"PutFile","Space":"SNES","Operands":["empty.bin","0"]})");
}

TEST_CASE("Upload stops on the first send failure") {
    Rig rig;
    rig.fake->fail_send = true;
    Error err;
    CHECK_FALSE(rig.session->put_file("x", pattern(3000), err));
    CHECK(err.kind == ErrorKind::Transport);
    REQUIRE(err.op.has_value());
    CHECK(*err.op == Opcode::PutFile);
    CHECK(rig.fake->sent.empty());
}

// ---------------------------------------------------------------------------
// Download
// ---------------------------------------------------------------------------

TEST_CASE("Download request carries hex address and length") {
    Rig rig;
    rig.fake->push_binary(pattern(16));

    Error err;
    std::vector<uint8_t> out;
    REQUIRE(rig.session->read_mem(0xF50010, 16, out, err));
    CHECK(rig.fake->sent_text(0) ==
          R"({"Opcode":"GetAddress","Space":"SNES","Operands":["F50010","10"]})");
    CHECK(out == pattern(16));
}

TEST_CASE("Download reassembles however the server splits the data") {
    const std::size_t L = 64;
    auto data = pattern(L);

    SUBCASE("one frame") {
        Rig rig;
        rig.fake->push_binary(data);
        Error err;
        std::vector<uint8_t> out;
        REQUIRE(rig.session->read_mem(0, L, out, err));
        CHECK(out == data);
    }
    SUBCASE("one byte per frame") {
        Rig rig;
        for (std::size_t i = 0; i < L; ++i) rig.fake->push_binary(slice(data, i, 1));
        Error err;
        std::vector<uint8_t> out;
        REQUIRE(rig.session->read_mem(0, L, out, err));
        CHECK(out == data);
        CHECK(rig.fake->recv_calls == static_cast<int>(L));
    }
    SUBCASE("uneven split") {
        Rig rig;
        rig.fake->push_binary(slice(data, 0, 5));
        rig.fake->push_binary(slice(data, 5, 40));
        rig.fake->push_binary(slice(data, 45, 19));
        Error err;
        std::vector<uint8_t> out;
        REQUIRE(rig.session->read_mem(0, L, out, err));
        CHECK(out == data);
    }
}

TEST_CASE("Text frames during a download are ignored") {
    Rig rig;
    auto data = pattern(8);
    rig.fake->push_binary(slice(data, 0, 3));
    rig.fake->push_text(R"({"Results":["noise"]})");
    rig.fake->push_binary(slice(data, 3, 5));

    Error err;
    std::vector<uint8_t> out;
    REQUIRE(rig.session->read_mem(0x7E0000, 8, out, err));
    CHECK(out == data);
}

TEST_CASE("Download stops reading once the length is met") {
    Rig rig;
    rig.fake->push_binary(pattern(4));
    rig.fake->push_text(R"({"Results":["EMU"]})");

    Error err;
    std::vector<uint8_t> out;
    REQUIRE(rig.session->read_mem(0, 4, out, err));
    CHECK(rig.fake->inbound.size() == 1);

    // the leftover frame answers the next request
    std::vector<std::string> devs;
    REQUIRE(rig.session->get_device_list(devs, err));
    CHECK(devs == std::vector<std::string>{"EMU"});
}

TEST_CASE("Zero-length download returns immediately") {
    Rig rig;
    Error err;
    std::vector<uint8_t> out{1, 2, 3};
    REQUIRE(rig.session->read_mem(0x1000, 0, out, err));
    CHECK(out.empty());
    CHECK(rig.fake->sent.empty());
    CHECK(rig.fake->recv_calls == 0);
}

TEST_CASE("Stream ending mid-download is a short read") {
    Rig rig;
    rig.fake->push_binary(pattern(12));

    Error err;
    std::vector<uint8_t> out;
    CHECK_FALSE(rig.session->read_mem(0, 64, out, err));
    CHECK(err.kind == ErrorKind::Protocol);
    CHECK(err.reason == "short_read");
    CHECK(err.detail == "got 12 of 64");
    CHECK(out.empty());
}

TEST_CASE("More data than requested is an overrun") {
    Rig rig;
    rig.fake->push_binary(pattern(10));
    rig.fake->push_binary(pattern(10));

    Error err;
    std::vector<uint8_t> out;
    CHECK_FALSE(rig.session->read_mem(0, 16, out, err));
    CHECK(err.kind == ErrorKind::Protocol);
    CHECK(err.reason == "overrun");
    CHECK(out.empty());
}

TEST_CASE("Timeout mid-download is a transport error") {
    Rig rig;
    rig.fake->push_binary(pattern(2));
    rig.fake->empty_result = transport::RxResult::Timeout;

    Error err;
    std::vector<uint8_t> out;
    CHECK_FALSE(rig.session->read_mem(0, 4, out, err));
    CHECK(err.kind == ErrorKind::Transport);
    CHECK(err.reason == "timeout");
    CHECK(out.empty());
}
