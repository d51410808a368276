#include <doctest/doctest.h>
#include <algorithm>
#include "fmo/header_codec.hpp"
#include "fmo/replay_transform.hpp"
#include "test_frames.hpp"
using namespace fmo;

TEST_CASE("rewrite stamps echo uid and prefixes the callsign") {
    const std::vector<uint8_t> raw = fmo_test::bd8boj_frame(578);
    Frame in;
    REQUIRE(decode_frame(raw.data(), raw.size(), in) == FrameError::None);

    ReplayTransform t;
    const Frame out = t.rewrite(in);
    CHECK(out.header.uid == ECHO_UID);
    CHECK(to_std_string(out.header.callsign) == "RE>BD8BOJ");
    CHECK(out.header.version == in.header.version);
    CHECK(out.header.padding1 == in.header.padding1);
    CHECK(out.header.padding2 == in.header.padding2);
}

TEST_CASE("payload survives rewrite byte for byte, including empty payloads") {
    ReplayTransform t;
    Frame in;
    in.header.uid      = 7;
    in.header.padding1 = 0xAAAA;
    in.header.padding2 = 0x5555;
    in.header.callsign = make_callsign("X");
    in.payload = fmo_test::pattern_payload(1024, 3);

    Frame out = t.rewrite(in);
    CHECK(out.payload == in.payload);
    CHECK(out.header.padding1 == 0xAAAA);
    CHECK(out.header.padding2 == 0x5555);

    // the encoded echo is the original bytes with only uid + callsign changed
    const std::vector<uint8_t> a = encode_frame(in);
    const std::vector<uint8_t> b = encode_frame(out);
    REQUIRE(a.size() == b.size());
    CHECK(std::equal(a.begin() + HEADER_SIZE, a.end(), b.begin() + HEADER_SIZE));

    in.payload.clear();
    CHECK(t.rewrite(in).payload.empty());
}

TEST_CASE("prefixed callsign is cut to 12 bytes") {
    ReplayTransform t;
    Frame in;
    in.header.callsign = make_callsign("ABCDEFGHIJKL");
    CHECK(to_std_string(t.rewrite(in).header.callsign) == "RE>ABCDEFGHI");
}

TEST_CASE("prefixed callsign never ends in half a character") {
    ReplayTransform t;
    Frame in;
    // "RE>" + 8 ASCII + U+00E9 = 13 bytes -> the é is dropped whole
    in.header.callsign = make_callsign("ABCDEFGH\xC3\xA9");
    CHECK(to_std_string(t.rewrite(in).header.callsign) == "RE>ABCDEFGH");
}

TEST_CASE("custom uid and prefix") {
    ReplayTransform t(4242, "E:");
    FrameHeader h;
    h.uid      = 1;
    h.callsign = make_callsign("BG5XYZ");
    const FrameHeader out = t.rewrite_header(h);
    CHECK(out.uid == 4242);
    CHECK(to_std_string(out.callsign) == "E:BG5XYZ");
    CHECK(t.prefix() == "E:");
}
