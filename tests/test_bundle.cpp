#include <gtest/gtest.h>

#include <cstring>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "tuiobridge/Bundle.h"
#include "tuiobridge/Encoder.h"
#include "tuiobridge/Exceptions.h"

using namespace tuiobridge;
using nlohmann::json;

namespace {
    Packet makePacket(const std::string& address, const json& args) {
        Packet packet;
        packet.address = address;
        packet.args = args;
        return packet;
    }

    uint32_t readBigEndian(const std::vector<std::byte>& data, size_t offset) {
        return (static_cast<uint32_t>(data[offset]) << 24) |
               (static_cast<uint32_t>(data[offset + 1]) << 16) |
               (static_cast<uint32_t>(data[offset + 2]) << 8) |
               static_cast<uint32_t>(data[offset + 3]);
    }

    const std::vector<std::byte> IMMEDIATE_BYTES = {
        std::byte{0}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{0}, std::byte{0}, std::byte{0}, std::byte{1}};
}  // namespace

TEST(Bundle, HeaderAndImmediateTimeTag) {
    std::vector<std::byte> encoded = encodeBundle({makePacket("/a", json::array({1}))});

    ASSERT_GE(encoded.size(), 16u);
    EXPECT_EQ(std::memcmp(encoded.data(), "#bundle\0", 8), 0);
    EXPECT_EQ(std::vector<std::byte>(encoded.begin() + 8, encoded.begin() + 16), IMMEDIATE_BYTES);
}

TEST(Bundle, RequestedTimeIsDiscarded) {
    std::vector<Packet> packets = {makePacket("/a", json::array({1})),
                                   makePacket("/b", json::array({2}))};

    std::vector<std::byte> immediate = encodeBundle(packets);
    std::vector<std::byte> now = encodeBundle(packets, TimeTag::now());
    std::vector<std::byte> fixed = encodeBundle(packets, TimeTag(3900000000u, 12345u));

    EXPECT_EQ(immediate, now);
    EXPECT_EQ(immediate, fixed);
    EXPECT_EQ(std::vector<std::byte>(fixed.begin() + 8, fixed.begin() + 16), IMMEDIATE_BYTES);
}

TEST(Bundle, ElementsAreLengthPrefixedInOrder) {
    std::vector<Packet> packets = {
        makePacket("/tuio/2Dcur", json::array({"source", "WebTUIO@test"})),
        makePacket("/tuio/2Dcur", json::array({"set", 1, 0.5, 0.5, 0.0, 0.0, 0.0})),
        makePacket("/tuio/2Dcur", json::array({"alive", 1})),
        makePacket("/tuio/2Dcur", json::array({"fseq", 1}))};

    std::vector<std::byte> encoded = encodeBundle(packets);

    size_t pos = 16;
    for (const auto& packet : packets) {
        std::vector<std::byte> expected = encodeMessage(packet);
        ASSERT_LE(pos + 4, encoded.size());
        EXPECT_EQ(readBigEndian(encoded, pos), expected.size());
        pos += 4;
        ASSERT_LE(pos + expected.size(), encoded.size());
        EXPECT_EQ(std::vector<std::byte>(encoded.begin() + pos,
                                         encoded.begin() + pos + expected.size()),
                  expected);
        pos += expected.size();
    }
    EXPECT_EQ(pos, encoded.size());
}

TEST(Bundle, EmptyBundleIsHeaderOnly) {
    Bundle bundle;
    EXPECT_TRUE(bundle.isEmpty());
    EXPECT_EQ(bundle.serialize().size(), 16u);
}

TEST(Bundle, GetTimeTagIsAlwaysImmediate) {
    TimeTag requested = TimeTag::now();
    Bundle bundle(requested);
    EXPECT_TRUE(bundle.getTimeTag().isImmediate());
    EXPECT_EQ(bundle.requestedTime(), requested);
}

TEST(Bundle, DecodeRecoversMessages) {
    std::vector<Packet> packets = {makePacket("/first", json::array({"x", 1})),
                                   makePacket("/second", json::array({2.5}))};
    std::vector<std::byte> encoded = encodeBundle(packets, TimeTag::now());

    Bundle decoded = Bundle::deserialize(encoded.data(), encoded.size());
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_TRUE(decoded.requestedTime().isImmediate());

    std::vector<std::string> paths;
    decoded.forEach([&paths](const Message& message) { paths.push_back(message.getPath()); });
    EXPECT_EQ(paths, (std::vector<std::string>{"/first", "/second"}));
    EXPECT_EQ(decoded.messages()[0].getArgument(0).asString(), "x");
    EXPECT_FLOAT_EQ(decoded.messages()[1].getArgument(0).asFloat(), 2.5f);
}

TEST(Bundle, DeserializeRejectsMalformedData) {
    std::vector<std::byte> encoded =
        encodeBundle({makePacket("/a", json::array({1})), makePacket("/b", json::array())});

    EXPECT_THROW(Bundle::deserialize(encoded.data(), 8), MalformedPacketException);

    // Element size runs past the end
    EXPECT_THROW(Bundle::deserialize(encoded.data(), encoded.size() - 4),
                 MalformedPacketException);

    std::vector<std::byte> wrongMarker = encoded;
    wrongMarker[1] = std::byte{'B'};
    EXPECT_THROW(Bundle::deserialize(wrongMarker.data(), wrongMarker.size()),
                 MalformedPacketException);

    // A bundle inside a bundle
    std::vector<std::byte> inner = encodeBundle({makePacket("/x", json::array())});
    Bundle outer;
    std::vector<std::byte> nested = outer.serialize();
    nested.push_back(std::byte{0});
    nested.push_back(std::byte{0});
    nested.push_back(std::byte{0});
    nested.push_back(static_cast<std::byte>(inner.size()));
    nested.insert(nested.end(), inner.begin(), inner.end());
    EXPECT_THROW(Bundle::deserialize(nested.data(), nested.size()), MalformedPacketException);
}
