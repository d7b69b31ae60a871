#include <tandem/core/manual_scheduler.hpp>
#include <tandem/player/clock_player.hpp>
#include <tandem/sync/io/wire_codec.hpp>
#include <tandem/sync/sync_engine.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace tandem;
using namespace tandem::sync;
using namespace tandem::sync::io;
using json = nlohmann::json;

TEST(WireCodecTest, SnapshotUsesWireKeys) {
    PlaybackSnapshot s;
    s.position = 12.5;
    s.isPlaying = true;
    s.rate = 1.0;
    s.capturedAtEpochMs = 1'700'000'000'000;
    s.contentRef = "dQw4w9WgXcQ";

    json envelope = WireCodec::toJson(s);

    EXPECT_EQ(envelope["event"], "sync:state");
    EXPECT_DOUBLE_EQ(envelope["data"]["currentTime"].get<double>(), 12.5);
    EXPECT_EQ(envelope["data"]["isPlaying"], true);
    EXPECT_EQ(envelope["data"]["timestamp"].get<int64_t>(), 1'700'000'000'000);
    EXPECT_EQ(envelope["data"]["contentRef"], "dQw4w9WgXcQ");
}

TEST(WireCodecTest, EventNamesMatchProtocol) {
    EXPECT_STREQ(WireCodec::eventName(DiscreteEvent::play(1.0)), "sync:play");
    EXPECT_STREQ(WireCodec::eventName(DiscreteEvent::pause(1.0)), "sync:pause");
    EXPECT_STREQ(WireCodec::eventName(DiscreteEvent::seek(1.0)), "sync:seek");
    EXPECT_STREQ(WireCodec::eventName(DiscreteEvent::bufferingChanged(true)), "sync:buffer");
    EXPECT_STREQ(WireCodec::eventName(DiscreteEvent::sourceChanged("x")), "sync:source");
    EXPECT_STREQ(WireCodec::eventName(ResyncRequest{}), "sync:request");
    EXPECT_STREQ(WireCodec::eventName(HostChanged{"u1"}), "room:host-changed");
}

TEST(WireCodecTest, DecodesBareNumberPayloads) {
    auto play = WireCodec::decode(R"({"event": "sync:play", "data": 25})");
    ASSERT_TRUE(play);
    EXPECT_EQ(std::get<DiscreteEvent>(play.value()), DiscreteEvent::play(25.0));

    auto seek = WireCodec::decode(R"({"event": "sync:seek", "data": {"time": 40.5}})");
    ASSERT_TRUE(seek);
    EXPECT_EQ(std::get<DiscreteEvent>(seek.value()), DiscreteEvent::seek(40.5));
}

TEST(WireCodecTest, DecodesSnapshotWithDefaults) {
    auto decoded = WireCodec::decode(
        R"({"event": "sync:state", "data": {"currentTime": 3.25, "isPlaying": false, "timestamp": 1700000000123}})");
    ASSERT_TRUE(decoded);

    const auto& s = std::get<PlaybackSnapshot>(decoded.value());
    EXPECT_DOUBLE_EQ(s.position, 3.25);
    EXPECT_FALSE(s.isPlaying);
    EXPECT_DOUBLE_EQ(s.rate, 1.0);
    EXPECT_EQ(s.capturedAtEpochMs, 1700000000123);
    EXPECT_FALSE(s.contentRef.has_value());
}

TEST(WireCodecTest, FractionalTimestampIsRounded) {
    auto decoded = WireCodec::decode(
        R"({"event": "sync:state", "data": {"currentTime": 1, "isPlaying": true, "timestamp": 1700000000000.6}})");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(std::get<PlaybackSnapshot>(decoded.value()).capturedAtEpochMs, 1700000000001);
}

TEST(WireCodecTest, DecodesControlMessages) {
    auto request = WireCodec::decode(R"({"event": "sync:request"})");
    ASSERT_TRUE(request);
    EXPECT_TRUE(std::holds_alternative<ResyncRequest>(request.value()));

    auto host = WireCodec::decode(R"({"event": "room:host-changed", "data": "user-42"})");
    ASSERT_TRUE(host);
    EXPECT_EQ(std::get<HostChanged>(host.value()).hostId, "user-42");

    auto buffer = WireCodec::decode(R"({"event": "sync:buffer", "data": true})");
    ASSERT_TRUE(buffer);
    EXPECT_EQ(std::get<DiscreteEvent>(buffer.value()), DiscreteEvent::bufferingChanged(true));

    auto source = WireCodec::decode(R"({"event": "sync:source", "data": {"contentRef": null}})");
    ASSERT_TRUE(source);
    EXPECT_EQ(std::get<DiscreteEvent>(source.value()), DiscreteEvent::sourceChanged(std::nullopt));
}

TEST(WireCodecTest, EncodedTextDecodesToSameMessage) {
    const SyncMessage message = DiscreteEvent::sourceChanged("magnet:?xt=urn:btih:abc");
    auto decoded = WireCodec::decode(WireCodec::encode(message));

    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), message);
}

TEST(WireCodecTest, RejectsBadInput) {
    const std::vector<std::string> bad = {
        "",
        "not json",
        "[1, 2, 3]",
        R"({"data": 1})",
        R"({"event": 7})",
        R"({"event": "sync:teleport", "data": 1})",
        R"({"event": "sync:play", "data": "ten"})",
        R"({"event": "sync:play"})",
        R"({"event": "sync:buffer", "data": 1})",
        R"({"event": "sync:source", "data": "abc"})",
        R"({"event": "sync:state", "data": {"isPlaying": true, "timestamp": 1}})",
        R"({"event": "sync:state", "data": {"currentTime": 1, "isPlaying": "yes", "timestamp": 1}})",
        R"({"event": "sync:state", "data": {"currentTime": 1, "isPlaying": true, "timestamp": 1, "contentRef": 5}})",
        R"({"event": "room:host-changed", "data": 42})",
    };

    for (const auto& text : bad) {
        auto decoded = WireCodec::decode(text);
        ASSERT_FALSE(decoded) << text;
        EXPECT_EQ(decoded.error().code(), ErrorCode::InvalidData) << text;
    }
}

TEST(WireCodecTest, JsonTransportHandsTextToSocket) {
    std::vector<std::string> wire;
    JsonTransport transport([&](std::string text) { wire.push_back(std::move(text)); });

    transport.send(DiscreteEvent::pause(55.0));

    ASSERT_EQ(wire.size(), 1u);
    auto envelope = json::parse(wire[0]);
    EXPECT_EQ(envelope["event"], "sync:pause");
    EXPECT_DOUBLE_EQ(envelope["data"].get<double>(), 55.0);
}

TEST(WireCodecTest, NonUtf8ContentRefIsReplacedNotThrown) {
    const SyncMessage message = DiscreteEvent::sourceChanged(std::string("Film\xE9.mkv"));

    std::string text;
    ASSERT_NO_THROW(text = WireCodec::encode(message));

    auto decoded = WireCodec::decode(text);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(std::get<DiscreteEvent>(decoded.value()).contentRef, "Film\xEF\xBF\xBD.mkv");
}

TEST(WireCodecTest, HostBroadcastsLatin1FileName) {
    ManualScheduler scheduler;
    std::vector<std::string> wire;
    JsonTransport transport([&](std::string text) { wire.push_back(std::move(text)); });

    tandem::player::ClockPlayer player(scheduler);
    player.load(std::string("Film\xE9.mkv"));
    player.play();

    SyncEngine engine("host", scheduler, scheduler, transport);
    engine.attachPlayer(&player);
    engine.setRole(Role::Host);

    ASSERT_NO_THROW(scheduler.advance(Milliseconds(1500)));
    ASSERT_TRUE(engine.emitSourceChanged(std::string("Autre\xE9.mkv")));

    ASSERT_FALSE(wire.empty());
    for (const auto& text : wire) {
        EXPECT_TRUE(WireCodec::decode(text)) << text;
    }
    engine.shutdown();
}

TEST(WireCodecTest, TimestampAtInt64LimitIsRejected) {
    for (const char* ts : {"9.223372036854775808e18", "9223372036854775808"}) {
        const std::string text = std::string(R"({"event": "sync:state", "data": {"currentTime": 1, "isPlaying": true, "timestamp": )") + ts + "}}";
        auto decoded = WireCodec::decode(text);
        ASSERT_FALSE(decoded) << ts;
        EXPECT_EQ(decoded.error().code(), ErrorCode::InvalidData);
    }
}
