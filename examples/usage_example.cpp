/**
 * @file usage_example.cpp
 * @brief Walkthrough of a watch session: config, relay, host and peers
 */

#include <tandem/core/event_loop.hpp>
#include <tandem/core/logger.hpp>
#include <tandem/core/manual_scheduler.hpp>
#include <tandem/player/clock_player.hpp>
#include <tandem/player/queue_player.hpp>
#include <tandem/relay/session_relay.hpp>
#include <tandem/sync/io/wire_codec.hpp>
#include <tandem/sync/sync_engine.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace tandem;
using namespace tandem::sync;

void exampleConfigUsage(const char* path) {
    std::cout << "\n=== Config ===\n";

    SyncConfig config;
    if (path) {
        auto loaded = SyncConfig::load(path);
        if (!loaded) {
            std::cerr << "Using defaults: " << loaded.error().what() << "\n";
        } else {
            config = loaded.value();
        }
    }

    std::cout << config.toJson().dump(2) << "\n";
}

void exampleVirtualTimeSession() {
    std::cout << "\n=== Session on virtual time ===\n";

    ManualScheduler scheduler;
    relay::SessionRelay room;

    // Host plays a local file
    player::ClockPlayer hostPlayer(scheduler);
    hostPlayer.load("big_buck_bunny.mkv", 596.0);
    auto hostTransport = room.transportFor("host");
    SyncEngine host("host", scheduler, scheduler, *hostTransport);
    host.attachPlayer(&hostPlayer);

    // Peer starts 0.3 s behind and must be nudged
    player::ClockPlayer peerPlayer(scheduler);
    peerPlayer.load("big_buck_bunny.mkv", 596.0);
    auto peerTransport = room.transportFor("peer");
    SyncEngine peer("peer", scheduler, scheduler, *peerTransport);
    peer.attachPlayer(&peerPlayer);

    auto corrections = peer.correctionApplied.connectScoped([](const Correction& c) {
        std::cout << "  peer: " << correctionActionToString(c.action)
                  << " drift=" << c.drift << "s rate=" << c.rate << "\n";
    });

    (void)room.join("host", [&host](const SyncMessage& m) { host.onMessage(m); });
    (void)room.join("peer", [&peer](const SyncMessage& m) { peer.onMessage(m); });
    (void)room.setHost("host");

    hostPlayer.seek(60.0);
    hostPlayer.play();
    host.emitPlay();

    peerPlayer.seek(59.7);

    for (int i = 0; i < 4; ++i) {
        scheduler.advance(Milliseconds(1500));
        std::cout << "  t+" << (i + 1) * 1.5 << "s host=" << hostPlayer.currentTime()
                  << " peer=" << peerPlayer.currentTime() << "\n";
    }

    // Late delivery of an old snapshot is dropped
    auto late = peer.onSnapshot(PlaybackSnapshot{0.0, false, 1.0, 0, std::nullopt});
    std::cout << "  out-of-order snapshot: " << snapshotDispositionToString(late) << "\n";

    // Host pauses; peer lands on the same frame
    hostPlayer.pause();
    host.emitPause();
    std::cout << "  paused: host=" << hostPlayer.currentTime()
              << " peer=" << peerPlayer.currentTime() << "\n";
}

void exampleQueuePlayerUsage() {
    std::cout << "\n=== Queue player peer ===\n";

    ManualScheduler scheduler;
    relay::SessionRelay room;

    player::QueuePlayer hostQueue(scheduler);
    hostQueue.enqueue({"dQw4w9WgXcQ", "Never Gonna Give You Up", 212.0});
    hostQueue.enqueue({"9bZkp7q19f0", "Gangnam Style", 252.0});

    player::QueuePlayer peerQueue(scheduler);
    peerQueue.enqueue({"dQw4w9WgXcQ", "Never Gonna Give You Up", 212.0});
    peerQueue.enqueue({"9bZkp7q19f0", "Gangnam Style", 252.0});

    auto hostTransport = room.transportFor("host");
    auto peerTransport = room.transportFor("peer");
    SyncEngine host("host", scheduler, scheduler, *hostTransport);
    SyncEngine peer("peer", scheduler, scheduler, *peerTransport);
    host.attachPlayer(&hostQueue);
    peer.attachPlayer(&peerQueue);

    // The application owns loading; the engine only reports the switch
    auto sourceConn = peer.sourceChanged.connectScoped([&peerQueue](std::optional<std::string> ref) {
        if (ref && peerQueue.load(*ref)) {
            std::cout << "  peer loaded " << *ref << "\n";
        }
    });
    auto hostConn = hostQueue.currentChanged.connectScoped([&host](std::optional<std::string> ref) {
        host.emitSourceChanged(ref);
    });

    (void)room.join("host", [&host](const SyncMessage& m) { host.onMessage(m); });
    (void)room.join("peer", [&peer](const SyncMessage& m) { peer.onMessage(m); });
    (void)room.setHost("host");

    hostQueue.play();
    host.emitPlay();
    scheduler.advance(Milliseconds(3000));

    hostQueue.next();
    scheduler.advance(Milliseconds(1500));

    std::cout << "  host=" << hostQueue.contentRef().value_or("-")
              << " peer=" << peerQueue.contentRef().value_or("-") << "\n";
}

void exampleWireUsage() {
    std::cout << "\n=== Wire format ===\n";

    io::JsonTransport socket([](std::string text) {
        std::cout << "  -> " << text << "\n";
    });
    socket.send(DiscreteEvent::seek(42.0));
    socket.send(ResyncRequest{});

    auto decoded = io::WireCodec::decode(R"({"event": "sync:play", "data": 12.5})");
    if (decoded) {
        std::cout << "  <- " << io::WireCodec::eventName(decoded.value()) << "\n";
    }
}

void exampleRealTimeUsage() {
    std::cout << "\n=== Real-time event loop ===\n";

    // Ticks every 100 ms; keep the console readable
    setLogLevel(spdlog::level::info);

    EventLoop loop;
    loop.start();

    relay::SessionRelay room;
    player::ClockPlayer hostPlayer(loop.wallClock());
    player::ClockPlayer peerPlayer(loop.wallClock());
    hostPlayer.load("live", std::nullopt);
    peerPlayer.load("live", std::nullopt);

    SyncConfig config;
    config.broadcastInterval = Milliseconds(100);

    auto hostTransport = room.transportFor("host");
    auto peerTransport = room.transportFor("peer");
    SyncEngine host("host", loop, loop.wallClock(), *hostTransport, config);
    SyncEngine peer("peer", loop, loop.wallClock(), *peerTransport, config);

    // Engines are only touched from the loop thread
    loop.post([&] {
        host.attachPlayer(&hostPlayer);
        peer.attachPlayer(&peerPlayer);
        (void)room.join("host", [&](const SyncMessage& m) { host.onMessage(m); });
        (void)room.join("peer", [&](const SyncMessage& m) { peer.onMessage(m); });
        (void)room.setHost("host");
        hostPlayer.seek(5.0);
        hostPlayer.play();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(350));

    loop.post([&] {
        host.shutdown();
        peer.shutdown();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    loop.stop();

    std::cout << "  host=" << hostPlayer.currentTime()
              << " peer=" << peerPlayer.currentTime() << "\n";
}

int main(int argc, char** argv) {
    if (argc > 2) {
        initFileLogging("tandem-example", argv[2], spdlog::level::debug);
    } else {
        initLogging("tandem-example", spdlog::level::debug);
    }

    std::cout << "Tandem usage examples\n";
    std::cout << "=====================\n";

    try {
        exampleConfigUsage(argc > 1 ? argv[1] : nullptr);
        exampleVirtualTimeSession();
        exampleQueuePlayerUsage();
        exampleWireUsage();
        exampleRealTimeUsage();

        std::cout << "\nDone.\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
