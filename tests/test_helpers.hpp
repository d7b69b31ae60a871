/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the unit tests
 */

#pragma once

#include <tandem/player/player_adapter.hpp>
#include <tandem/sync/messages.hpp>
#include <tandem/sync/transport.hpp>

#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

namespace tandem::test {

/// Transport that keeps every message it is asked to send
class RecordingTransport : public sync::Transport {
public:
    void send(const sync::SyncMessage& message) override {
        sent.push_back(message);
    }

    template<typename T>
    [[nodiscard]] std::vector<T> sentOf() const {
        std::vector<T> out;
        for (const auto& m : sent) {
            if (const T* typed = std::get_if<T>(&m)) {
                out.push_back(*typed);
            }
        }
        return out;
    }

    void clear() { sent.clear(); }

    std::vector<sync::SyncMessage> sent;
};

class MockPlayer : public player::PlayerAdapter {
public:
    MOCK_METHOD(Seconds, currentTime, (), (const, override));
    MOCK_METHOD(void, seek, (Seconds position), (override));
    MOCK_METHOD(double, playbackRate, (), (const, override));
    MOCK_METHOD(void, setPlaybackRate, (double rate), (override));
    MOCK_METHOD(bool, supportsPlaybackRate, (), (const, override));
    MOCK_METHOD(void, play, (), (override));
    MOCK_METHOD(void, pause, (), (override));
    MOCK_METHOD(bool, isPlaying, (), (const, override));
    MOCK_METHOD(std::optional<std::string>, contentRef, (), (const, override));
};

inline sync::PlaybackSnapshot makeSnapshot(Seconds position,
                                           bool isPlaying,
                                           EpochMs capturedAt,
                                           std::optional<std::string> contentRef = std::nullopt) {
    sync::PlaybackSnapshot s;
    s.position = position;
    s.isPlaying = isPlaying;
    s.capturedAtEpochMs = capturedAt;
    s.contentRef = std::move(contentRef);
    return s;
}

} // namespace tandem::test
