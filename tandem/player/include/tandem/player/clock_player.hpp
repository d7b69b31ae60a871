/**
 * @file clock_player.hpp
 * @brief Software player driven by a MediaClock
 *
 * Stands in for any player whose position advances with wall time and
 * whose speed can be changed (HTML5 video, mpv, a decoded file). Used as
 * the reference adapter by the example program and the tests.
 */

#pragma once

#include <tandem/player/player_adapter.hpp>
#include <tandem/player/media_clock.hpp>

#include <optional>
#include <string>

namespace tandem::player {

class ClockPlayer : public PlayerAdapter {
public:
    /// Rates outside this range are clamped
    static constexpr double kMinRate = 0.25;
    static constexpr double kMaxRate = 4.0;

    explicit ClockPlayer(const WallClock& wallClock);

    // ========== Content ==========

    /**
     * @brief Load content, paused at position zero
     *
     * @param ref Content identifier
     * @param duration Length in seconds; nullopt for unbounded (live) media
     */
    void load(std::string ref, std::optional<Seconds> duration = std::nullopt);

    /// Unload content; position resets to zero
    void unload();

    [[nodiscard]] std::optional<Seconds> duration() const { return m_duration; }

    /// True once a bounded item has played to its end
    [[nodiscard]] bool ended() const;

    // ========== PlayerAdapter ==========

    [[nodiscard]] Seconds currentTime() const override;
    void seek(Seconds position) override;

    [[nodiscard]] double playbackRate() const override { return m_clock.rate(); }
    void setPlaybackRate(double rate) override;

    void play() override;
    void pause() override;
    [[nodiscard]] bool isPlaying() const override;

    [[nodiscard]] std::optional<std::string> contentRef() const override { return m_contentRef; }

private:
    MediaClock m_clock;
    std::optional<std::string> m_contentRef;
    std::optional<Seconds> m_duration;
};

} // namespace tandem::player
