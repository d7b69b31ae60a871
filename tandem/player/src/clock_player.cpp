/**
 * @file clock_player.cpp
 * @brief ClockPlayer implementation
 */

#include <tandem/player/clock_player.hpp>

#include <algorithm>
#include <cmath>

namespace tandem::player {

ClockPlayer::ClockPlayer(const WallClock& wallClock)
    : m_clock(wallClock) {}

void ClockPlayer::load(std::string ref, std::optional<Seconds> duration) {
    m_contentRef = std::move(ref);
    m_duration = duration;
    m_clock.reset();
}

void ClockPlayer::unload() {
    m_contentRef.reset();
    m_duration.reset();
    m_clock.reset();
}

bool ClockPlayer::ended() const {
    return m_duration && m_clock.now() >= *m_duration;
}

Seconds ClockPlayer::currentTime() const {
    const Seconds position = m_clock.now();
    if (m_duration) {
        return std::min(position, *m_duration);
    }
    return position;
}

void ClockPlayer::seek(Seconds position) {
    if (!std::isfinite(position)) return;
    if (m_duration) {
        position = std::min(position, *m_duration);
    }
    m_clock.seek(position);
}

void ClockPlayer::setPlaybackRate(double rate) {
    if (!std::isfinite(rate)) return;
    m_clock.setRate(std::clamp(rate, kMinRate, kMaxRate));
}

void ClockPlayer::play() {
    m_clock.resume();
}

void ClockPlayer::pause() {
    // Freeze at the clamped position so a finished item does not keep
    // accumulating time past its end
    const Seconds position = currentTime();
    m_clock.pause();
    m_clock.seek(position);
}

bool ClockPlayer::isPlaying() const {
    return !m_clock.isPaused() && !ended();
}

} // namespace tandem::player
