/**
 * @file player_adapter.hpp
 * @brief Abstract interface over the concrete media player
 *
 * The sync engine reads and mutates the local player only through this
 * interface, so one protocol implementation serves every player type.
 * Implementations hold no protocol logic.
 */

#pragma once

#include <tandem/core/types.hpp>

#include <optional>
#include <string>

namespace tandem::player {

class PlayerAdapter {
public:
    virtual ~PlayerAdapter() = default;

    // ========== Position ==========

    /// Current playback position in seconds
    [[nodiscard]] virtual Seconds currentTime() const = 0;

    /// Jump to position (seconds)
    virtual void seek(Seconds position) = 0;

    // ========== Rate ==========

    [[nodiscard]] virtual double playbackRate() const = 0;

    virtual void setPlaybackRate(double rate) = 0;

    /**
     * @brief Whether setPlaybackRate() has any effect
     *
     * Players that cannot change speed return false; the reconciler
     * then skips gentle correction and relies on hard seeks only.
     */
    [[nodiscard]] virtual bool supportsPlaybackRate() const { return true; }

    // ========== Transport ==========

    virtual void play() = 0;
    virtual void pause() = 0;

    [[nodiscard]] virtual bool isPlaying() const = 0;

    // ========== Content ==========

    /// Identifier of the loaded content, or nullopt when nothing is loaded
    [[nodiscard]] virtual std::optional<std::string> contentRef() const = 0;
};

} // namespace tandem::player
