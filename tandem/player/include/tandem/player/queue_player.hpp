/**
 * @file queue_player.hpp
 * @brief Hosted video-queue player adapter
 *
 * Models embedded players (YouTube-style iframes) that play one item of a
 * shared queue at a time and expose no speed control: setPlaybackRate()
 * is ignored and supportsPlaybackRate() is false, so peers using this
 * adapter converge by hard seeks only.
 */

#pragma once

#include <tandem/player/player_adapter.hpp>
#include <tandem/player/media_clock.hpp>
#include <tandem/core/result.hpp>
#include <tandem/core/signals.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tandem::player {

/**
 * @brief One entry of the play queue
 */
struct QueueItem {
    std::string ref;        ///< Content identifier (video id)
    std::string title;
    Seconds duration = 0.0; ///< Length in seconds; <= 0 means unknown
};

class QueuePlayer : public PlayerAdapter {
public:
    explicit QueuePlayer(const WallClock& wallClock);

    // ========== Queue Management ==========

    /// Append item; loads it when nothing is current
    void enqueue(QueueItem item);

    /**
     * @brief Remove an item by ref
     *
     * Removing the current item loads the next one (or unloads).
     * @return NotFound if ref is not queued
     */
    Result<void> remove(const std::string& ref);

    /**
     * @brief Make a queued item current, paused at zero
     * @return NotFound if ref is not queued
     */
    Result<void> load(const std::string& ref);

    /**
     * @brief Advance to the following item, keeping play/pause state
     * @return false at the end of the queue (player unloads)
     */
    bool next();

    /**
     * @brief Advance if the current item has played to its end
     *
     * Embedders call this from their player's "ended" notification or
     * a periodic poll.
     */
    bool advanceIfEnded();

    [[nodiscard]] const std::vector<QueueItem>& items() const { return m_items; }
    [[nodiscard]] const QueueItem* current() const;

    /// Fired with the new content ref whenever the current item changes
    Signal<std::optional<std::string>> currentChanged;

    // ========== PlayerAdapter ==========

    [[nodiscard]] Seconds currentTime() const override;
    void seek(Seconds position) override;

    [[nodiscard]] double playbackRate() const override { return 1.0; }
    void setPlaybackRate(double) override {}
    [[nodiscard]] bool supportsPlaybackRate() const override { return false; }

    void play() override;
    void pause() override;
    [[nodiscard]] bool isPlaying() const override;

    [[nodiscard]] std::optional<std::string> contentRef() const override;

private:
    void makeCurrent(std::optional<size_t> index);
    [[nodiscard]] std::optional<size_t> indexOf(const std::string& ref) const;

    MediaClock m_clock;
    std::vector<QueueItem> m_items;
    std::optional<size_t> m_current;
};

} // namespace tandem::player
