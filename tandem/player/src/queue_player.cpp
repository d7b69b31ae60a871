/**
 * @file queue_player.cpp
 * @brief QueuePlayer implementation
 */

#include <tandem/player/queue_player.hpp>
#include <tandem/core/logger.hpp>

#include <algorithm>
#include <cmath>

namespace tandem::player {

QueuePlayer::QueuePlayer(const WallClock& wallClock)
    : m_clock(wallClock) {}

// ============================================================================
// Queue Management
// ============================================================================

void QueuePlayer::enqueue(QueueItem item) {
    if (indexOf(item.ref)) {
        LOG_DEBUG("[QueuePlayer] '{}' already queued", item.ref);
        return;
    }
    m_items.push_back(std::move(item));
    if (!m_current) {
        makeCurrent(m_items.size() - 1);
    }
}

Result<void> QueuePlayer::remove(const std::string& ref) {
    auto index = indexOf(ref);
    if (!index) {
        return Err(ErrorCode::NotFound, "Not in queue: " + ref);
    }

    const bool wasCurrent = m_current == index;
    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(*index));

    if (wasCurrent) {
        // The following item slid into the removed slot
        makeCurrent(*index < m_items.size() ? std::optional<size_t>(*index) : std::nullopt);
    } else if (m_current && *m_current > *index) {
        --*m_current;
    }
    return Ok();
}

Result<void> QueuePlayer::load(const std::string& ref) {
    auto index = indexOf(ref);
    if (!index) {
        return Err(ErrorCode::NotFound, "Not in queue: " + ref);
    }
    makeCurrent(index);
    return Ok();
}

bool QueuePlayer::next() {
    if (!m_current) {
        return false;
    }

    const bool wasPlaying = !m_clock.isPaused();
    const size_t following = *m_current + 1;
    if (following >= m_items.size()) {
        makeCurrent(std::nullopt);
        return false;
    }

    makeCurrent(following);
    if (wasPlaying) {
        m_clock.resume();
    }
    return true;
}

bool QueuePlayer::advanceIfEnded() {
    const QueueItem* item = current();
    if (!item || item->duration <= 0.0 || m_clock.now() < item->duration) {
        return false;
    }
    return next();
}

const QueueItem* QueuePlayer::current() const {
    return m_current ? &m_items[*m_current] : nullptr;
}

// ============================================================================
// PlayerAdapter
// ============================================================================

Seconds QueuePlayer::currentTime() const {
    const QueueItem* item = current();
    if (!item) {
        return 0.0;
    }
    const Seconds position = m_clock.now();
    return item->duration > 0.0 ? std::min(position, item->duration) : position;
}

void QueuePlayer::seek(Seconds position) {
    const QueueItem* item = current();
    if (!item || !std::isfinite(position)) return;
    if (item->duration > 0.0) {
        position = std::min(position, item->duration);
    }
    m_clock.seek(position);
}

void QueuePlayer::play() {
    if (!current()) return;
    m_clock.resume();
}

void QueuePlayer::pause() {
    const Seconds position = currentTime();
    m_clock.pause();
    m_clock.seek(position);
}

bool QueuePlayer::isPlaying() const {
    const QueueItem* item = current();
    if (!item || m_clock.isPaused()) {
        return false;
    }
    return item->duration <= 0.0 || m_clock.now() < item->duration;
}

std::optional<std::string> QueuePlayer::contentRef() const {
    const QueueItem* item = current();
    if (!item) {
        return std::nullopt;
    }
    return item->ref;
}

// ============================================================================
// Helpers
// ============================================================================

void QueuePlayer::makeCurrent(std::optional<size_t> index) {
    m_current = index;
    m_clock.reset();
    currentChanged.fire(contentRef());
}

std::optional<size_t> QueuePlayer::indexOf(const std::string& ref) const {
    auto it = std::find_if(m_items.begin(), m_items.end(),
        [&ref](const QueueItem& item) { return item.ref == ref; });
    if (it == m_items.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - m_items.begin());
}

} // namespace tandem::player
