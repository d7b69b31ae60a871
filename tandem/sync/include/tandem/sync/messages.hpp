/**
 * @file messages.hpp
 * @brief Values exchanged between participants of a watch session
 *
 * All of these are ephemeral: they are produced, sent, applied and
 * forgotten. Nothing here is persisted.
 */

#pragma once

#include <tandem/core/result.hpp>
#include <tandem/core/types.hpp>

#include <optional>
#include <string>
#include <variant>

namespace tandem::sync {

// ============================================================================
// Periodic State
// ============================================================================

/**
 * @brief Host playback state at one wall-clock instant
 *
 * capturedAtEpochMs is the host's clock; it never decreases within one
 * host session.
 */
struct PlaybackSnapshot {
    Seconds position = 0.0;
    bool isPlaying = false;
    double rate = 1.0;
    EpochMs capturedAtEpochMs = 0;
    std::optional<std::string> contentRef;

    bool operator==(const PlaybackSnapshot&) const = default;
};

/**
 * @brief Reject snapshots that must never reach the reconciler
 *
 * @return InvalidData for negative/non-finite position, non-finite or
 *         non-positive rate, or a negative timestamp
 */
Result<void> validate(const PlaybackSnapshot& snapshot);

// ============================================================================
// Discrete Events
// ============================================================================

enum class DiscreteEventType : uint8_t {
    Play,
    Pause,
    Seek,
    SourceChanged,
    Buffering,
};

/// Convert DiscreteEventType to string
inline const char* discreteEventTypeToString(DiscreteEventType type) {
    switch (type) {
        case DiscreteEventType::Play: return "Play";
        case DiscreteEventType::Pause: return "Pause";
        case DiscreteEventType::Seek: return "Seek";
        case DiscreteEventType::SourceChanged: return "SourceChanged";
        case DiscreteEventType::Buffering: return "Buffering";
        default: return "Unknown";
    }
}

/**
 * @brief Immediate host intent, applied on receipt without timing compensation
 *
 * Only the field matching the type is meaningful: position for
 * Play/Pause/Seek, contentRef for SourceChanged, buffering for Buffering.
 */
struct DiscreteEvent {
    DiscreteEventType type = DiscreteEventType::Seek;
    Seconds position = 0.0;
    std::optional<std::string> contentRef;
    bool buffering = false;

    static DiscreteEvent play(Seconds position) {
        return {DiscreteEventType::Play, position, std::nullopt, false};
    }
    static DiscreteEvent pause(Seconds position) {
        return {DiscreteEventType::Pause, position, std::nullopt, false};
    }
    static DiscreteEvent seek(Seconds position) {
        return {DiscreteEventType::Seek, position, std::nullopt, false};
    }
    static DiscreteEvent sourceChanged(std::optional<std::string> ref) {
        return {DiscreteEventType::SourceChanged, 0.0, std::move(ref), false};
    }
    static DiscreteEvent bufferingChanged(bool isBuffering) {
        return {DiscreteEventType::Buffering, 0.0, std::nullopt, isBuffering};
    }

    bool operator==(const DiscreteEvent&) const = default;
};

/// InvalidData for a Play/Pause/Seek position that is negative or non-finite
Result<void> validate(const DiscreteEvent& event);

// ============================================================================
// Session Control
// ============================================================================

/// Ask the current host (or the relay's cache) for a fresh snapshot
struct ResyncRequest {
    bool operator==(const ResyncRequest&) const = default;
};

/// Room collaborator's notification that hostId now owns playback
struct HostChanged {
    std::string hostId;

    bool operator==(const HostChanged&) const = default;
};

using SyncMessage = std::variant<PlaybackSnapshot, DiscreteEvent, ResyncRequest, HostChanged>;

} // namespace tandem::sync
