/**
 * @file messages.cpp
 * @brief Message validation
 */

#include <tandem/sync/messages.hpp>

#include <cmath>

namespace tandem::sync {

Result<void> validate(const PlaybackSnapshot& snapshot) {
    if (!std::isfinite(snapshot.position) || snapshot.position < 0.0) {
        return Err(ErrorCode::InvalidData, "Snapshot position out of range");
    }
    if (!std::isfinite(snapshot.rate) || snapshot.rate <= 0.0) {
        return Err(ErrorCode::InvalidData, "Snapshot rate out of range");
    }
    if (snapshot.capturedAtEpochMs < 0) {
        return Err(ErrorCode::InvalidData, "Snapshot timestamp is negative");
    }
    return Ok();
}

Result<void> validate(const DiscreteEvent& event) {
    switch (event.type) {
        case DiscreteEventType::Play:
        case DiscreteEventType::Pause:
        case DiscreteEventType::Seek:
            if (!std::isfinite(event.position) || event.position < 0.0) {
                return Err(ErrorCode::InvalidData,
                           std::string(discreteEventTypeToString(event.type)) +
                           " position out of range");
            }
            return Ok();
        case DiscreteEventType::SourceChanged:
        case DiscreteEventType::Buffering:
            return Ok();
    }
    return Err(ErrorCode::InvalidData, "Unknown discrete event type");
}

} // namespace tandem::sync
