/**
 * @file session_relay.hpp
 * @brief In-process room relay for sync traffic
 *
 * Models the room side of a watch session: participants join with a
 * delivery function, one of them is the host, and sync traffic from the
 * host fans out to everyone else. Messages from anyone but the host are
 * dropped, except resync requests.
 *
 * The relay keeps the host's last snapshot so a late joiner's request can
 * be answered without a round trip to the host.
 */

#pragma once

#include <tandem/core/result.hpp>
#include <tandem/sync/messages.hpp>
#include <tandem/sync/transport.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tandem::relay {

/**
 * @brief What the relay did with an inbound message
 */
enum class RelayDisposition : uint8_t {
    Forwarded,          // Fanned out to every other participant
    AnsweredFromCache,  // Cached snapshot sent back to the requester
    ForwardedToHost,    // Request passed on to the host
    NoState,            // Request with no cache and no host to ask
    NotHost,            // Sender may not publish sync traffic
    UnknownSender,      // Sender never joined
    Ignored,            // Message kind the relay does not accept from clients
};

/// Convert RelayDisposition to string
inline const char* relayDispositionToString(RelayDisposition d) {
    switch (d) {
        case RelayDisposition::Forwarded: return "Forwarded";
        case RelayDisposition::AnsweredFromCache: return "AnsweredFromCache";
        case RelayDisposition::ForwardedToHost: return "ForwardedToHost";
        case RelayDisposition::NoState: return "NoState";
        case RelayDisposition::NotHost: return "NotHost";
        case RelayDisposition::UnknownSender: return "UnknownSender";
        case RelayDisposition::Ignored: return "Ignored";
        default: return "Unknown";
    }
}

class SessionRelay {
public:
    using Delivery = std::function<void(const sync::SyncMessage&)>;

    SessionRelay() = default;

    // Non-copyable (transports hold a reference)
    SessionRelay(const SessionRelay&) = delete;
    SessionRelay& operator=(const SessionRelay&) = delete;

    // ========== Membership ==========

    /**
     * @brief Add a participant
     *
     * A joiner learns the current host right away.
     *
     * @return InvalidArgument for an empty id, missing delivery or duplicate id
     */
    Result<void> join(const std::string& participantId, Delivery delivery);

    /**
     * @brief Remove a participant
     *
     * When the host leaves the room has no host until setHost() is called,
     * and the cached snapshot is dropped.
     *
     * @return NotFound if the participant never joined
     */
    Result<void> leave(const std::string& participantId);

    /**
     * @brief Hand playback control to a participant
     *
     * Broadcasts room:host-changed to everyone, the new host included.
     *
     * @return NotFound if the participant never joined
     */
    Result<void> setHost(const std::string& participantId);

    // ========== Traffic ==========

    /// Handle a message sent by a participant
    RelayDisposition receive(const std::string& from, const sync::SyncMessage& message);

    /// Decode wire text, then receive(); InvalidData if it does not decode
    Result<RelayDisposition> receiveText(const std::string& from, std::string_view text);

    /**
     * @brief Transport that sends as the given participant
     *
     * The returned object refers to this relay and must not outlive it.
     */
    std::unique_ptr<sync::Transport> transportFor(const std::string& participantId);

    // ========== State ==========

    [[nodiscard]] std::optional<std::string> hostId() const;
    [[nodiscard]] std::optional<sync::PlaybackSnapshot> lastSnapshot() const;
    [[nodiscard]] size_t participantCount() const;
    [[nodiscard]] bool contains(const std::string& participantId) const;

private:
    void deliverTo(const std::string& participantId, const sync::SyncMessage& message);
    void broadcast(const sync::SyncMessage& message, const std::string* except);

    mutable std::mutex m_mutex;
    std::map<std::string, Delivery> m_participants;
    std::optional<std::string> m_hostId;
    std::optional<sync::PlaybackSnapshot> m_lastSnapshot;
};

} // namespace tandem::relay
