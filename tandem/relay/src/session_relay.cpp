/**
 * @file session_relay.cpp
 * @brief SessionRelay implementation
 */

#include <tandem/relay/session_relay.hpp>
#include <tandem/core/logger.hpp>
#include <tandem/sync/io/wire_codec.hpp>

#include <type_traits>
#include <variant>
#include <vector>

namespace tandem::relay {

namespace {

class RelayTransport : public sync::Transport {
public:
    RelayTransport(SessionRelay& relay, std::string participantId)
        : m_relay(relay)
        , m_participantId(std::move(participantId)) {}

    void send(const sync::SyncMessage& message) override {
        m_relay.receive(m_participantId, message);
    }

private:
    SessionRelay& m_relay;
    std::string m_participantId;
};

} // namespace

// ============================================================================
// Membership
// ============================================================================

Result<void> SessionRelay::join(const std::string& participantId, Delivery delivery) {
    if (participantId.empty()) {
        return Err(ErrorCode::InvalidArgument, "Empty participant id");
    }
    if (!delivery) {
        return Err(ErrorCode::InvalidArgument, "No delivery for " + participantId);
    }

    std::optional<std::string> host;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_participants.count(participantId) > 0) {
            return Err(ErrorCode::InvalidArgument, "Already joined: " + participantId);
        }
        m_participants.emplace(participantId, std::move(delivery));
        host = m_hostId;
    }

    LOG_INFO("[Relay] {} joined", participantId);

    if (host) {
        deliverTo(participantId, sync::HostChanged{*host});
    }
    return Ok();
}

Result<void> SessionRelay::leave(const std::string& participantId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_participants.erase(participantId) == 0) {
            return Err(ErrorCode::NotFound, "Not in room: " + participantId);
        }
        if (m_hostId == participantId) {
            m_hostId.reset();
            m_lastSnapshot.reset();
        }
    }

    LOG_INFO("[Relay] {} left", participantId);
    return Ok();
}

Result<void> SessionRelay::setHost(const std::string& participantId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_participants.count(participantId) == 0) {
            return Err(ErrorCode::NotFound, "Not in room: " + participantId);
        }
        if (m_hostId != participantId) {
            // The old host's position no longer describes the session
            m_lastSnapshot.reset();
        }
        m_hostId = participantId;
    }

    LOG_INFO("[Relay] Host is now {}", participantId);
    broadcast(sync::HostChanged{participantId}, nullptr);
    return Ok();
}

// ============================================================================
// Traffic
// ============================================================================

RelayDisposition SessionRelay::receive(const std::string& from, const sync::SyncMessage& message) {
    std::optional<std::string> host;
    std::optional<sync::PlaybackSnapshot> cached;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_participants.count(from) == 0) {
            LOG_WARN("[Relay] Message from unknown participant {}", from);
            return RelayDisposition::UnknownSender;
        }
        host = m_hostId;
        cached = m_lastSnapshot;
    }

    const bool fromHost = host && *host == from;

    return std::visit([&](const auto& m) -> RelayDisposition {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, sync::ResyncRequest>) {
            if (cached) {
                LOG_DEBUG("[Relay] Answering {} from cache", from);
                deliverTo(from, *cached);
                return RelayDisposition::AnsweredFromCache;
            }
            if (host && !fromHost) {
                LOG_DEBUG("[Relay] No cached state, asking host {}", *host);
                deliverTo(*host, m);
                return RelayDisposition::ForwardedToHost;
            }
            return RelayDisposition::NoState;
        } else if constexpr (std::is_same_v<T, sync::HostChanged>) {
            // Host assignment belongs to the room, not to clients
            LOG_WARN("[Relay] {} tried to announce host {}", from, m.hostId);
            return RelayDisposition::Ignored;
        } else {
            if (!fromHost) {
                LOG_DEBUG("[Relay] Dropped {} from non-host {}",
                          sync::io::WireCodec::eventName(message), from);
                return RelayDisposition::NotHost;
            }
            if constexpr (std::is_same_v<T, sync::PlaybackSnapshot>) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_lastSnapshot = m;
            }
            broadcast(message, &from);
            return RelayDisposition::Forwarded;
        }
    }, message);
}

Result<RelayDisposition> SessionRelay::receiveText(const std::string& from, std::string_view text) {
    auto decoded = sync::io::WireCodec::decode(text);
    if (!decoded) {
        LOG_WARN("[Relay] Undecodable message from {}: {}", from, decoded.error().what());
        return Err<RelayDisposition>(decoded.error());
    }
    const RelayDisposition disposition = receive(from, decoded.value());
    LOG_TRACE("[Relay] {} from {}: {}", sync::io::WireCodec::eventName(decoded.value()), from,
              relayDispositionToString(disposition));
    return Ok(disposition);
}

std::unique_ptr<sync::Transport> SessionRelay::transportFor(const std::string& participantId) {
    return std::make_unique<RelayTransport>(*this, participantId);
}

void SessionRelay::deliverTo(const std::string& participantId, const sync::SyncMessage& message) {
    Delivery delivery;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_participants.find(participantId);
        if (it == m_participants.end()) {
            return;
        }
        delivery = it->second;
    }
    delivery(message);
}

void SessionRelay::broadcast(const sync::SyncMessage& message, const std::string* except) {
    // Copy so deliveries can re-enter the relay
    std::vector<Delivery> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targets.reserve(m_participants.size());
        for (const auto& [id, delivery] : m_participants) {
            if (except && id == *except) continue;
            targets.push_back(delivery);
        }
    }

    for (const auto& delivery : targets) {
        delivery(message);
    }
}

// ============================================================================
// State
// ============================================================================

std::optional<std::string> SessionRelay::hostId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hostId;
}

std::optional<sync::PlaybackSnapshot> SessionRelay::lastSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastSnapshot;
}

size_t SessionRelay::participantCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_participants.size();
}

bool SessionRelay::contains(const std::string& participantId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_participants.count(participantId) > 0;
}

} // namespace tandem::relay
