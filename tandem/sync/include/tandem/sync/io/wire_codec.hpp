/**
 * @file wire_codec.hpp
 * @brief JSON wire format for sync messages
 *
 * Every message is an envelope naming the event and carrying its payload:
 *
 * @code
 *   {"event": "sync:state",
 *    "data": {"currentTime": 12.5, "isPlaying": true, "playbackRate": 1.0,
 *             "timestamp": 1700000000000, "contentRef": "magnet:?xt=..."}}
 *   {"event": "sync:play",   "data": 12.5}
 *   {"event": "sync:pause",  "data": 12.5}
 *   {"event": "sync:seek",   "data": 40.0}
 *   {"event": "sync:source", "data": {"contentRef": "dQw4w9WgXcQ"}}
 *   {"event": "sync:buffer", "data": true}
 *   {"event": "sync:request"}
 *   {"event": "room:host-changed", "data": "user-42"}
 * @endcode
 */

#pragma once

#include <tandem/core/result.hpp>
#include <tandem/sync/messages.hpp>
#include <tandem/sync/transport.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace tandem::sync::io {

/// Event names on the wire
namespace events {
constexpr const char* kState = "sync:state";
constexpr const char* kPlay = "sync:play";
constexpr const char* kPause = "sync:pause";
constexpr const char* kSeek = "sync:seek";
constexpr const char* kSource = "sync:source";
constexpr const char* kBuffer = "sync:buffer";
constexpr const char* kRequest = "sync:request";
constexpr const char* kHostChanged = "room:host-changed";
} // namespace events

class WireCodec {
public:
    /// Envelope as a JSON value
    static nlohmann::json toJson(const SyncMessage& message);

    /// Parse an envelope; InvalidData on unknown events or bad payloads
    static Result<SyncMessage> fromJson(const nlohmann::json& envelope);

    /// Serialized envelope; never throws
    static std::string encode(const SyncMessage& message);

    /// Parse serialized envelope; never throws
    static Result<SyncMessage> decode(std::string_view text);

    /// Wire event name of a message
    static const char* eventName(const SyncMessage& message);
};

/**
 * @brief Transport that serializes to JSON and hands text to a socket
 */
class JsonTransport : public Transport {
public:
    using SendFunction = std::function<void(std::string)>;

    explicit JsonTransport(SendFunction send)
        : m_send(std::move(send)) {}

    void send(const SyncMessage& message) override {
        if (m_send) {
            m_send(WireCodec::encode(message));
        }
    }

private:
    SendFunction m_send;
};

} // namespace tandem::sync::io
