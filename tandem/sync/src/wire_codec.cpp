/**
 * @file wire_codec.cpp
 * @brief JSON wire format implementation
 */

#include <tandem/sync/io/wire_codec.hpp>

#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace tandem::sync::io {

// ============================================================================
// JSON Serialization Helpers
// ============================================================================

namespace {

template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

json optionalStringToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

Result<std::optional<std::string>> optionalStringFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::optional<std::string>();
    }
    if (!j[key].is_string()) {
        return Err<std::optional<std::string>>(ErrorCode::InvalidData,
                                               std::string(key) + " must be a string or null");
    }
    return std::optional<std::string>(j[key].get<std::string>());
}

Result<Seconds> secondsFromJson(const json& j, const char* what) {
    if (!j.is_number()) {
        return Err<Seconds>(ErrorCode::InvalidData, std::string(what) + " must be a number");
    }
    return j.get<double>();
}

// PlaybackSnapshot
json snapshotToJson(const PlaybackSnapshot& s) {
    return {
        {"currentTime", s.position},
        {"isPlaying", s.isPlaying},
        {"playbackRate", s.rate},
        {"timestamp", s.capturedAtEpochMs},
        {"contentRef", optionalStringToJson(s.contentRef)}
    };
}

Result<SyncMessage> snapshotFromJson(const json& j) {
    if (!j.is_object()) {
        return Err<SyncMessage>(ErrorCode::InvalidData, "sync:state payload must be an object");
    }
    if (!j.contains("currentTime") || !j["currentTime"].is_number()) {
        return Err<SyncMessage>(ErrorCode::InvalidData, "sync:state missing numeric currentTime");
    }
    if (!j.contains("isPlaying") || !j["isPlaying"].is_boolean()) {
        return Err<SyncMessage>(ErrorCode::InvalidData, "sync:state missing boolean isPlaying");
    }
    if (!j.contains("timestamp") || !j["timestamp"].is_number()) {
        return Err<SyncMessage>(ErrorCode::InvalidData, "sync:state missing numeric timestamp");
    }

    PlaybackSnapshot s;
    s.position = j["currentTime"].get<double>();
    s.isPlaying = j["isPlaying"].get<bool>();

    if (j.contains("playbackRate")) {
        if (!j["playbackRate"].is_number()) {
            return Err<SyncMessage>(ErrorCode::InvalidData, "sync:state playbackRate must be a number");
        }
        s.rate = j["playbackRate"].get<double>();
    }

    const json& ts = j["timestamp"];
    if (ts.is_number_unsigned()) {
        if (ts.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return Err<SyncMessage>(ErrorCode::InvalidData, "sync:state timestamp out of range");
        }
        s.capturedAtEpochMs = ts.get<int64_t>();
    } else if (ts.is_number_integer()) {
        s.capturedAtEpochMs = ts.get<int64_t>();
    } else {
        // 2^63 is exactly representable and already past int64 range
        const double raw = ts.get<double>();
        if (!std::isfinite(raw) || std::abs(raw) >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return Err<SyncMessage>(ErrorCode::InvalidData, "sync:state timestamp out of range");
        }
        s.capturedAtEpochMs = static_cast<EpochMs>(std::llround(raw));
    }

    auto ref = optionalStringFromJson(j, "contentRef");
    if (!ref) {
        return Err<SyncMessage>(ref.error());
    }
    s.contentRef = ref.value();

    return SyncMessage(std::move(s));
}

// DiscreteEvent
const char* discreteEventName(DiscreteEventType type) {
    switch (type) {
        case DiscreteEventType::Play: return events::kPlay;
        case DiscreteEventType::Pause: return events::kPause;
        case DiscreteEventType::Seek: return events::kSeek;
        case DiscreteEventType::SourceChanged: return events::kSource;
        case DiscreteEventType::Buffering: return events::kBuffer;
        default: return "sync:unknown";
    }
}

json discreteEventPayload(const DiscreteEvent& e) {
    switch (e.type) {
        case DiscreteEventType::Play:
        case DiscreteEventType::Pause:
        case DiscreteEventType::Seek:
            return e.position;
        case DiscreteEventType::SourceChanged:
            return {{"contentRef", optionalStringToJson(e.contentRef)}};
        case DiscreteEventType::Buffering:
            return e.buffering;
    }
    return nullptr;
}

Result<SyncMessage> positionEventFromJson(const json& data, DiscreteEventType type, const char* name) {
    auto position = secondsFromJson(data, name);
    if (!position) {
        return Err<SyncMessage>(position.error());
    }
    DiscreteEvent e;
    e.type = type;
    e.position = position.value();
    return SyncMessage(std::move(e));
}

} // namespace

// ============================================================================
// WireCodec
// ============================================================================

const char* WireCodec::eventName(const SyncMessage& message) {
    return std::visit(Overloaded{
        [](const PlaybackSnapshot&) { return events::kState; },
        [](const DiscreteEvent& e) { return discreteEventName(e.type); },
        [](const ResyncRequest&) { return events::kRequest; },
        [](const HostChanged&) { return events::kHostChanged; },
    }, message);
}

json WireCodec::toJson(const SyncMessage& message) {
    json envelope = {{"event", eventName(message)}};

    std::visit(Overloaded{
        [&](const PlaybackSnapshot& s) { envelope["data"] = snapshotToJson(s); },
        [&](const DiscreteEvent& e) { envelope["data"] = discreteEventPayload(e); },
        [&](const ResyncRequest&) {},
        [&](const HostChanged& h) { envelope["data"] = h.hostId; },
    }, message);

    return envelope;
}

Result<SyncMessage> WireCodec::fromJson(const json& envelope) {
    if (!envelope.is_object() || !envelope.contains("event") || !envelope["event"].is_string()) {
        return Err<SyncMessage>(ErrorCode::InvalidData, "Envelope missing string 'event'");
    }

    const std::string event = envelope["event"].get<std::string>();
    const json data = envelope.value("data", json(nullptr));

    if (event == events::kState) {
        return snapshotFromJson(data);
    }
    if (event == events::kPlay) {
        return positionEventFromJson(data, DiscreteEventType::Play, events::kPlay);
    }
    if (event == events::kPause) {
        return positionEventFromJson(data, DiscreteEventType::Pause, events::kPause);
    }
    if (event == events::kSeek) {
        // Some relays wrap the seek target as {"time": t}
        const json& target = (data.is_object() && data.contains("time")) ? data["time"] : data;
        return positionEventFromJson(target, DiscreteEventType::Seek, events::kSeek);
    }
    if (event == events::kSource) {
        if (!data.is_object()) {
            return Err<SyncMessage>(ErrorCode::InvalidData, "sync:source payload must be an object");
        }
        auto ref = optionalStringFromJson(data, "contentRef");
        if (!ref) {
            return Err<SyncMessage>(ref.error());
        }
        return SyncMessage(DiscreteEvent::sourceChanged(ref.value()));
    }
    if (event == events::kBuffer) {
        if (!data.is_boolean()) {
            return Err<SyncMessage>(ErrorCode::InvalidData, "sync:buffer payload must be a boolean");
        }
        return SyncMessage(DiscreteEvent::bufferingChanged(data.get<bool>()));
    }
    if (event == events::kRequest) {
        return SyncMessage(ResyncRequest{});
    }
    if (event == events::kHostChanged) {
        if (!data.is_string()) {
            return Err<SyncMessage>(ErrorCode::InvalidData, "room:host-changed payload must be a string");
        }
        return SyncMessage(HostChanged{data.get<std::string>()});
    }

    return Err<SyncMessage>(ErrorCode::InvalidData, "Unknown event: " + event);
}

std::string WireCodec::encode(const SyncMessage& message) {
    // Content refs are opaque bytes; invalid UTF-8 is replaced with U+FFFD
    return toJson(message).dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<SyncMessage> WireCodec::decode(std::string_view text) {
    json envelope = json::parse(text, nullptr, false);
    if (envelope.is_discarded()) {
        return Err<SyncMessage>(ErrorCode::InvalidData, "Malformed JSON");
    }
    try {
        return fromJson(envelope);
    } catch (const json::exception& e) {
        return Err<SyncMessage>(ErrorCode::InvalidData, e.what());
    }
}

} // namespace tandem::sync::io
