/**
 * @file transport.hpp
 * @brief Outbound sink toward the session relay
 *
 * The engine only ever pushes messages into a Transport; inbound traffic
 * is delivered by calling the engine's on*() handlers. Sends are
 * fire-and-forget: no acknowledgement, no retry, no ordering across
 * message kinds.
 */

#pragma once

#include <tandem/sync/messages.hpp>

namespace tandem::sync {

class Transport {
public:
    virtual ~Transport() = default;

    virtual void send(const SyncMessage& message) = 0;
};

} // namespace tandem::sync
