/**
 * @file role_controller.hpp
 * @brief Host/Peer role tracking
 *
 * The engine never elects a host; the room collaborator announces one and
 * this controller maps the announcement onto the local role, starting or
 * stopping the snapshot broadcaster on each real transition.
 */

#pragma once

#include <tandem/core/signals.hpp>
#include <tandem/core/types.hpp>
#include <tandem/sync/snapshot_broadcaster.hpp>

#include <optional>
#include <string>

namespace tandem::sync {

class RoleController {
public:
    RoleController(std::string localParticipantId, SnapshotBroadcaster& broadcaster);

    /**
     * @brief Switch role
     *
     * Leaving Host stops the broadcaster before returning. Setting the
     * current role is a no-op.
     * @return true if the role changed
     */
    bool setRole(Role role);

    /**
     * @brief Apply a "host changed" announcement
     * @return true if the local role changed
     */
    bool onHostChanged(const std::string& hostId);

    [[nodiscard]] Role role() const { return m_role; }
    [[nodiscard]] bool isHost() const { return m_role == Role::Host; }

    /// Most recently announced host id
    [[nodiscard]] const std::optional<std::string>& hostId() const { return m_hostId; }

    [[nodiscard]] const std::string& localParticipantId() const { return m_localId; }

    /// Fired after every real transition with the new role
    Signal<Role> roleChanged;

private:
    std::string m_localId;
    SnapshotBroadcaster& m_broadcaster;
    Role m_role = Role::Uninitialized;
    std::optional<std::string> m_hostId;
};

} // namespace tandem::sync
