/**
 * @file role_controller.cpp
 * @brief RoleController implementation
 */

#include <tandem/sync/role_controller.hpp>
#include <tandem/core/logger.hpp>

namespace tandem::sync {

RoleController::RoleController(std::string localParticipantId, SnapshotBroadcaster& broadcaster)
    : m_localId(std::move(localParticipantId))
    , m_broadcaster(broadcaster) {}

bool RoleController::setRole(Role role) {
    if (role == m_role) {
        return false;
    }

    const Role previous = m_role;
    m_role = role;

    if (role == Role::Host) {
        m_broadcaster.start();
    } else {
        m_broadcaster.stop();
    }

    LOG_INFO("[Role] {}: {} -> {}", m_localId, roleToString(previous), roleToString(role));
    roleChanged.fire(role);
    return true;
}

bool RoleController::onHostChanged(const std::string& hostId) {
    m_hostId = hostId;
    return setRole(hostId == m_localId ? Role::Host : Role::Peer);
}

} // namespace tandem::sync
