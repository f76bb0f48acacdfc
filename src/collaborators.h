#pragma once

/**
 * @file collaborators.h
 * @brief Interfaces of the components the transfer core borrows.
 *
 * The shares index, the network transport and the user list live outside
 * the core. Managers hold references to these interfaces; the owner
 * guarantees they outlive the managers.
 */

#include "messages.h"
#include <string>
#include <optional>

namespace peerq {

enum class PermissionLevel {
    BANNED,
    PUBLIC,
    BUDDY,
    TRUSTED
};

struct PermissionResult {
    PermissionLevel level = PermissionLevel::PUBLIC;
    std::string reason;         // Ban reason, may be empty
};

class SharesIndex {
public:
    virtual ~SharesIndex() = default;

    virtual std::string virtual_to_real_path(const std::string& virtual_path) const = 0;
    virtual bool file_is_shared(const std::string& username, const std::string& virtual_path,
                                const std::string& real_path) const = 0;
    virtual PermissionResult check_user_permission(const std::string& username,
                                                   const std::string& ip_address) const = 0;

    // A rescan is in progress; queue requests are deferred until it ends
    virtual bool rescanning() const = 0;
    // The first scan has completed
    virtual bool initialized() const = 0;
};

/**
 * Fire-and-forget send primitives. Failures come back later as events
 * (peer-connection-error, file errors).
 */
class TransferNetwork {
public:
    virtual ~TransferNetwork() = default;

    virtual void send_to_peer(const std::string& username, const PeerMessage& message) = 0;
    virtual void send_to_network_worker(const NetworkCommand& command) = 0;
    virtual void send_to_server(const ServerMessage& message) = 0;
};

struct BuddyInfo {
    bool is_prioritized = false;
    bool is_trusted = false;
};

class UserDirectory {
public:
    virtual ~UserDirectory() = default;

    virtual std::string login_username() const = 0;
    virtual UserStatus our_status() const = 0;
    // nullopt when the server never told us about the user
    virtual std::optional<UserStatus> user_status(const std::string& username) const = 0;
    virtual std::optional<BuddyInfo> find_buddy(const std::string& username) const = 0;
    virtual std::string user_address(const std::string& username) const = 0;
    virtual void ban_user(const std::string& username) = 0;
};

} // namespace peerq
