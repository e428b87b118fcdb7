// MILESCROW - External Collaborator Interfaces
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// The escrow depends on three services it does not own: capability
// checks, value transfer, and profile lookup. Hosts inject
// implementations of these interfaces.

#ifndef MILESCROW_ESCROW_COLLABORATORS_H
#define MILESCROW_ESCROW_COLLABORATORS_H

#include <milescrow/core/types.h>

#include <optional>

namespace milescrow {
namespace escrow {

// ============================================================================
// Authorization Oracle
// ============================================================================

/**
 * Answers "does identity X hold capability Y" and issues capabilities.
 */
class AuthorizationOracle {
public:
    virtual ~AuthorizationOracle() = default;

    /// Check whether an identity currently holds an active capability
    virtual bool HasCapability(const Address& identity, CapabilityId capability) const = 0;

    /// Issue a capability; returns false if the oracle refused
    virtual bool GrantCapability(CapabilityId capability, const Address& identity) = 0;

    /// Activate or deactivate a previously issued capability
    virtual bool SetCapabilityStatus(CapabilityId capability, const Address& identity,
                                     bool active) = 0;
};

// ============================================================================
// Pool Ledger
// ============================================================================

/// Ledger view of a funding pool
struct PoolInfo {
    AssetId asset{0};
    Amount balance{0};
};

/**
 * Moves pooled value on behalf of the escrow.
 *
 * Transfer may call back into the escrow (for example through a token
 * hook); the escrow commits its own state before issuing transfers.
 */
class PoolLedger {
public:
    virtual ~PoolLedger() = default;

    virtual std::optional<PoolInfo> GetPoolInfo(PoolId pool) const = 0;

    /// Pay out of the pool's custody; false if the balance is insufficient
    virtual bool Transfer(AssetId asset, const Address& to, Amount amount) = 0;
};

// ============================================================================
// Profile Directory
// ============================================================================

/// Identity profile registered in the directory
struct Profile {
    Hash256 id;
    Address owner;
};

/**
 * Resolves registry anchors to profiles, used to authorize acting on
 * behalf of a recipient identity.
 */
class ProfileDirectory {
public:
    virtual ~ProfileDirectory() = default;

    virtual std::optional<Profile> GetProfileByAnchor(const Address& anchor) const = 0;

    virtual bool IsOwnerOrMember(const Hash256& profileId, const Address& identity) const = 0;
};

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_COLLABORATORS_H
