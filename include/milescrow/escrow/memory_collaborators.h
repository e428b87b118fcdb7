// MILESCROW - In-Memory Collaborators
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Self-contained implementations of the collaborator interfaces, for
// embedding the escrow without a host chain and for tests.

#ifndef MILESCROW_ESCROW_MEMORY_COLLABORATORS_H
#define MILESCROW_ESCROW_MEMORY_COLLABORATORS_H

#include <milescrow/escrow/collaborators.h>

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace milescrow {
namespace escrow {

// ============================================================================
// Allow-List Authorization Oracle
// ============================================================================

/**
 * Capability table keyed by (capability, identity) with an active flag.
 */
class AllowListAuthorizationOracle : public AuthorizationOracle {
public:
    AllowListAuthorizationOracle() = default;

    bool HasCapability(const Address& identity, CapabilityId capability) const override;
    bool GrantCapability(CapabilityId capability, const Address& identity) override;
    bool SetCapabilityStatus(CapabilityId capability, const Address& identity,
                             bool active) override;

    /// Reject every subsequent grant (simulates a refusing oracle)
    void SetRefuseGrants(bool refuse) { refuseGrants_ = refuse; }

    /// Number of identities holding an active capability
    size_t CountHolders(CapabilityId capability) const;

private:
    mutable std::mutex mutex_;
    std::map<CapabilityId, std::map<Address, bool>> capabilities_;
    bool refuseGrants_{false};
};

// ============================================================================
// Memory Pool Ledger
// ============================================================================

/// A completed ledger transfer
struct TransferRecord {
    AssetId asset{0};
    Address to;
    Amount amount{0};
};

/**
 * Pool custody and account balances held in memory.
 */
class MemoryPoolLedger : public PoolLedger {
public:
    /// Called after every successful transfer, outside the ledger lock
    using TransferHook = std::function<void(const TransferRecord&)>;

    MemoryPoolLedger() = default;

    /// Register a pool and deposit its initial custody
    void CreatePool(PoolId pool, AssetId asset, Amount balance);

    std::optional<PoolInfo> GetPoolInfo(PoolId pool) const override;
    bool Transfer(AssetId asset, const Address& to, Amount amount) override;

    /// Balance credited to an account
    Amount GetBalance(AssetId asset, const Address& account) const;

    /// Value still held in custody for an asset
    Amount GetCustody(AssetId asset) const;

    /// Transfers in the order they were made
    std::vector<TransferRecord> GetTransfers() const;

    void SetTransferHook(TransferHook hook) { hook_ = std::move(hook); }

    /// Make every subsequent transfer fail
    void SetFailTransfers(bool fail) { failTransfers_ = fail; }

private:
    mutable std::mutex mutex_;
    std::map<PoolId, AssetId> pools_;
    std::map<AssetId, Amount> custody_;
    std::map<std::pair<AssetId, Address>, Amount> balances_;
    std::vector<TransferRecord> transfers_;
    TransferHook hook_;
    bool failTransfers_{false};
};

// ============================================================================
// Memory Profile Directory
// ============================================================================

class MemoryProfileDirectory : public ProfileDirectory {
public:
    MemoryProfileDirectory() = default;

    /// Register a profile under an anchor address
    void AddProfile(const Address& anchor, const Profile& profile);

    /// Add a member allowed to act for a profile
    void AddMember(const Hash256& profileId, const Address& member);

    std::optional<Profile> GetProfileByAnchor(const Address& anchor) const override;
    bool IsOwnerOrMember(const Hash256& profileId, const Address& identity) const override;

private:
    mutable std::mutex mutex_;
    std::map<Address, Profile> profilesByAnchor_;
    std::map<Hash256, Address> owners_;
    std::map<Hash256, std::set<Address>> members_;
};

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_MEMORY_COLLABORATORS_H
