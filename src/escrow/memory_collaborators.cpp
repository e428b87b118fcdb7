// MILESCROW - In-Memory Collaborators Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/memory_collaborators.h>
#include <milescrow/util/logging.h>

namespace milescrow {
namespace escrow {

// ============================================================================
// AllowListAuthorizationOracle
// ============================================================================

bool AllowListAuthorizationOracle::HasCapability(const Address& identity,
                                                 CapabilityId capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto capIt = capabilities_.find(capability);
    if (capIt == capabilities_.end()) {
        return false;
    }
    auto it = capIt->second.find(identity);
    return it != capIt->second.end() && it->second;
}

bool AllowListAuthorizationOracle::GrantCapability(CapabilityId capability,
                                                   const Address& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refuseGrants_) {
        return false;
    }
    capabilities_[capability][identity] = true;
    LOG_DEBUG(util::LogCategory::AUTH) << "Granted capability " << capability
                                       << " to " << ShortAddress(identity);
    return true;
}

bool AllowListAuthorizationOracle::SetCapabilityStatus(CapabilityId capability,
                                                       const Address& identity,
                                                       bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto capIt = capabilities_.find(capability);
    if (capIt == capabilities_.end()) {
        return false;
    }
    auto it = capIt->second.find(identity);
    if (it == capIt->second.end()) {
        return false;
    }
    it->second = active;
    return true;
}

size_t AllowListAuthorizationOracle::CountHolders(CapabilityId capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto capIt = capabilities_.find(capability);
    if (capIt == capabilities_.end()) {
        return 0;
    }
    size_t count = 0;
    for (const auto& [identity, active] : capIt->second) {
        if (active) ++count;
    }
    return count;
}

// ============================================================================
// MemoryPoolLedger
// ============================================================================

void MemoryPoolLedger::CreatePool(PoolId pool, AssetId asset, Amount balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    pools_[pool] = asset;
    custody_[asset] += balance;
}

std::optional<PoolInfo> MemoryPoolLedger::GetPoolInfo(PoolId pool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(pool);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    PoolInfo info;
    info.asset = it->second;
    auto custodyIt = custody_.find(it->second);
    info.balance = custodyIt != custody_.end() ? custodyIt->second : 0;
    return info;
}

bool MemoryPoolLedger::Transfer(AssetId asset, const Address& to, Amount amount) {
    TransferRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failTransfers_ || amount < 0) {
            return false;
        }
        Amount& held = custody_[asset];
        if (held < amount) {
            LOG_WARN(util::LogCategory::LEDGER) << "Transfer of " << amount
                                                << " exceeds custody " << held;
            return false;
        }
        held -= amount;
        balances_[{asset, to}] += amount;

        record.asset = asset;
        record.to = to;
        record.amount = amount;
        transfers_.push_back(record);
    }

    if (hook_) {
        hook_(record);
    }
    return true;
}

Amount MemoryPoolLedger::GetBalance(AssetId asset, const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find({asset, account});
    return it != balances_.end() ? it->second : 0;
}

Amount MemoryPoolLedger::GetCustody(AssetId asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = custody_.find(asset);
    return it != custody_.end() ? it->second : 0;
}

std::vector<TransferRecord> MemoryPoolLedger::GetTransfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_;
}

// ============================================================================
// MemoryProfileDirectory
// ============================================================================

void MemoryProfileDirectory::AddProfile(const Address& anchor, const Profile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    profilesByAnchor_[anchor] = profile;
    owners_[profile.id] = profile.owner;
}

void MemoryProfileDirectory::AddMember(const Hash256& profileId, const Address& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_[profileId].insert(member);
}

std::optional<Profile> MemoryProfileDirectory::GetProfileByAnchor(const Address& anchor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profilesByAnchor_.find(anchor);
    if (it == profilesByAnchor_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryProfileDirectory::IsOwnerOrMember(const Hash256& profileId,
                                             const Address& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ownerIt = owners_.find(profileId);
    if (ownerIt != owners_.end() && ownerIt->second == identity) {
        return true;
    }
    auto memberIt = members_.find(profileId);
    return memberIt != members_.end() && memberIt->second.count(identity) > 0;
}

} // namespace escrow
} // namespace milescrow
