// MILESCROW - Weighted-Vote Milestone Escrow Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/escrow.h>
#include <milescrow/util/logging.h>

namespace milescrow {
namespace escrow {

// ============================================================================
// Construction
// ============================================================================

MilestoneEscrow::MilestoneEscrow(const EscrowConfig& config,
                                 std::shared_ptr<AuthorizationOracle> oracle,
                                 std::shared_ptr<PoolLedger> ledger,
                                 std::shared_ptr<ProfileDirectory> profiles)
    : config_(config)
    , oracle_(std::move(oracle))
    , ledger_(std::move(ledger))
    , profiles_(std::move(profiles)) {}

MilestoneEscrow::~MilestoneEscrow() = default;

void MilestoneEscrow::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

// ============================================================================
// Transactions
// ============================================================================

Status MilestoneEscrow::Execute(const char* name, const Operation& operation) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    State snapshot = state_;
    const size_t eventMark = pendingEvents_.size();
    ++depth_;

    Effects effects;
    Status s = operation(effects);
    if (s.ok()) {
        s = CheckTransferCoverage(effects);
    }
    if (s.ok()) {
        s = ApplyCapabilityChanges(effects);
    }
    if (!s.ok()) {
        state_ = std::move(snapshot);
        pendingEvents_.resize(eventMark);
        --depth_;
        LOG_WARN(util::LogCategory::ESCROW) << name << " refused: " << s.ToString();
        return s;
    }

    // Internal state is committed; transfers may re-enter from here on.
    size_t issued = 0;
    for (const auto& transfer : effects.transfers) {
        if (!ledger_->Transfer(state_.asset, transfer.to, transfer.amount)) {
            break;
        }
        ++issued;
    }

    if (issued < effects.transfers.size()) {
        const auto& failed = effects.transfers[issued];
        if (issued == 0) {
            state_ = std::move(snapshot);
            pendingEvents_.resize(eventMark);
            --depth_;
            s = Status::Ledger("transfer of " + std::to_string(failed.amount) + " to " +
                               ShortAddress(failed.to) + " failed");
            LOG_WARN(util::LogCategory::LEDGER) << name << " refused: " << s.ToString();
            return s;
        }
        // Earlier transfers already moved value, so the commit stands and
        // the rest of the batch is owed.
        Amount deferred = 0;
        for (size_t i = issued; i < effects.transfers.size(); ++i) {
            state_.owed[effects.transfers[i].to] += effects.transfers[i].amount;
            deferred += effects.transfers[i].amount;
        }
        s = Status::Ledger("transfer " + std::to_string(issued + 1) + " of " +
                           std::to_string(effects.transfers.size()) + " to " +
                           ShortAddress(failed.to) + " failed after partial payout; " +
                           std::to_string(deferred) + " owed");
        LOG_ERROR(util::LogCategory::LEDGER) << name << ": " << s.ToString();
    }

    --depth_;
    if (depth_ == 0) {
        DeliverEvents();
    }
    return s;
}

Status MilestoneEscrow::CheckTransferCoverage(const Effects& effects) const {
    if (effects.transfers.empty()) {
        return Status::Ok();
    }

    Amount total = 0;
    for (const auto& transfer : effects.transfers) {
        total += transfer.amount;
    }

    auto info = ledger_->GetPoolInfo(config_.poolId);
    if (!info) {
        return Status::Ledger("pool " + std::to_string(config_.poolId) + " not found");
    }
    // Custody reserved for owed transfers is not available to this batch
    const Amount available = info->balance - TotalOwed();
    if (available < total) {
        return Status::Capacity("ledger balance " + std::to_string(available) +
                                " cannot cover payout of " + std::to_string(total));
    }
    return Status::Ok();
}

Status MilestoneEscrow::ApplyCapabilityChanges(const Effects& effects) {
    for (const auto& [capability, identity] : effects.grants) {
        if (!oracle_->GrantCapability(capability, identity)) {
            return Status::Ledger("oracle refused capability " + std::to_string(capability) +
                                  " for " + ShortAddress(identity));
        }
    }
    for (const auto& [capability, identity] : effects.revocations) {
        if (!oracle_->SetCapabilityStatus(capability, identity, false)) {
            return Status::Ledger("oracle could not revoke capability " +
                                  std::to_string(capability) + " from " +
                                  ShortAddress(identity));
        }
    }
    return Status::Ok();
}

void MilestoneEscrow::Emit(EscrowEvent event) {
    pendingEvents_.push_back(std::move(event));
}

void MilestoneEscrow::DeliverEvents() {
    std::vector<EscrowEvent> events;
    events.swap(pendingEvents_);

    for (const auto& event : events) {
        LOG_INFO(util::LogCategory::ESCROW) << event.ToString();
        if (eventCallback_) {
            eventCallback_(event);
        }
    }
}

// ============================================================================
// Shared Checks
// ============================================================================

Status MilestoneEscrow::RequireActive() const {
    if (state_.strategy != StrategyState::Active) {
        return Status::State(std::string("strategy is ") +
                             StrategyStateToString(state_.strategy));
    }
    return Status::Ok();
}

Status MilestoneEscrow::CheckParticipant(const Address& caller) const {
    if (!oracle_->HasCapability(caller, config_.participantCapability) ||
        !state_.registry.IsParticipant(caller)) {
        return Status::Authorization(ShortAddress(caller) + " is not a participant");
    }
    return Status::Ok();
}

Status MilestoneEscrow::CheckRecipientOrParticipant(const Address& caller,
                                                    const RecipientEntry& entry) const {
    const Recipient& r = entry.record;
    if (caller == r.recipientAddress &&
        oracle_->HasCapability(caller, config_.executorCapability)) {
        return Status::Ok();
    }
    if (r.useRegistryAnchor && profiles_) {
        auto profile = profiles_->GetProfileByAnchor(r.recipientId);
        if (profile && profiles_->IsOwnerOrMember(profile->id, caller)) {
            return Status::Ok();
        }
    }
    if (CheckParticipant(caller).ok()) {
        return Status::Ok();
    }
    return Status::Authorization(ShortAddress(caller) +
                                 " may not act for recipient " + ShortAddress(r.recipientId));
}

Status MilestoneEscrow::CastWeightedVote(VoteTally& tally, const Address& voter, bool support,
                                         const char* subject) {
    const uint64_t weight = state_.registry.GetWeight(voter);
    Status s = tally.CastVote(voter, support, weight);
    if (!s.ok()) {
        return s;
    }
    LOG_DEBUG(util::LogCategory::VOTE) << ShortAddress(voter) << " voted "
                                       << (support ? "for" : "against") << " " << subject
                                       << " in round " << tally.GetRound()
                                       << " with " << FormatPercentage(weight)
                                       << " (for " << FormatPercentage(tally.GetVotesFor())
                                       << ", against " << FormatPercentage(tally.GetVotesAgainst())
                                       << ")";
    return Status::Ok();
}

MilestoneEscrow::RecipientEntry* MilestoneEscrow::FindEntry(const Address& recipientId) {
    auto it = state_.recipients.find(recipientId);
    return it != state_.recipients.end() ? &it->second : nullptr;
}

const MilestoneEscrow::RecipientEntry* MilestoneEscrow::FindEntry(
    const Address& recipientId) const {
    auto it = state_.recipients.find(recipientId);
    return it != state_.recipients.end() ? &it->second : nullptr;
}

// ============================================================================
// Initialization
// ============================================================================

Status MilestoneEscrow::Initialize(const std::map<Address, Amount>& contributions) {
    return Execute("Initialize", [&](Effects&) {
        return DoInitialize(contributions);
    });
}

Status MilestoneEscrow::DoInitialize(const std::map<Address, Amount>& contributions) {
    if (state_.strategy != StrategyState::None) {
        return Status::State("escrow already initialized");
    }

    Status s = config_.Validate();
    if (!s.ok()) {
        return s;
    }
    if (!oracle_ || !ledger_) {
        return Status::Validation("authorization oracle and pool ledger are required");
    }
    if (config_.useRegistryAnchor && !profiles_) {
        return Status::Validation("registry anchors require a profile directory");
    }

    VotingPowerRegistry registry;
    s = VotingPowerRegistry::Create(contributions, registry);
    if (!s.ok()) {
        return s;
    }

    auto pool = ledger_->GetPoolInfo(config_.poolId);
    if (!pool) {
        return Status::Ledger("pool " + std::to_string(config_.poolId) + " not found");
    }

    state_.registry = std::move(registry);
    state_.threshold = CalculateThreshold(state_.registry.GetTotalSupply(),
                                          config_.thresholdPercentage);
    state_.asset = pool->asset;
    state_.poolAmount = pool->balance;
    state_.poolActive = true;
    state_.strategy = StrategyState::Active;

    LOG_INFO(util::LogCategory::ESCROW) << "Escrow active: " << contributions.size()
                                        << " participants, pool " << config_.poolId
                                        << " holding " << state_.poolAmount;
    return Status::Ok();
}

// ============================================================================
// Recipient Lifecycle
// ============================================================================

Status MilestoneEscrow::RegisterRecipient(const Address& caller,
                                          const RecipientRegistration& registration) {
    return Execute("RegisterRecipient", [&](Effects&) {
        return DoRegisterRecipient(caller, registration);
    });
}

Status MilestoneEscrow::DoRegisterRecipient(const Address& caller,
                                            const RecipientRegistration& registration) {
    Status s = RequireActive();
    if (!s.ok()) {
        return s;
    }
    if (registration.recipientAddress.IsNull()) {
        return Status::Validation("recipient address is required");
    }
    if (registration.requestedGrant < 0) {
        return Status::Validation("requested grant is negative");
    }

    Address recipientId = caller;
    if (config_.useRegistryAnchor) {
        if (!registration.registryAnchor) {
            return Status::Validation("registry anchor is required");
        }
        auto profile = profiles_->GetProfileByAnchor(*registration.registryAnchor);
        if (!profile) {
            return Status::Validation("no profile for anchor " +
                                      ShortAddress(*registration.registryAnchor));
        }
        if (!profiles_->IsOwnerOrMember(profile->id, caller)) {
            return Status::Authorization(ShortAddress(caller) + " is not a member of profile " +
                                         ShortAddress(*registration.registryAnchor));
        }
        recipientId = *registration.registryAnchor;
    }

    RecipientEntry* entry = FindEntry(recipientId);
    const EscrowStatus current = entry ? entry->record.recipientStatus : EscrowStatus::None;
    if (!IsValidRecipientTransition(current, EscrowStatus::Pending)) {
        return Status::State("recipient " + ShortAddress(recipientId) + " is " +
                             EscrowStatusToString(current));
    }

    if (!entry) {
        entry = &state_.recipients[recipientId];
    } else {
        // Votes cast on the previous registration no longer apply
        if (entry->reviewTally.IsOpen()) {
            LOG_DEBUG(util::LogCategory::VOTE) << "Discarding review round "
                                               << entry->reviewTally.GetRound() << " of "
                                               << ShortAddress(recipientId);
        }
        entry->reviewTally.Reset();
    }

    Recipient& r = entry->record;
    r.recipientId = recipientId;
    r.recipientAddress = registration.recipientAddress;
    r.useRegistryAnchor = config_.useRegistryAnchor;
    r.requestedGrant = registration.requestedGrant;
    r.metadata = registration.metadata;
    r.recipientStatus = EscrowStatus::Pending;

    EscrowEvent event;
    event.type = EventType::RecipientStatusChanged;
    event.recipientId = recipientId;
    event.actor = caller;
    event.status = EscrowStatus::Pending;
    Emit(event);
    return Status::Ok();
}

Status MilestoneEscrow::ReviewRecipient(const Address& caller, const Address& recipientId,
                                        EscrowStatus status) {
    return Execute("ReviewRecipient", [&](Effects& effects) {
        return DoReviewRecipient(caller, recipientId, status, effects);
    });
}

Status MilestoneEscrow::DoReviewRecipient(const Address& caller, const Address& recipientId,
                                          EscrowStatus status, Effects& effects) {
    if (!IsReviewDecision(status)) {
        return Status::Validation(std::string("cannot vote ") + EscrowStatusToString(status));
    }
    Status s = RequireActive();
    if (!s.ok()) {
        return s;
    }
    s = CheckParticipant(caller);
    if (!s.ok()) {
        return s;
    }

    RecipientEntry* entry = FindEntry(recipientId);
    if (!entry) {
        return Status::State("recipient " + ShortAddress(recipientId) + " not registered");
    }
    Recipient& r = entry->record;
    if (!IsValidRecipientTransition(r.recipientStatus, status)) {
        return Status::State("recipient " + ShortAddress(recipientId) + " is " +
                             EscrowStatusToString(r.recipientStatus));
    }

    const bool accept = status == EscrowStatus::Accepted;
    if (accept) {
        if (GetAcceptedRecipientCount() >= config_.maxRecipients) {
            return Status::Capacity("maximum of " + std::to_string(config_.maxRecipients) +
                                    " recipients reached");
        }
    }

    s = CastWeightedVote(entry->reviewTally, caller, accept, "recipient");
    if (!s.ok()) {
        return s;
    }

    auto outcome = entry->reviewTally.HasCrossedThreshold(state_.threshold);
    if (!outcome) {
        return Status::Ok();
    }

    if (*outcome == EscrowStatus::Accepted) {
        const Amount unallocated = state_.poolAmount - state_.allocatedGrants;
        const Amount grant = r.requestedGrant > 0 ? r.requestedGrant : unallocated;
        if (grant <= 0 || grant > unallocated) {
            return Status::Capacity("grant of " + std::to_string(grant) +
                                    " exceeds unallocated pool " + std::to_string(unallocated));
        }

        r.recipientStatus = EscrowStatus::Accepted;
        r.grantAmount = grant;
        state_.allocatedGrants += grant;
        entry->reviewTally.Reset();
        effects.grants.emplace_back(config_.executorCapability, r.recipientAddress);
    } else {
        if (r.recipientStatus == EscrowStatus::Accepted) {
            const bool planPaid = r.milestonesReviewStatus == EscrowStatus::Accepted &&
                                  !entry->milestones.empty() &&
                                  r.nextMilestone == entry->milestones.size();
            if (!planPaid) {
                state_.allocatedGrants -= r.grantAmount - entry->paid;
            }
            effects.revocations.emplace_back(config_.executorCapability, r.recipientAddress);
        }
        state_.recipients.erase(recipientId);
    }

    EscrowEvent event;
    event.type = EventType::RecipientStatusChanged;
    event.recipientId = recipientId;
    event.actor = caller;
    event.status = *outcome;
    Emit(event);
    return Status::Ok();
}

// ============================================================================
// Owed Transfers
// ============================================================================

Status MilestoneEscrow::RetryOwedTransfers() {
    return Execute("RetryOwedTransfers", [&](Effects& effects) {
        return DoRetryOwedTransfers(effects);
    });
}

Status MilestoneEscrow::DoRetryOwedTransfers(Effects& effects) {
    if (state_.owed.empty()) {
        return Status::State("no transfers owed");
    }

    for (const auto& [account, amount] : state_.owed) {
        PendingTransfer transfer;
        transfer.to = account;
        transfer.amount = amount;
        effects.transfers.push_back(transfer);
    }
    LOG_INFO(util::LogCategory::LEDGER) << "Retrying " << state_.owed.size()
                                        << " owed transfers totalling " << TotalOwed();
    state_.owed.clear();
    return Status::Ok();
}

Amount MilestoneEscrow::TotalOwed() const {
    Amount total = 0;
    for (const auto& [account, amount] : state_.owed) {
        total += amount;
    }
    return total;
}

Amount MilestoneEscrow::GetOwedAmount(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = state_.owed.find(account);
    return it != state_.owed.end() ? it->second : 0;
}

Amount MilestoneEscrow::GetTotalOwed() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return TotalOwed();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Recipient> MilestoneEscrow::GetRecipient(const Address& recipientId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    if (!entry) {
        return std::nullopt;
    }
    return entry->record;
}

EscrowStatus MilestoneEscrow::GetRecipientStatus(const Address& recipientId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    return entry ? entry->record.recipientStatus : EscrowStatus::None;
}

std::vector<Milestone> MilestoneEscrow::GetMilestones(const Address& recipientId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    return entry ? entry->milestones : std::vector<Milestone>{};
}

std::vector<Milestone> MilestoneEscrow::GetOfferedMilestones(const Address& recipientId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    return entry ? entry->offered : std::vector<Milestone>{};
}

EscrowStatus MilestoneEscrow::GetMilestoneStatus(const Address& recipientId,
                                                 size_t index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    if (!entry || index >= entry->milestones.size()) {
        return EscrowStatus::None;
    }
    return entry->milestones[index].status;
}

StrategyState MilestoneEscrow::GetStrategyState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.strategy;
}

Amount MilestoneEscrow::GetPoolAmount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.poolAmount;
}

Amount MilestoneEscrow::GetAllocatedGrants() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.allocatedGrants;
}

bool MilestoneEscrow::IsPoolActive() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.poolActive;
}

size_t MilestoneEscrow::GetAcceptedRecipientCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, entry] : state_.recipients) {
        if (entry.record.recipientStatus == EscrowStatus::Accepted) ++count;
    }
    return count;
}

uint64_t MilestoneEscrow::GetThreshold() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.threshold;
}

uint64_t MilestoneEscrow::GetVotingPower(const Address& participant) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.registry.GetWeight(participant);
}

bool MilestoneEscrow::HasVotedOnRecipient(const Address& voter,
                                          const Address& recipientId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    return entry && entry->reviewTally.HasVoted(voter);
}

bool MilestoneEscrow::HasVotedOnOffer(const Address& voter, const Address& recipientId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    return entry && entry->offerInFlight && entry->offerTally.HasVoted(voter);
}

bool MilestoneEscrow::HasVotedOnMilestone(const Address& voter, const Address& recipientId,
                                          size_t index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RecipientEntry* entry = FindEntry(recipientId);
    if (!entry) {
        return false;
    }
    auto it = entry->milestoneTallies.find(index);
    return it != entry->milestoneTallies.end() && it->second.HasVoted(voter);
}

bool MilestoneEscrow::HasVotedOnAbort(const Address& voter) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.abortTally.HasVoted(voter);
}

} // namespace escrow
} // namespace milescrow
