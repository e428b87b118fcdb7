// MILESCROW - Milestone Plan and Submission Workflows
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/escrow.h>
#include <milescrow/util/logging.h>

namespace milescrow {
namespace escrow {

namespace {

EscrowEvent MakeEvent(EventType type, const Address& recipientId, const Address& actor) {
    EscrowEvent event;
    event.type = type;
    event.recipientId = recipientId;
    event.actor = actor;
    return event;
}

} // namespace

// ============================================================================
// Milestone Offers
// ============================================================================

Status MilestoneEscrow::OfferMilestones(const Address& caller, const Address& recipientId,
                                        const std::vector<Milestone>& milestones) {
    return Execute("OfferMilestones", [&](Effects&) {
        return DoOfferMilestones(caller, recipientId, milestones);
    });
}

Status MilestoneEscrow::DoOfferMilestones(const Address& caller, const Address& recipientId,
                                          const std::vector<Milestone>& milestones) {
    Status s = RequireActive();
    if (!s.ok()) {
        return s;
    }

    RecipientEntry* entry = FindEntry(recipientId);
    if (!entry || entry->record.recipientStatus != EscrowStatus::Accepted) {
        return Status::State("recipient " + ShortAddress(recipientId) + " not accepted");
    }
    if (!IsValidPlanReviewTransition(entry->record.milestonesReviewStatus,
                                     EscrowStatus::Pending)) {
        return Status::State("milestone plan already accepted");
    }
    s = CheckRecipientOrParticipant(caller, *entry);
    if (!s.ok()) {
        return s;
    }
    if (milestones.empty()) {
        return Status::Validation("milestone plan is empty");
    }

    if (entry->offerInFlight) {
        Emit(MakeEvent(EventType::MilestonesReset, recipientId, caller));
    }
    entry->offerTally.Reset();

    entry->offered.clear();
    for (const auto& m : milestones) {
        Milestone candidate;
        candidate.amountPercentage = m.amountPercentage;
        candidate.metadata = m.metadata;
        entry->offered.push_back(candidate);
    }
    entry->offerInFlight = true;
    entry->record.milestonesReviewStatus = EscrowStatus::Pending;

    EscrowEvent offered = MakeEvent(EventType::MilestonesOffered, recipientId, caller);
    offered.count = entry->offered.size();
    offered.planHash = CalculatePlanHash(entry->offered);
    offered.status = EscrowStatus::Pending;
    Emit(offered);

    // The proposer's own weight counts as an accept vote
    if (CheckParticipant(caller).ok()) {
        s = CastWeightedVote(entry->offerTally, caller, true, "milestone plan");
        if (!s.ok()) {
            return s;
        }
        return ResolveOfferVote(*entry);
    }
    return Status::Ok();
}

Status MilestoneEscrow::ReviewOfferedMilestones(const Address& caller,
                                                const Address& recipientId,
                                                EscrowStatus status) {
    return Execute("ReviewOfferedMilestones", [&](Effects&) {
        return DoReviewOfferedMilestones(caller, recipientId, status);
    });
}

Status MilestoneEscrow::DoReviewOfferedMilestones(const Address& caller,
                                                  const Address& recipientId,
                                                  EscrowStatus status) {
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
    if (!entry || entry->record.recipientStatus != EscrowStatus::Accepted) {
        return Status::State("recipient " + ShortAddress(recipientId) + " not accepted");
    }
    if (!entry->offerInFlight) {
        return Status::State("no milestone plan under review");
    }

    s = CastWeightedVote(entry->offerTally, caller, status == EscrowStatus::Accepted,
                         "milestone plan");
    if (!s.ok()) {
        return s;
    }
    return ResolveOfferVote(*entry);
}

Status MilestoneEscrow::ResolveOfferVote(RecipientEntry& entry) {
    auto outcome = entry.offerTally.HasCrossedThreshold(state_.threshold);
    if (!outcome) {
        return Status::Ok();
    }

    const Address& recipientId = entry.record.recipientId;
    if (*outcome == EscrowStatus::Accepted) {
        auto total = SumPercentages(entry.offered);
        if (!total || *total != PRECISION) {
            return Status::Validation("milestone percentages sum to " +
                                      (total ? FormatPercentage(*total) : std::string("overflow")) +
                                      ", expected 100%");
        }

        entry.milestones = std::move(entry.offered);
        entry.milestoneTallies.clear();
        entry.record.milestonesReviewStatus = EscrowStatus::Accepted;
        entry.record.nextMilestone = 0;
    }
    entry.offered.clear();
    entry.offerInFlight = false;
    entry.offerTally.Reset();

    EscrowEvent reviewed = MakeEvent(EventType::MilestonesReviewed, recipientId, Address());
    reviewed.status = *outcome;
    reviewed.count = entry.milestones.size();
    Emit(reviewed);
    return Status::Ok();
}

// ============================================================================
// Milestone Submission
// ============================================================================

Status MilestoneEscrow::SubmitMilestone(const Address& caller, const Address& recipientId,
                                        size_t index, const Metadata& evidence) {
    return Execute("SubmitMilestone", [&](Effects& effects) {
        return DoSubmitMilestone(caller, recipientId, index, evidence, effects);
    });
}

Status MilestoneEscrow::DoSubmitMilestone(const Address& caller, const Address& recipientId,
                                          size_t index, const Metadata& evidence,
                                          Effects& effects) {
    Status s = RequireActive();
    if (!s.ok()) {
        return s;
    }

    RecipientEntry* entry = FindEntry(recipientId);
    if (!entry || entry->record.recipientStatus != EscrowStatus::Accepted) {
        return Status::State("recipient " + ShortAddress(recipientId) + " not accepted");
    }
    if (entry->record.milestonesReviewStatus != EscrowStatus::Accepted) {
        return Status::State("milestone plan not accepted");
    }
    if (index >= entry->milestones.size()) {
        return Status::Validation("milestone index " + std::to_string(index) +
                                  " out of range");
    }
    Milestone& milestone = entry->milestones[index];
    if (!IsValidMilestoneTransition(milestone.status, EscrowStatus::Pending)) {
        return Status::State("milestone " + std::to_string(index) + " is " +
                             EscrowStatusToString(milestone.status));
    }
    s = CheckRecipientOrParticipant(caller, *entry);
    if (!s.ok()) {
        return s;
    }

    VoteTally& tally = entry->milestoneTallies[index];
    tally.Reset();
    milestone.metadata = evidence;
    milestone.status = EscrowStatus::Pending;

    EscrowEvent submitted = MakeEvent(EventType::MilestoneSubmitted, recipientId, caller);
    submitted.milestoneIndex = index;
    submitted.metadata = evidence;
    submitted.status = EscrowStatus::Pending;
    Emit(submitted);

    EscrowEvent changed = MakeEvent(EventType::MilestoneStatusChanged, recipientId, caller);
    changed.milestoneIndex = index;
    changed.status = EscrowStatus::Pending;
    Emit(changed);

    // A participant submitter also votes to accept
    if (CheckParticipant(caller).ok()) {
        s = CastWeightedVote(tally, caller, true, "milestone");
        if (!s.ok()) {
            return s;
        }
        EscrowEvent reviewed = MakeEvent(EventType::SubmittedMilestoneReviewed, recipientId, caller);
        reviewed.milestoneIndex = index;
        reviewed.status = EscrowStatus::Accepted;
        Emit(reviewed);
        return ResolveMilestoneVote(*entry, index, effects);
    }
    return Status::Ok();
}

Status MilestoneEscrow::ReviewSubmittedMilestone(const Address& caller,
                                                 const Address& recipientId,
                                                 size_t index, EscrowStatus status) {
    return Execute("ReviewSubmittedMilestone", [&](Effects& effects) {
        return DoReviewSubmittedMilestone(caller, recipientId, index, status, effects);
    });
}

Status MilestoneEscrow::DoReviewSubmittedMilestone(const Address& caller,
                                                   const Address& recipientId,
                                                   size_t index, EscrowStatus status,
                                                   Effects& effects) {
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
    if (!entry || entry->record.recipientStatus != EscrowStatus::Accepted) {
        return Status::State("recipient " + ShortAddress(recipientId) + " not accepted");
    }
    if (index >= entry->milestones.size()) {
        return Status::Validation("milestone index " + std::to_string(index) +
                                  " out of range");
    }
    if (entry->milestones[index].status != EscrowStatus::Pending) {
        return Status::State("milestone " + std::to_string(index) + " is not pending review");
    }

    s = CastWeightedVote(entry->milestoneTallies[index], caller,
                         status == EscrowStatus::Accepted, "milestone");
    if (!s.ok()) {
        return s;
    }

    EscrowEvent reviewed = MakeEvent(EventType::SubmittedMilestoneReviewed, recipientId, caller);
    reviewed.milestoneIndex = index;
    reviewed.status = status;
    Emit(reviewed);

    return ResolveMilestoneVote(*entry, index, effects);
}

Status MilestoneEscrow::ResolveMilestoneVote(RecipientEntry& entry, size_t index,
                                             Effects& effects) {
    VoteTally& tally = entry.milestoneTallies[index];
    auto outcome = tally.HasCrossedThreshold(state_.threshold);
    if (!outcome) {
        return Status::Ok();
    }

    entry.milestones[index].status = *outcome;
    tally.Reset();

    EscrowEvent changed = MakeEvent(EventType::MilestoneStatusChanged,
                                    entry.record.recipientId, Address());
    changed.milestoneIndex = index;
    changed.status = *outcome;
    Emit(changed);

    if (*outcome == EscrowStatus::Rejected) {
        return Status::Ok();
    }

    Status s = Allocate(entry, index);
    if (!s.ok()) {
        return s;
    }
    Distribute(entry, effects);
    return Status::Ok();
}

// ============================================================================
// Payout
// ============================================================================

Amount MilestoneEscrow::TotalReserved() const {
    Amount total = 0;
    for (const auto& [id, entry] : state_.recipients) {
        total += entry.reserved;
    }
    return total;
}

Status MilestoneEscrow::Allocate(RecipientEntry& entry, size_t index) {
    const Amount payout = CalculateMilestonePayout(entry.record.grantAmount,
                                                   entry.milestones[index].amountPercentage);

    auto info = ledger_->GetPoolInfo(config_.poolId);
    if (!info) {
        return Status::Ledger("pool " + std::to_string(config_.poolId) + " not found");
    }
    const Amount available = info->balance - TotalOwed() - TotalReserved();
    if (payout > available) {
        return Status::Capacity("payout of " + std::to_string(payout) + " for milestone " +
                                std::to_string(index) + " exceeds unreserved custody " +
                                std::to_string(available < 0 ? 0 : available));
    }

    entry.reserved += payout;
    LOG_DEBUG(util::LogCategory::ESCROW) << "Reserved " << payout << " for milestone " << index
                                         << " of " << ShortAddress(entry.record.recipientId);
    return Status::Ok();
}

void MilestoneEscrow::Distribute(RecipientEntry& entry, Effects& effects) {
    Recipient& r = entry.record;
    bool advanced = false;

    while (r.nextMilestone < entry.milestones.size() &&
           entry.milestones[r.nextMilestone].status == EscrowStatus::Accepted) {
        const size_t index = r.nextMilestone;
        const Amount payout = CalculateMilestonePayout(r.grantAmount,
                                                       entry.milestones[index].amountPercentage);

        state_.poolAmount -= payout;
        state_.allocatedGrants -= payout;
        entry.reserved -= payout;
        entry.paid += payout;
        ++r.nextMilestone;
        advanced = true;

        if (payout > 0) {
            PendingTransfer transfer;
            transfer.to = r.recipientAddress;
            transfer.amount = payout;
            effects.transfers.push_back(transfer);
        }

        EscrowEvent paid = MakeEvent(EventType::MilestonePaid, r.recipientId, Address());
        paid.milestoneIndex = index;
        paid.amount = payout;
        Emit(paid);
    }

    if (advanced && r.nextMilestone == entry.milestones.size()) {
        // Rounding left over from the grant returns to the unallocated pool
        state_.allocatedGrants -= r.grantAmount - entry.paid;
    }

    if (AllPlansComplete()) {
        state_.strategy = StrategyState::Executed;
        state_.poolActive = false;
        Emit(MakeEvent(EventType::StrategyExecuted, r.recipientId, Address()));
    }
}

bool MilestoneEscrow::AllPlansComplete() const {
    size_t accepted = 0;
    for (const auto& [id, entry] : state_.recipients) {
        if (entry.record.recipientStatus != EscrowStatus::Accepted) {
            continue;
        }
        ++accepted;
        if (entry.record.milestonesReviewStatus != EscrowStatus::Accepted ||
            entry.milestones.empty() ||
            entry.record.nextMilestone < entry.milestones.size()) {
            return false;
        }
    }
    return accepted > 0;
}

} // namespace escrow
} // namespace milescrow
