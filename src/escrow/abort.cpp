// MILESCROW - Project Abort Vote
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/escrow.h>
#include <milescrow/util/logging.h>

namespace milescrow {
namespace escrow {

Status MilestoneEscrow::RejectProject(const Address& caller, EscrowStatus status) {
    return Execute("RejectProject", [&](Effects& effects) {
        return DoRejectProject(caller, status, effects);
    });
}

Status MilestoneEscrow::DoRejectProject(const Address& caller, EscrowStatus status,
                                        Effects& effects) {
    Status s = RequireActive();
    if (!s.ok()) {
        return s;
    }
    s = CheckParticipant(caller);
    if (!s.ok()) {
        return s;
    }
    if (!IsReviewDecision(status)) {
        return Status::Validation(std::string("cannot vote ") + EscrowStatusToString(status));
    }

    s = CastWeightedVote(state_.abortTally, caller, status == EscrowStatus::Accepted,
                         "project abort");
    if (!s.ok()) {
        return s;
    }

    auto outcome = state_.abortTally.HasCrossedThreshold(state_.threshold);
    if (!outcome) {
        return Status::Ok();
    }

    EscrowEvent event;
    event.actor = caller;
    event.status = *outcome;

    if (*outcome == EscrowStatus::Rejected) {
        state_.abortTally.Reset();
        event.type = EventType::ProjectRejectDeclined;
        Emit(event);
        return Status::Ok();
    }

    // Refund the remaining pool by weight; the largest participant takes the dust
    const Amount pool = state_.poolAmount;
    const uint64_t totalSupply = state_.registry.GetTotalSupply();
    std::map<Address, Amount> refunds;
    Amount refunded = 0;
    for (const auto& [participant, weight] : state_.registry.GetWeights()) {
        const Amount share = static_cast<Amount>(
            MulDiv(static_cast<uint64_t>(pool), weight, totalSupply));
        refunds[participant] = share;
        refunded += share;
    }
    refunds[state_.registry.GetLargestParticipant()] += pool - refunded;

    for (const auto& [participant, amount] : refunds) {
        if (amount > 0) {
            PendingTransfer transfer;
            transfer.to = participant;
            transfer.amount = amount;
            effects.transfers.push_back(transfer);
        }
    }

    state_.poolAmount = 0;
    state_.allocatedGrants = 0;
    for (auto& [id, entry] : state_.recipients) {
        entry.reserved = 0;
    }
    state_.poolActive = false;
    state_.strategy = StrategyState::Rejected;
    state_.abortTally.Reset();

    LOG_DEBUG(util::LogCategory::ESCROW) << "Refunding " << pool << " to "
                                         << refunds.size() << " participants";

    event.type = EventType::ProjectRejected;
    event.amount = pool;
    Emit(event);
    return Status::Ok();
}

} // namespace escrow
} // namespace milescrow
