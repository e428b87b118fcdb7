// MILESCROW - Weighted Threshold Vote Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include <milescrow/escrow/vote_tally.h>

namespace milescrow {
namespace escrow {

uint64_t CalculateThreshold(uint64_t totalSupply, uint32_t percentage) {
    return MulDiv(totalSupply, percentage, 100);
}

Status VoteTally::CastVote(const Address& voter, bool support, uint64_t weight) {
    auto it = lastVotedRound_.find(voter);
    if (it != lastVotedRound_.end() && it->second == round_) {
        return Status::DuplicateVote(ShortAddress(voter) + " already voted in round " +
                                     std::to_string(round_));
    }

    uint64_t& side = support ? votesFor_ : votesAgainst_;
    if (weight > UINT64_MAX - side) {
        return Status::Validation("vote weight overflows tally");
    }
    side += weight;

    lastVotedRound_[voter] = round_;
    ++votersThisRound_;
    return Status::Ok();
}

std::optional<EscrowStatus> VoteTally::HasCrossedThreshold(uint64_t threshold) const {
    if (votesFor_ > threshold) {
        return EscrowStatus::Accepted;
    }
    if (votesAgainst_ > threshold) {
        return EscrowStatus::Rejected;
    }
    return std::nullopt;
}

void VoteTally::Reset() {
    ++round_;
    votesFor_ = 0;
    votesAgainst_ = 0;
    votersThisRound_ = 0;
}

bool VoteTally::HasVoted(const Address& voter) const {
    auto it = lastVotedRound_.find(voter);
    return it != lastVotedRound_.end() && it->second == round_;
}

} // namespace escrow
} // namespace milescrow
