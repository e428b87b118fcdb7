// MILESCROW - Weighted Threshold Vote
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Reusable for/against tally used by every escrow voting workflow.

#ifndef MILESCROW_ESCROW_VOTE_TALLY_H
#define MILESCROW_ESCROW_VOTE_TALLY_H

#include <milescrow/core/types.h>
#include <milescrow/escrow/status.h>
#include <milescrow/escrow/types.h>

#include <map>
#include <optional>

namespace milescrow {
namespace escrow {

/// Threshold weight for a percentage of the total supply
uint64_t CalculateThreshold(uint64_t totalSupply, uint32_t percentage);

/**
 * One in-flight weighted vote.
 *
 * Each voter record stores the round it was cast in, so Reset() opens a
 * fresh round by bumping the counter instead of clearing every record.
 */
class VoteTally {
public:
    VoteTally() = default;

    /**
     * Record a vote for the current round.
     *
     * @return DuplicateVote if the voter already voted in this round
     */
    Status CastVote(const Address& voter, bool support, uint64_t weight);

    /**
     * Check whether either side strictly exceeds the threshold.
     *
     * @return Accepted, Rejected, or nullopt while the round is undecided
     */
    std::optional<EscrowStatus> HasCrossedThreshold(uint64_t threshold) const;

    /// Start a new round
    void Reset();

    bool HasVoted(const Address& voter) const;

    uint64_t GetVotesFor() const { return votesFor_; }
    uint64_t GetVotesAgainst() const { return votesAgainst_; }
    uint64_t GetRound() const { return round_; }

    /// True once any vote has been cast in the current round
    bool IsOpen() const { return votersThisRound_ > 0; }

private:
    uint64_t round_{1};
    uint64_t votesFor_{0};
    uint64_t votesAgainst_{0};
    size_t votersThisRound_{0};
    std::map<Address, uint64_t> lastVotedRound_;
};

} // namespace escrow
} // namespace milescrow

#endif // MILESCROW_ESCROW_VOTE_TALLY_H
